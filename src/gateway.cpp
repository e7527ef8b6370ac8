#include "codepair/gateway.h"
#include <json/json.h>
#include <algorithm>
#include <iostream>
#include <sstream>
#include <thread>

namespace codepair {

namespace {

std::string string_field(const Json::Value& obj, const char* key) {
    const Json::Value& value = obj[key];
    return value.isString() ? value.asString() : "";
}

} // namespace

std::chrono::milliseconds RetryPolicy::delay(int /*attempt*/) const {
    return fixed_delay;
}

void RetryPolicy::wait_before(int attempt) const {
    auto d = delay(attempt);
    if (sleep) {
        sleep(d);
    } else {
        std::this_thread::sleep_for(d);
    }
}

RemoteGateway::RemoteGateway(std::shared_ptr<HttpTransport> transport,
                             LanguageTable languages,
                             const GatewayConfig& config,
                             RetryPolicy retry)
    : transport_(std::move(transport)),
      languages_(std::move(languages)),
      config_(config),
      retry_(std::move(retry)) {}

std::string RemoteGateway::remote_filename(const LanguageSpec& spec) {
    // Java requires the file to match the public class
    if (spec.language == Language::JAVA) {
        return "Main.java";
    }
    size_t dot = spec.source_file.rfind('.');
    std::string ext = dot == std::string::npos ? "txt" : spec.source_file.substr(dot + 1);
    return "code." + ext;
}

std::string RemoteGateway::build_request(const LanguageSpec& spec, const std::string& code,
                                         std::chrono::milliseconds run_timeout) {
    Json::Value request;
    request["language"] = spec.remote_language;
    request["version"] = spec.remote_version;

    Json::Value file;
    file["name"] = remote_filename(spec);
    file["content"] = code;
    request["files"] = Json::Value(Json::arrayValue);
    request["files"].append(file);
    request["run_timeout"] = static_cast<Json::Int64>(run_timeout.count());

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, request);
}

ExecutionResult RemoteGateway::parse_response(const std::string& body) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(body);
    if (!Json::parseFromStream(builder, stream, &root, &errors) || !root.isObject()) {
        return ExecutionResult::failure(ExecutionStatus::GATEWAY_UNAVAILABLE,
                                        "Execution service returned invalid JSON");
    }

    // Compilation failures surface as the program's own failure
    const Json::Value& compile = root["compile"];
    if (compile.isObject() && compile["code"].isInt() && compile["code"].asInt() != 0) {
        return ExecutionResult::from_exit(compile["code"].asInt(),
                                          string_field(compile, "stdout"),
                                          string_field(compile, "stderr"));
    }

    const Json::Value& run = root["run"];
    if (!run.isObject()) {
        return ExecutionResult::failure(ExecutionStatus::GATEWAY_UNAVAILABLE,
                                        "Execution service response has no run result");
    }

    std::string stdout_text = string_field(run, "stdout");
    std::string stderr_text = string_field(run, "stderr");
    std::string signal = string_field(run, "signal");

    if (!run["code"].isInt()) {
        if (signal == "SIGKILL") {
            return ExecutionResult::failure(ExecutionStatus::TIMED_OUT,
                                            "Execution timed out on the remote service");
        }
        std::string diagnostics = !stderr_text.empty() ? stderr_text :
            (!signal.empty() ? "Process killed by signal " + signal : "Execution failed");
        return ExecutionResult::from_exit(-1, stdout_text, diagnostics);
    }

    return ExecutionResult::from_exit(run["code"].asInt(), stdout_text, stderr_text);
}

ExecutionResult RemoteGateway::execute(const std::string& code, Language language) {
    auto start_time = std::chrono::steady_clock::now();
    auto finish = [start_time](ExecutionResult result) {
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return result;
    };

    const LanguageSpec* spec = languages_.find(language);
    if (!spec || spec->remote_language.empty()) {
        return ExecutionResult::failure(ExecutionStatus::REJECTED_INPUT,
                                        "Unsupported language: " + language_name(language));
    }
    if (code.empty() || code_length(code) > config_.max_code_size) {
        return ExecutionResult::failure(
            ExecutionStatus::REJECTED_INPUT,
            code.empty() ? "Code cannot be empty"
                         : "Code is too long (max " + std::to_string(config_.max_code_size) +
                           " characters)");
    }

    const std::string url = config_.url + "/execute";
    const std::string body = build_request(*spec, code, config_.run_timeout);
    const std::map<std::string, std::string> headers = {
        {"Content-Type", "application/json"}
    };

    HttpResult response;
    const int attempts = std::max(1, retry_.max_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            retry_.wait_before(attempt);
        }

        response = transport_->post(url, body, headers, config_.http_timeout);

        if (!response.transport_ok) {
            std::cerr << "[Gateway] Transport error: " << response.transport_error << std::endl;
            return finish(ExecutionResult::failure(
                ExecutionStatus::GATEWAY_UNAVAILABLE,
                "Execution service unreachable: " + response.transport_error));
        }

        if (response.status_code != 429) {
            break;
        }

        std::cout << "[Gateway] Rate limited (attempt " << attempt << "/" << attempts
                  << ")" << std::endl;
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        return finish(ExecutionResult::failure(
            ExecutionStatus::GATEWAY_UNAVAILABLE,
            "Execution service error: " + std::to_string(response.status_code) +
            " - " + response.body));
    }

    return finish(parse_response(response.body));
}

} // namespace codepair
