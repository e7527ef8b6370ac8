#include "codepair/config.h"
#include "codepair/event_codec.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace codepair {

namespace {

int read_int(const Json::Value& json, const char* key, int min_value, int max_value) {
    const Json::Value& value = json[key];
    if (!value.isInt()) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be an integer");
    }
    int v = value.asInt();
    if (v < min_value || v > max_value) {
        throw std::runtime_error(std::string("Config key '") + key + "' out of range: " +
                                 std::to_string(v));
    }
    return v;
}

std::string read_string(const Json::Value& json, const char* key) {
    const Json::Value& value = json[key];
    if (!value.isString()) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be a string");
    }
    return value.asString();
}

} // namespace

std::optional<IsolationMode> parse_isolation(const std::string& name) {
    if (name == "strict") return IsolationMode::STRICT;
    if (name == "best_effort") return IsolationMode::BEST_EFFORT;
    return std::nullopt;
}

std::string isolation_name(IsolationMode mode) {
    return mode == IsolationMode::STRICT ? "strict" : "best_effort";
}

void ServerConfig::set_max_code_size(size_t size) {
    coordinator.max_code_size = size;
    sandbox.max_code_size = size;
    gateway.max_code_size = size;
}

std::vector<Language> ServerConfig::fall_back_to_gateway(
        const std::function<bool(Language)>& runs_locally) {
    std::vector<Language> moved;
    if (gateway.url.empty()) return moved;

    for (Language language : languages.languages()) {
        LanguageSpec spec = languages.at(language);
        if (spec.route != Route::LOCAL || spec.remote_language.empty() ||
            pinned_routes.count(language) || runs_locally(language)) {
            continue;
        }
        spec.route = Route::GATEWAY;
        languages.set(spec);
        moved.push_back(language);
    }
    return moved;
}

ServerConfig ServerConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    Json::Value json;
    std::string error;
    if (!parse_json(buffer.str(), json, error)) {
        throw std::runtime_error("Invalid config file " + path + ": " + error);
    }
    if (!json.isObject()) {
        throw std::runtime_error("Config file " + path + " must contain a JSON object");
    }

    ServerConfig config;
    config.apply(json);
    return config;
}

void ServerConfig::apply(const Json::Value& json) {
    if (json.isMember("port")) {
        port = read_int(json, "port", 1, 65535);
    }
    if (json.isMember("node_id")) {
        node_id = read_string(json, "node_id");
    }
    if (json.isMember("max_concurrent_executions")) {
        coordinator.slots.max_concurrent = read_int(json, "max_concurrent_executions", 1, 1024);
    }
    if (json.isMember("queue_timeout_ms")) {
        coordinator.slots.queue_timeout =
            std::chrono::milliseconds(read_int(json, "queue_timeout_ms", 0, 600000));
    }
    if (json.isMember("max_code_size")) {
        set_max_code_size(static_cast<size_t>(read_int(json, "max_code_size", 1, 10 * 1024 * 1024)));
    }
    if (json.isMember("isolation")) {
        std::string name = read_string(json, "isolation");
        auto mode = parse_isolation(name);
        if (!mode) {
            throw std::runtime_error("Unknown isolation mode: " + name);
        }
        sandbox.isolation = *mode;
    }
    if (json.isMember("sandbox_root")) {
        sandbox.root_dir = read_string(json, "sandbox_root");
    }
    if (json.isMember("history_path")) {
        history_path = read_string(json, "history_path");
    }
    if (json.isMember("redis_url")) {
        redis_url = read_string(json, "redis_url");
    }
    if (json.isMember("session_ttl_hours")) {
        session_ttl = std::chrono::hours(read_int(json, "session_ttl_hours", 1, 24 * 365));
    }

    if (json.isMember("gateway")) {
        const Json::Value& gw = json["gateway"];
        if (!gw.isObject()) {
            throw std::runtime_error("Config key 'gateway' must be an object");
        }
        if (gw.isMember("url")) {
            gateway.url = read_string(gw, "url");
        }
        if (gw.isMember("max_attempts")) {
            retry.max_attempts = read_int(gw, "max_attempts", 1, 10);
        }
        if (gw.isMember("retry_delay_ms")) {
            retry.fixed_delay = std::chrono::milliseconds(read_int(gw, "retry_delay_ms", 0, 60000));
        }
        if (gw.isMember("run_timeout_ms")) {
            gateway.run_timeout = std::chrono::milliseconds(read_int(gw, "run_timeout_ms", 1, 600000));
        }
    }

    if (json.isMember("languages")) {
        const Json::Value& langs = json["languages"];
        if (!langs.isObject()) {
            throw std::runtime_error("Config key 'languages' must be an object");
        }
        for (const auto& name : langs.getMemberNames()) {
            auto language = parse_language(name);
            if (!language) {
                throw std::runtime_error("Unsupported language in config: " + name);
            }
            const Json::Value& entry = langs[name];
            if (!entry.isObject()) {
                throw std::runtime_error("Config for language '" + name + "' must be an object");
            }

            LanguageSpec spec = languages.at(*language);
            if (entry.isMember("timeout_ms")) {
                spec.timeout_ms = read_int(entry, "timeout_ms", 1, 600000);
            }
            if (entry.isMember("route")) {
                std::string route_str = read_string(entry, "route");
                auto route = parse_route(route_str);
                if (!route) {
                    throw std::runtime_error("Unknown route for " + name + ": " + route_str);
                }
                if (*route == Route::GATEWAY && spec.remote_language.empty()) {
                    throw std::runtime_error("Language " + name + " has no remote mapping");
                }
                spec.route = *route;
                pinned_routes.insert(*language);
            }
            languages.set(spec);
        }
    }
}

} // namespace codepair
