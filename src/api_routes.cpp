#include "api_routes.h"
#include "codepair/event_codec.h"
#include <iostream>
#include <vector>

namespace codepair {

namespace {

// "/sessions/abc/execute" -> {"abc", "execute"}
std::vector<std::string> path_segments(const std::string& path, const std::string& prefix) {
    std::vector<std::string> segments;
    std::string rest = path.substr(prefix.size());
    size_t start = 0;
    while (start <= rest.size()) {
        size_t slash = rest.find('/', start);
        if (slash == std::string::npos) slash = rest.size();
        if (slash > start) {
            segments.push_back(rest.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return segments;
}

} // namespace

HttpResponse execution_response(const ExecutionResult& result) {
    int status_code = http_status_for(result.status);
    if (status_code != 200) {
        return json_error(status_code, result.error.value_or(status_name(result.status)));
    }

    Json::Value body;
    if (result.output) body["output"] = *result.output;
    if (result.error) body["error"] = *result.error;
    body["executionTimeMs"] = static_cast<Json::Int64>(result.elapsed.count());
    body["status"] = status_name(result.status);
    return json_response(200, body);
}

void register_routes(HttpServer& server, const ApiContext& ctx) {
    // POST /sessions - create a session
    server.route("POST", "/sessions", [ctx](const HttpRequest& req) {
        Language language = Language::JAVASCRIPT;
        if (!req.body.empty()) {
            Json::Value body;
            std::string error;
            if (!parse_json(req.body, body, error) || !body.isObject()) {
                return json_error(400, "Invalid JSON body");
            }
            if (body.isMember("language")) {
                if (!body["language"].isString()) {
                    return json_error(400, "language must be a string");
                }
                auto parsed = parse_language(body["language"].asString());
                if (!parsed) {
                    return json_error(400, "Unsupported language: " + body["language"].asString());
                }
                language = *parsed;
            }
        }

        Session session = ctx.sessions.create(language, ctx.session_ttl);
        std::cout << "[HTTP] Created session " << session.id << " ("
                  << language_name(language) << ")" << std::endl;

        Json::Value body;
        body["sessionId"] = session.id;
        return json_response(201, body);
    });

    // GET /sessions/{id}
    server.route("GET", "/sessions/", [ctx](const HttpRequest& req) {
        auto segments = path_segments(req.path, "/sessions/");
        if (segments.size() != 1) {
            return json_error(404, "Not found");
        }
        auto session = ctx.sessions.find(segments[0]);
        if (!session) {
            return json_error(404, "Session not found");
        }
        if (session->is_expired()) {
            return json_error(410, "Session expired");
        }
        return json_response(200, session_to_json(*session));
    });

    // POST /sessions/{id}/execute
    server.route("POST", "/sessions/", [ctx](const HttpRequest& req) {
        auto segments = path_segments(req.path, "/sessions/");
        if (segments.size() != 2 || segments[1] != "execute") {
            return json_error(404, "Not found");
        }

        Json::Value body(Json::objectValue);
        if (!req.body.empty()) {
            std::string error;
            if (!parse_json(req.body, body, error) || !body.isObject()) {
                return json_error(400, "Invalid JSON body");
            }
        }

        const Json::Value& code = body["code"];
        const Json::Value& language = body["language"];
        if ((!code.isNull() && !code.isString()) || (!language.isNull() && !language.isString())) {
            return json_error(400, "code and language must be strings");
        }

        ExecutionResult result = ctx.coordinator.submit(
            segments[0], code.isString() ? code.asString() : "",
            language.isString() ? language.asString() : "");
        return execution_response(result);
    });

    // GET /health
    server.route("GET", "/health", [ctx](const HttpRequest&) {
        Json::Value body;
        body["status"] = "ok";
        body["sessions"] = static_cast<Json::UInt64>(ctx.hub.session_count());
        body["isolation"] = ctx.isolation;
        body["node"] = ctx.hub.node_id();
        body["activeExecutions"] = ctx.coordinator.slots().active();
        return json_response(200, body);
    });
}

} // namespace codepair
