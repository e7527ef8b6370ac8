#pragma once

#include <string>
#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <vector>
#include <json/json.h>
#include "codepair/constants.h"
#include "codepair/coordinator.h"
#include "codepair/gateway.h"
#include "codepair/language.h"
#include "codepair/sandbox.h"

namespace codepair {

// Everything the server binary needs at startup. Defaults come from
// constants.h; a JSON file and then command-line flags override them.
struct ServerConfig {
    int port = DEFAULT_PORT;
    std::string node_id;                       // empty: random per process
    ExecutionCoordinator::Config coordinator;
    SandboxConfig sandbox;
    GatewayConfig gateway;                     // url empty: no gateway
    RetryPolicy retry;
    std::string history_path;                  // empty: history not persisted
    std::string redis_url;                     // empty: single node, no bus
    std::chrono::hours session_ttl{DEFAULT_SESSION_TTL_HOURS};
    LanguageTable languages = LanguageTable::defaults();
    std::set<Language> pinned_routes;          // route set explicitly in the file

    // Throws std::runtime_error if the file cannot be read or is invalid
    static ServerConfig load(const std::string& path);

    // Apply every recognized key of `json` on top of the current values.
    // Throws std::runtime_error on a wrong type or an out-of-range value.
    void apply(const Json::Value& json);

    void set_max_code_size(size_t size);

    // Move local languages this host cannot run to the gateway, once at
    // startup. Only when a gateway is configured, the language has a remote
    // mapping and its route was not pinned. Returns the languages moved.
    std::vector<Language> fall_back_to_gateway(const std::function<bool(Language)>& runs_locally);
};

std::optional<IsolationMode> parse_isolation(const std::string& name);
std::string isolation_name(IsolationMode mode);

} // namespace codepair
