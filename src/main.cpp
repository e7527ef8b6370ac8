/*
 * codepair - live session core for collaborative coding interviews
 * Sandboxed execution, remote execution fallback and session presence
 */

#include "http_server.h"
#include "api_routes.h"
#include "session_socket.h"
#include "codepair/config.h"
#include "codepair/coordinator.h"
#include "codepair/curl_transport.h"
#include "codepair/gateway.h"
#include "codepair/presence_hub.h"
#include "codepair/sandbox.h"
#include "codepair/session_store.h"
#ifdef CODEPAIR_HAVE_REDIS
#include "codepair/redis_bus.h"
#endif
#include <iostream>
#include <memory>
#include <string>
#include <cstdlib>
#include <csignal>

using namespace codepair;

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --config <path>        JSON configuration file\n"
              << "  --port <port>          Listen port (default " << DEFAULT_PORT << ")\n"
              << "  --node-id <id>         Presence node id (default: random)\n"
              << "  --redis-url <url>      Redis URL for cross-node presence\n"
              << "  --isolation <mode>     strict | best_effort\n"
              << "  --sandbox-root <dir>   Parent directory for sandbox workspaces\n"
              << "  --history <path>       Append execution history to a JSON-lines file\n"
              << "  --gateway-url <url>    Remote execution service (empty disables it)\n"
              << "  --help                 Show this message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::string(argv[i]) == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    ServerConfig config;
    try {
        if (!config_path.empty()) {
            config = ServerConfig::load(config_path);
        }

        // Command-line flags override the file
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--port" && has_value) {
                config.port = std::atoi(argv[++i]);
            } else if (arg == "--node-id" && has_value) {
                config.node_id = argv[++i];
            } else if (arg == "--redis-url" && has_value) {
                config.redis_url = argv[++i];
            } else if (arg == "--isolation" && has_value) {
                std::string name = argv[++i];
                auto mode = parse_isolation(name);
                if (!mode) {
                    throw std::runtime_error("Unknown isolation mode: " + name);
                }
                config.sandbox.isolation = *mode;
            } else if (arg == "--sandbox-root" && has_value) {
                config.sandbox.root_dir = argv[++i];
            } else if (arg == "--history" && has_value) {
                config.history_path = argv[++i];
            } else if (arg == "--gateway-url" && has_value) {
                config.gateway.url = argv[++i];
            } else if (arg == "--config" && has_value) {
                ++i;
            } else {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }
        if (config.port <= 0 || config.port > 65535) {
            throw std::runtime_error("Invalid port: " + std::to_string(config.port));
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Broken WebSocket peers must surface as write errors
    std::signal(SIGPIPE, SIG_IGN);

    if (!block_shutdown_signals()) {
        std::cerr << "Failed to block shutdown signals" << std::endl;
        return 1;
    }

    std::cout << "codepair - live interview session core" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    bool namespaces = SandboxProvisioner::probe_isolation();
    std::cout << "Isolation mode: " << isolation_name(config.sandbox.isolation)
              << " (namespaces " << (namespaces ? "available" : "unavailable") << ")" << std::endl;
    if (!namespaces && config.sandbox.isolation == IsolationMode::STRICT) {
        std::cerr << "WARNING: this host cannot create namespaces; local executions will fail"
                  << " with provisioning_failed. Use --isolation best_effort for development."
                  << std::endl;
    }

    auto sessions = std::make_shared<InMemorySessionStore>();

    std::shared_ptr<ExecutionHistory> history;
    if (!config.history_path.empty()) {
        try {
            history = std::make_shared<JsonlExecutionHistory>(config.history_path);
        } catch (const std::runtime_error& e) {
            std::cerr << "Configuration error: " << e.what() << std::endl;
            return 1;
        }
        std::cout << "Execution history: " << config.history_path << std::endl;
    }

    auto sandbox = std::make_shared<SandboxProvisioner>(config.languages, config.sandbox);

    // Decided once for the life of the process, never per request
    const bool can_isolate = namespaces || config.sandbox.isolation == IsolationMode::BEST_EFFORT;
    for (Language language : config.fall_back_to_gateway([&](Language l) {
             return can_isolate && sandbox->toolchain_available(l);
         })) {
        std::cout << "No local runtime for " << language_name(language)
                  << ", using the remote gateway" << std::endl;
    }

    std::shared_ptr<CodeExecutor> gateway;
    if (!config.gateway.url.empty()) {
        gateway = std::make_shared<RemoteGateway>(std::make_shared<CurlTransport>(),
                                                  config.languages, config.gateway, config.retry);
        std::cout << "Remote gateway: " << config.gateway.url << std::endl;
    }

    for (Language language : config.languages.languages()) {
        const LanguageSpec& spec = config.languages.at(language);
        std::cout << "  " << spec.name << " -> " << route_name(spec.route);
        if (spec.route == Route::LOCAL && !sandbox->toolchain_available(language)) {
            std::cout << " (toolchain '" << spec.toolchain << "' not found)";
        }
        std::cout << std::endl;
    }

    ExecutionCoordinator coordinator(sessions, history, sandbox, gateway,
                                     config.languages, config.coordinator);

    std::shared_ptr<BroadcastBus> bus;
    if (!config.redis_url.empty()) {
#ifdef CODEPAIR_HAVE_REDIS
        try {
            bus = std::make_shared<RedisBus>(config.redis_url);
        } catch (const sw::redis::Error& e) {
            std::cerr << "Failed to connect to Redis at " << config.redis_url << ": "
                      << e.what() << std::endl;
            return 1;
        }
#else
        std::cerr << "This build has no Redis support; rebuild with redis++ installed"
                  << " or drop --redis-url" << std::endl;
        return 1;
#endif
    }

    PresenceHub hub(sessions, bus, config.node_id);
    std::cout << "Presence node: " << hub.node_id()
              << (bus ? " (cross-node bus enabled)" : " (single node)") << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    HttpServer server(config.port);

    ApiContext ctx{*sessions, coordinator, hub, config.session_ttl,
                   isolation_name(config.sandbox.isolation)};
    register_routes(server, ctx);

    server.websocket_route("/ws", [&hub](int client_fd, const HttpRequest& req) {
        std::cout << "[WebSocket] Client connected from " << req.client_ip << std::endl;
        auto socket = std::make_shared<SessionSocket>(client_fd, hub);
        socket->run();
    });

    std::cout << "API endpoints:" << std::endl;
    std::cout << "  POST /sessions               - Create a session" << std::endl;
    std::cout << "  GET  /sessions/{id}          - Session record" << std::endl;
    std::cout << "  POST /sessions/{id}/execute  - Run code" << std::endl;
    std::cout << "  GET  /health                 - Health check" << std::endl;
    std::cout << "  WS   /ws                     - Collaboration events" << std::endl;
    std::cout << std::endl;

    ShutdownWatcher watcher(server);
    try {
        server.start();
    } catch (const std::runtime_error& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
