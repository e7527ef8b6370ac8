#pragma once

#include <string>
#include <chrono>
#include "http_server.h"
#include "codepair/coordinator.h"
#include "codepair/presence_hub.h"
#include "codepair/session_store.h"

namespace codepair {

// Collaborators the REST endpoints need
struct ApiContext {
    InMemorySessionStore& sessions;
    ExecutionCoordinator& coordinator;
    PresenceHub& hub;
    std::chrono::hours session_ttl;
    std::string isolation;                 // reported by /health
};

// POST /sessions, GET /sessions/{id}, POST /sessions/{id}/execute, GET /health
void register_routes(HttpServer& server, const ApiContext& ctx);

// Body and status code for an execute call
HttpResponse execution_response(const ExecutionResult& result);

} // namespace codepair
