#pragma once

#include <string>
#include <functional>
#include <map>
#include <thread>
#include <atomic>
#include <signal.h>
#include <json/json.h>

namespace codepair {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup; empty if absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

HttpResponse json_response(int status_code, const Json::Value& body);
HttpResponse json_error(int status_code, const std::string& message);

using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Takes over an upgraded connection; returns when the client is gone.
// The server closes the socket afterwards.
using WebSocketHandler = std::function<void(int client_fd, const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection
class HttpServer {
public:
    explicit HttpServer(int port = 3000);
    ~HttpServer();

    // Exact match first, then the longest registered prefix
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // GET upgrades on `path` are handed to `handler` after the handshake
    void websocket_route(const std::string& path, WebSocketHandler handler);

    // Start server (blocks). Throws std::runtime_error if the port cannot be bound.
    void start();

    // Safe to call from another thread, before or during start()
    void stop();

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string reason_phrase(int status_code);

    // Dispatch a parsed request to its handler (no socket involved)
    HttpResponse dispatch(const HttpRequest& req) const;

private:
    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::map<std::string, HandlerFunc> routes_;
    std::map<std::string, WebSocketHandler> websocket_routes_;

    void handle_client(int client_fd, const std::string& client_ip);
    bool read_request(int client_fd, std::string& request_data);
    void write_response(int client_fd, const HttpResponse& resp);
};

// Blocks SIGINT and SIGTERM in the calling thread and in every thread it
// starts afterwards, so only a ShutdownWatcher receives them. Call before
// any worker threads exist.
bool block_shutdown_signals();

// Waits on its own thread for SIGINT or SIGTERM and stops the server.
// The destructor wakes and joins the thread if no signal came.
class ShutdownWatcher {
public:
    explicit ShutdownWatcher(HttpServer& server);
    ~ShutdownWatcher();

    ShutdownWatcher(const ShutdownWatcher&) = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;

private:
    HttpServer& server_;
    sigset_t signals_;
    std::atomic<bool> closing_{false};
    std::thread waiter_;
};

} // namespace codepair
