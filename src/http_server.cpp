#include "http_server.h"
#include "websocket.h"
#include "codepair/constants.h"
#include "codepair/event_codec.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <pthread.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace codepair {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            std::cerr << "[HTTP] Write failed: " << std::strerror(errno) << std::endl;
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) return value;
    }
    return "";
}

HttpResponse json_response(int status_code, const Json::Value& body) {
    HttpResponse resp;
    resp.status_code = status_code;
    resp.body = to_compact_json(body);
    return resp;
}

HttpResponse json_error(int status_code, const std::string& message) {
    Json::Value body;
    body["error"] = message;
    return json_response(status_code, body);
}

HttpServer::HttpServer(int port)
    : port_(port), server_fd_(-1), running_(false), stop_requested_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = std::move(handler);
}

void HttpServer::websocket_route(const std::string& path, WebSocketHandler handler) {
    websocket_routes_[path] = std::move(handler);
}

void HttpServer::start() {
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[HTTP] SO_REUSEADDR not set: " << std::strerror(errno) << std::endl;
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to listen");
    }

    running_ = true;
    // A stop() that ran before running_ was set must still end the loop
    if (stop_requested_) {
        stop();
        return;
    }
    std::cout << "[HTTP] Listening on port " << port_ << std::endl;

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
        }).detach();
    }
}

void HttpServer::stop() {
    stop_requested_ = true;
    running_ = false;
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
}

bool HttpServer::read_request(int client_fd, std::string& request_data) {
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;

    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        if (request_data.size() + bytes_read > MAX_REQUEST_SIZE) {
            write_response(client_fd, json_error(413, "Request exceeds 1MB limit"));
            return false;
        }
        request_data.append(buffer, bytes_read);

        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;
        header_end += 4;

        HttpRequest head = parse_request(request_data.substr(0, header_end));
        std::string length_str = head.header("Content-Length");
        if (length_str.empty()) {
            return true;
        }

        size_t content_length = 0;
        try {
            content_length = std::stoul(length_str);
        } catch (const std::exception&) {
            write_response(client_fd, json_error(400, "Invalid Content-Length"));
            return false;
        }

        size_t expected_size = header_end + content_length;
        if (expected_size > MAX_REQUEST_SIZE) {
            write_response(client_fd, json_error(413, "Request exceeds 1MB limit"));
            return false;
        }

        while (request_data.size() < expected_size) {
            bytes_read = read(client_fd, buffer,
                              std::min(sizeof(buffer), expected_size - request_data.size()));
            if (bytes_read <= 0) break;
            request_data.append(buffer, bytes_read);
        }
        return true;
    }

    return !request_data.empty();
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    if (!read_request(client_fd, request_data)) return;

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    if (req.method == "GET" && WebSocketManager::is_websocket_upgrade(req.headers)) {
        auto it = websocket_routes_.find(req.path);
        std::string key = WebSocketManager::websocket_key(req.headers);
        if (it == websocket_routes_.end()) {
            write_response(client_fd, json_error(404, "Not found"));
            return;
        }
        if (key.empty()) {
            write_response(client_fd, json_error(400, "Missing Sec-WebSocket-Key"));
            return;
        }

        write_all(client_fd, WebSocketManager::create_handshake_response(key));
        try {
            it->second(client_fd, req);
        } catch (const std::exception& e) {
            std::cerr << "[WebSocket] Connection from " << client_ip << " failed: "
                      << e.what() << std::endl;
        }
        return;
    }

    write_response(client_fd, dispatch(req));
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    const HandlerFunc* handler = nullptr;

    auto it = routes_.find(req.method + " " + req.path);
    if (it != routes_.end()) {
        handler = &it->second;
    } else {
        // Prefix match for /sessions/{id}/... style routes
        size_t best = 0;
        for (const auto& [pattern, candidate] : routes_) {
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string path_pattern = pattern.substr(space_pos + 1);

            if (method == req.method && !path_pattern.empty() && path_pattern.back() == '/' &&
                req.path.compare(0, path_pattern.size(), path_pattern) == 0 &&
                path_pattern.size() > best) {
                handler = &candidate;
                best = path_pattern.size();
            }
        }
    }

    if (!handler) {
        return json_error(404, "Not found");
    }

    try {
        return (*handler)(req);
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] " << req.method << " " << req.path << " failed: "
                  << e.what() << std::endl;
        return json_error(500, e.what());
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);
        size_t q = target.find('?');
        if (q != std::string::npos) {
            req.query = target.substr(q + 1);
            target.resize(q);
        }
        req.path = target;
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            req.headers[key] = value_start == std::string::npos ? "" : line.substr(value_start);
        }
    }

    return req;
}

std::string HttpServer::reason_phrase(int status_code) {
    switch (status_code) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    out << "HTTP/1.1 " << resp.status_code << " " << reason_phrase(resp.status_code) << "\r\n";
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";
    out << resp.body;

    return out.str();
}

void HttpServer::write_response(int client_fd, const HttpResponse& resp) {
    write_all(client_fd, build_response(resp));
}

namespace {

sigset_t shutdown_signal_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // namespace

bool block_shutdown_signals() {
    sigset_t set = shutdown_signal_set();
    return pthread_sigmask(SIG_BLOCK, &set, nullptr) == 0;
}

ShutdownWatcher::ShutdownWatcher(HttpServer& server)
    : server_(server), signals_(shutdown_signal_set()) {
    waiter_ = std::thread([this]() {
        int sig = 0;
        int rc = sigwait(&signals_, &sig);
        if (rc != 0) {
            std::cerr << "[HTTP] sigwait failed: " << strerror(rc) << std::endl;
        } else if (!closing_) {
            std::cout << "[HTTP] Received " << strsignal(sig) << ", shutting down" << std::endl;
        }
        server_.stop();
    });
}

ShutdownWatcher::~ShutdownWatcher() {
    closing_ = true;
    // Thread-directed, so it cannot land on a thread that has the signal unblocked
    int rc = pthread_kill(waiter_.native_handle(), SIGTERM);
    if (rc != 0 && rc != ESRCH) {
        std::cerr << "[HTTP] Failed to wake shutdown watcher: " << strerror(rc) << std::endl;
    }
    waiter_.join();
}

} // namespace codepair
