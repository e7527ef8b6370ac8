#include "websocket.h"
#include "codepair/constants.h"
#include "codepair/ids.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>

namespace codepair {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string header_value(const std::map<std::string, std::string>& headers,
                         const std::string& name) {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) return value;
    }
    return "";
}

} // namespace

bool WebSocketManager::is_websocket_upgrade(const std::map<std::string, std::string>& headers) {
    std::string upgrade = to_lower(header_value(headers, "Upgrade"));
    std::string connection = to_lower(header_value(headers, "Connection"));

    return upgrade == "websocket" && connection.find("upgrade") != std::string::npos;
}

std::string WebSocketManager::websocket_key(const std::map<std::string, std::string>& headers) {
    return header_value(headers, "Sec-WebSocket-Key");
}

std::string WebSocketManager::accept_key(const std::string& sec_key) {
    const std::string magic = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    std::string combined = sec_key + magic;

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(combined.c_str()), combined.length(), hash);

    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

std::string WebSocketManager::create_handshake_response(const std::string& sec_key) {
    std::ostringstream response;
    response << "HTTP/1.1 101 Switching Protocols\r\n"
             << "Upgrade: websocket\r\n"
             << "Connection: Upgrade\r\n"
             << "Sec-WebSocket-Accept: " << accept_key(sec_key) << "\r\n"
             << "\r\n";

    return response.str();
}

std::vector<uint8_t> WebSocketManager::create_frame(WSOpcode opcode, const std::string& payload) {
    std::vector<uint8_t> frame;

    // FIN + opcode
    frame.push_back(0x80 | static_cast<uint8_t>(opcode));

    size_t payload_len = payload.size();
    if (payload_len <= 125) {
        frame.push_back(static_cast<uint8_t>(payload_len));
    } else if (payload_len <= 65535) {
        frame.push_back(126);
        frame.push_back((payload_len >> 8) & 0xFF);
        frame.push_back(payload_len & 0xFF);
    } else {
        frame.push_back(127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back((static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF);
        }
    }

    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

bool WebSocketManager::write_all(int client_fd, const std::vector<uint8_t>& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(client_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool WebSocketManager::read_exact(int client_fd, uint8_t* buffer, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = read(client_fd, buffer + total, len - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool WebSocketManager::send_text(int client_fd, const std::string& message) {
    return write_all(client_fd, create_frame(WSOpcode::TEXT, message));
}

bool WebSocketManager::send_pong(int client_fd, const std::string& payload) {
    return write_all(client_fd, create_frame(WSOpcode::PONG, payload));
}

bool WebSocketManager::send_close(int client_fd) {
    return write_all(client_fd, create_frame(WSOpcode::CLOSE, ""));
}

bool WebSocketManager::read_single_frame(int client_fd, size_t limit, bool& fin,
                                         WSOpcode& opcode, std::string& payload) {
    uint8_t header[2];
    if (!read_exact(client_fd, header, 2)) {
        return false;
    }

    fin = (header[0] & 0x80) != 0;
    opcode = static_cast<WSOpcode>(header[0] & 0x0F);
    bool masked = (header[1] & 0x80) != 0;
    uint64_t payload_len = header[1] & 0x7F;

    if (payload_len == 126) {
        uint8_t len_bytes[2];
        if (!read_exact(client_fd, len_bytes, 2)) return false;
        payload_len = (static_cast<uint64_t>(len_bytes[0]) << 8) | len_bytes[1];
    } else if (payload_len == 127) {
        uint8_t len_bytes[8];
        if (!read_exact(client_fd, len_bytes, 8)) return false;
        payload_len = 0;
        for (int i = 0; i < 8; i++) {
            payload_len = (payload_len << 8) | len_bytes[i];
        }
    }

    if (payload_len > limit) {
        return false;
    }

    uint8_t mask[4] = {0};
    if (masked && !read_exact(client_fd, mask, 4)) {
        return false;
    }

    std::vector<uint8_t> data(payload_len);
    if (payload_len > 0 && !read_exact(client_fd, data.data(), payload_len)) {
        return false;
    }

    if (masked) {
        for (size_t i = 0; i < payload_len; i++) {
            data[i] ^= mask[i % 4];
        }
    }

    payload.assign(data.begin(), data.end());
    return true;
}

WebSocketFrame WebSocketManager::read_frame(int client_fd, FragmentBuffer& pending) {
    WebSocketFrame closed;

    while (true) {
        const size_t room = MAX_WS_FRAME_SIZE - (pending.active ? pending.payload.size() : 0);
        bool fin = false;
        WSOpcode opcode = WSOpcode::CLOSE;
        std::string payload;
        if (!read_single_frame(client_fd, std::max(room, size_t{125}), fin, opcode, payload)) {
            return closed;
        }

        // Control frames are never fragmented and may arrive mid-message
        if (static_cast<uint8_t>(opcode) & 0x08) {
            if (!fin || payload.size() > 125) return closed;
            return WebSocketFrame{opcode, std::move(payload)};
        }

        if (payload.size() > room) return closed;
        if (opcode == WSOpcode::CONTINUATION) {
            if (!pending.active) return closed;
            pending.payload += payload;
        } else {
            if (pending.active) return closed;
            pending.active = true;
            pending.opcode = opcode;
            pending.payload = std::move(payload);
        }

        if (fin) {
            WebSocketFrame frame{pending.opcode, std::move(pending.payload)};
            pending = FragmentBuffer{};
            return frame;
        }
    }
}

WebSocketFrame WebSocketManager::read_frame(int client_fd) {
    FragmentBuffer pending;
    return read_frame(client_fd, pending);
}

} // namespace codepair
