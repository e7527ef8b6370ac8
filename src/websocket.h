#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <openssl/sha.h>
#include <arpa/inet.h>

namespace codepair {

// WebSocket frame opcodes
enum class WSOpcode : uint8_t {
    CONTINUATION = 0x0,
    TEXT = 0x1,
    BINARY = 0x2,
    CLOSE = 0x8,
    PING = 0x9,
    PONG = 0xA
};

struct WebSocketFrame {
    WSOpcode opcode = WSOpcode::CLOSE;
    std::string payload;
};

// Data frames received so far of a message whose final fragment is pending
struct FragmentBuffer {
    bool active = false;
    WSOpcode opcode = WSOpcode::TEXT;
    std::string payload;
};

// RFC 6455 helpers over a connected socket
class WebSocketManager {
public:
    // Check if request is WebSocket upgrade (header names are case-insensitive)
    static bool is_websocket_upgrade(const std::map<std::string, std::string>& headers);

    // Value of Sec-WebSocket-Key, or empty
    static std::string websocket_key(const std::map<std::string, std::string>& headers);

    static std::string accept_key(const std::string& sec_key);

    // 101 Switching Protocols response for the handshake
    static std::string create_handshake_response(const std::string& sec_key);

    static bool send_text(int client_fd, const std::string& message);
    static bool send_pong(int client_fd, const std::string& payload);
    static bool send_close(int client_fd);

    // Read one message and unmask it. Fragments are joined in `pending`;
    // control frames sent between fragments are returned as they arrive and
    // the partial message is kept for the next call. A read failure, a
    // protocol error, a message over MAX_WS_FRAME_SIZE or a peer close all
    // yield a CLOSE frame.
    static WebSocketFrame read_frame(int client_fd, FragmentBuffer& pending);

    // Same, for readers that keep no state between calls
    static WebSocketFrame read_frame(int client_fd);

    // Unmasked server-to-client frame
    static std::vector<uint8_t> create_frame(WSOpcode opcode, const std::string& payload);

private:
    static bool write_all(int client_fd, const std::vector<uint8_t>& data);
    static bool read_exact(int client_fd, uint8_t* buffer, size_t len);

    // One frame off the wire, unmasked; `limit` bounds its payload
    static bool read_single_frame(int client_fd, size_t limit, bool& fin,
                                  WSOpcode& opcode, std::string& payload);
};

} // namespace codepair
