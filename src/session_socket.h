#pragma once

#include <string>
#include <deque>
#include <mutex>
#include <thread>
#include <memory>
#include <condition_variable>
#include "websocket.h"
#include "codepair/presence_hub.h"

namespace codepair {

// One collaboration WebSocket. Inbound frames are decoded on the caller's
// thread in run(); outbound events are queued by the hub and written by a
// dedicated writer thread, so a slow client never stalls a session room.
class SessionSocket : public PresenceSink,
                      public std::enable_shared_from_this<SessionSocket> {
public:
    static constexpr size_t DEFAULT_MAX_QUEUED = 256;

    // Does not take ownership of `client_fd`
    SessionSocket(int client_fd, PresenceHub& hub, size_t max_queued = DEFAULT_MAX_QUEUED);
    ~SessionSocket() override;

    SessionSocket(const SessionSocket&) = delete;
    SessionSocket& operator=(const SessionSocket&) = delete;

    // Enqueue only; false once the connection is closing or its queue is full
    bool deliver(const PresenceEvent& event) override;

    // Read loop. Returns when the client closes or the socket fails, after
    // leaving every joined session.
    void run();

    // Decode one client event and apply it to the hub
    void handle_message(const std::string& text);

    // Stop the writer after flushing what is queued
    void close();

    const std::string& connection_id() const { return connection_id_; }

private:
    struct Outbound {
        WSOpcode opcode;
        std::string payload;
    };

    bool enqueue(WSOpcode opcode, std::string payload);
    void send_error(const std::string& message);
    void write_loop();

    int client_fd_;
    PresenceHub& hub_;
    size_t max_queued_;
    std::string connection_id_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Outbound> queue_;
    bool closing_ = false;
    bool broken_ = false;
    std::thread writer_;
};

} // namespace codepair
