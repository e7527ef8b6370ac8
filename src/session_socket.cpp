#include "session_socket.h"
#include "codepair/event_codec.h"
#include "codepair/ids.h"
#include <sys/socket.h>
#include <iostream>

namespace codepair {

SessionSocket::SessionSocket(int client_fd, PresenceHub& hub, size_t max_queued)
    : client_fd_(client_fd),
      hub_(hub),
      max_queued_(max_queued),
      connection_id_(random_id(8)) {
    writer_ = std::thread([this]() { write_loop(); });
}

SessionSocket::~SessionSocket() {
    close();
}

bool SessionSocket::deliver(const PresenceEvent& event) {
    return enqueue(WSOpcode::TEXT, encode_event(event));
}

bool SessionSocket::enqueue(WSOpcode opcode, std::string payload) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_ || broken_) return false;
        if (queue_.size() >= max_queued_) {
            std::cerr << "[WebSocket] Outbound queue full for " << connection_id_
                      << ", dropping connection" << std::endl;
            broken_ = true;
            shutdown(client_fd_, SHUT_RDWR);
            cv_.notify_all();
            return false;
        }
        queue_.push_back(Outbound{opcode, std::move(payload)});
    }
    cv_.notify_one();
    return true;
}

void SessionSocket::write_loop() {
    while (true) {
        Outbound next;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return broken_ || closing_ || !queue_.empty(); });
            if (broken_) return;
            if (queue_.empty()) return;
            next = std::move(queue_.front());
            queue_.pop_front();
        }

        bool sent = false;
        switch (next.opcode) {
            case WSOpcode::PONG:
                sent = WebSocketManager::send_pong(client_fd_, next.payload);
                break;
            case WSOpcode::CLOSE:
                sent = WebSocketManager::send_close(client_fd_);
                break;
            default:
                sent = WebSocketManager::send_text(client_fd_, next.payload);
                break;
        }

        if (!sent) {
            std::lock_guard<std::mutex> lock(mutex_);
            broken_ = true;
            // Unblocks the reader in run()
            shutdown(client_fd_, SHUT_RDWR);
            return;
        }
    }
}

void SessionSocket::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
    }
    cv_.notify_all();
    if (writer_.joinable() && writer_.get_id() != std::this_thread::get_id()) {
        writer_.join();
    }
}

void SessionSocket::send_error(const std::string& message) {
    PresenceEvent event;
    event.type = EventType::ERROR;
    event.message = message;
    if (!deliver(event)) {
        std::cerr << "[WebSocket] Could not report error to " << connection_id_
                  << ": " << message << std::endl;
    }
}

void SessionSocket::handle_message(const std::string& text) {
    std::string error;
    auto message = parse_client_message(text, error);
    if (!message) {
        send_error(error);
        return;
    }

    PresenceStatus status = PresenceStatus::OK;
    switch (message->type) {
        case ClientEventType::JOIN_SESSION:
            status = hub_.join(message->session_id, connection_id_, message->display_name,
                               shared_from_this());
            break;
        case ClientEventType::CURSOR_CHANGE:
            status = hub_.update_cursor(message->session_id, connection_id_, message->position,
                                        message->selection);
            // Cursor moves before joining are dropped silently
            if (status == PresenceStatus::NOT_JOINED) return;
            break;
        case ClientEventType::LANGUAGE_CHANGE:
            status = hub_.update_language(message->session_id, connection_id_, message->language);
            if (status == PresenceStatus::UNSUPPORTED_LANGUAGE) {
                send_error("Unsupported language: " + message->language);
                return;
            }
            break;
        case ClientEventType::USERNAME_CHANGE:
            status = hub_.rename(message->session_id, connection_id_, message->display_name);
            break;
    }

    if (status != PresenceStatus::OK) {
        send_error(presence_status_message(status));
    }
}

void SessionSocket::run() {
    std::cout << "[WebSocket] Connection " << connection_id_ << " opened" << std::endl;

    FragmentBuffer pending;
    while (true) {
        WebSocketFrame frame = WebSocketManager::read_frame(client_fd_, pending);

        if (frame.opcode == WSOpcode::CLOSE) {
            if (!enqueue(WSOpcode::CLOSE, "")) {
                std::cout << "[WebSocket] Connection " << connection_id_
                          << " closed without handshake" << std::endl;
            }
            break;
        }
        if (frame.opcode == WSOpcode::PING) {
            if (!enqueue(WSOpcode::PONG, frame.payload)) break;
            continue;
        }
        if (frame.opcode == WSOpcode::PONG) {
            continue;
        }
        if (frame.opcode != WSOpcode::TEXT) {
            send_error("Only text frames are supported");
            continue;
        }

        handle_message(frame.payload);
    }

    hub_.leave(connection_id_);
    close();
    std::cout << "[WebSocket] Connection " << connection_id_ << " closed" << std::endl;
}

} // namespace codepair
