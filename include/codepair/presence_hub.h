#pragma once

#include <string>
#include <map>
#include <set>
#include <mutex>
#include <memory>
#include <vector>
#include "codepair/broadcast_bus.h"
#include "codepair/presence_event.h"
#include "codepair/session_store.h"

namespace codepair {

enum class PresenceStatus {
    OK,
    SESSION_NOT_FOUND,
    SESSION_EXPIRED,
    NOT_JOINED,
    UNSUPPORTED_LANGUAGE
};

std::string presence_status_message(PresenceStatus status);

// Per-session membership and ordered fan-out of collaboration events.
//
// Every session has a room with its own mutex. A mutation, the participant
// snapshot it produces and the enqueueing of its events happen under that
// mutex, so all participants of one session observe the same order.
// Sessions never block each other.
class PresenceHub {
public:
    // `bus` is optional; without one the hub serves a single node
    PresenceHub(std::shared_ptr<SessionStore> sessions,
                std::shared_ptr<BroadcastBus> bus = nullptr,
                std::string node_id = "");
    ~PresenceHub();

    PresenceHub(const PresenceHub&) = delete;
    PresenceHub& operator=(const PresenceHub&) = delete;

    // Sends session-state to the joiner, then user-joined to everyone in the
    // session. Joining again on the same connection only re-sends the state.
    PresenceStatus join(const std::string& session_id, const std::string& connection_id,
                        const std::string& display_name, std::shared_ptr<PresenceSink> sink);

    // remote-cursor to everyone except the sender
    PresenceStatus update_cursor(const std::string& session_id, const std::string& connection_id,
                                 const CursorPosition& position,
                                 const std::optional<Selection>& selection = std::nullopt);

    // Persists the language, then language-changed to everyone
    PresenceStatus update_language(const std::string& session_id, const std::string& connection_id,
                                   const std::string& language);

    PresenceStatus rename(const std::string& session_id, const std::string& connection_id,
                          const std::string& display_name);

    // Disconnect: leaves every session the connection belongs to
    void leave(const std::string& connection_id);

    // Returns false if the connection was not in the session
    bool leave(const std::string& session_id, const std::string& connection_id);

    // Local and mirrored remote participants, oldest first
    std::vector<Participant> participants(const std::string& session_id) const;

    size_t session_count() const;

    const std::string& node_id() const { return node_id_; }

    static std::string default_display_name(const std::string& connection_id);

private:
    struct Member {
        Participant participant;
        std::shared_ptr<PresenceSink> sink;
    };

    struct Room {
        std::mutex mutex;
        std::map<std::string, Member> local;
        std::map<std::string, Participant> remote;
        bool released = false;

        bool empty() const { return local.empty() && remote.empty(); }
    };

    std::shared_ptr<Room> find_room(const std::string& session_id) const;
    std::shared_ptr<Room> room_for(const std::string& session_id);
    void release_if_empty(const std::string& session_id, Room& room);

    std::vector<Participant> snapshot(const Room& room) const;

    // Deliver to local members except `exclude`; members whose sink fails are
    // removed and announced as having left
    void fan_out(const std::string& session_id, Room& room, const PresenceEvent& event,
                 const std::string& exclude = "");
    void drop_members(const std::string& session_id, Room& room,
                      std::vector<std::string> connection_ids);
    void remove_member(const std::string& session_id, Room& room,
                       const std::string& connection_id);

    void publish(const PresenceEvent& event);
    void on_bus_message(const BusMessage& message);

    void track(const std::string& connection_id, const std::string& session_id);
    void untrack(const std::string& connection_id, const std::string& session_id);

    std::shared_ptr<SessionStore> sessions_;
    std::shared_ptr<BroadcastBus> bus_;
    std::string node_id_;
    BroadcastBus::SubscriptionId subscription_ = 0;

    mutable std::mutex rooms_mutex_;
    std::map<std::string, std::shared_ptr<Room>> rooms_;

    std::mutex connections_mutex_;
    std::map<std::string, std::set<std::string>> connection_sessions_;
};

} // namespace codepair
