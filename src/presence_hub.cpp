#include "codepair/presence_hub.h"
#include "codepair/ids.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace codepair {

std::string presence_status_message(PresenceStatus status) {
    switch (status) {
        case PresenceStatus::OK: return "ok";
        case PresenceStatus::SESSION_NOT_FOUND: return "Session not found";
        case PresenceStatus::SESSION_EXPIRED: return "Session expired";
        case PresenceStatus::NOT_JOINED: return "Not joined to this session";
        case PresenceStatus::UNSUPPORTED_LANGUAGE: return "Unsupported language";
    }
    return "unknown";
}

PresenceHub::PresenceHub(std::shared_ptr<SessionStore> sessions,
                         std::shared_ptr<BroadcastBus> bus,
                         std::string node_id)
    : sessions_(std::move(sessions)),
      bus_(std::move(bus)),
      node_id_(node_id.empty() ? random_id(8) : std::move(node_id)) {
    if (!sessions_) {
        throw std::invalid_argument("PresenceHub requires a session store");
    }
    if (bus_) {
        subscription_ = bus_->subscribe([this](const BusMessage& message) {
            on_bus_message(message);
        });
    }
}

PresenceHub::~PresenceHub() {
    if (bus_) {
        bus_->unsubscribe(subscription_);
    }
}

std::string PresenceHub::default_display_name(const std::string& connection_id) {
    return "User-" + connection_id.substr(0, 4);
}

std::shared_ptr<PresenceHub::Room> PresenceHub::find_room(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto it = rooms_.find(session_id);
    return it == rooms_.end() ? nullptr : it->second;
}

std::shared_ptr<PresenceHub::Room> PresenceHub::room_for(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto& room = rooms_[session_id];
    if (!room) {
        room = std::make_shared<Room>();
    }
    return room;
}

// Caller holds room.mutex
void PresenceHub::release_if_empty(const std::string& session_id, Room& room) {
    if (!room.empty()) return;

    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto it = rooms_.find(session_id);
    if (it != rooms_.end() && it->second.get() == &room) {
        rooms_.erase(it);
    }
    room.released = true;
    std::cout << "[Presence] Released room for session " << session_id << std::endl;
}

std::vector<Participant> PresenceHub::snapshot(const Room& room) const {
    std::vector<Participant> result;
    result.reserve(room.local.size() + room.remote.size());
    for (const auto& [id, member] : room.local) {
        result.push_back(member.participant);
    }
    for (const auto& [id, participant] : room.remote) {
        result.push_back(participant);
    }
    std::sort(result.begin(), result.end(), [](const Participant& a, const Participant& b) {
        if (a.joined_at != b.joined_at) return a.joined_at < b.joined_at;
        return a.connection_id < b.connection_id;
    });
    return result;
}

void PresenceHub::fan_out(const std::string& session_id, Room& room,
                          const PresenceEvent& event, const std::string& exclude) {
    std::vector<std::string> dead;
    for (auto& [id, member] : room.local) {
        if (id == exclude) continue;
        if (member.participant.state != ParticipantState::JOINED) continue;
        if (!member.sink->deliver(event)) {
            dead.push_back(id);
        }
    }
    if (!dead.empty()) {
        drop_members(session_id, room, std::move(dead));
    }
}

void PresenceHub::drop_members(const std::string& session_id, Room& room,
                               std::vector<std::string> connection_ids) {
    for (const auto& id : connection_ids) {
        std::cerr << "[Presence] Dropping unreachable connection " << id
                  << " from session " << session_id << std::endl;
        remove_member(session_id, room, id);
    }
}

void PresenceHub::remove_member(const std::string& session_id, Room& room,
                                const std::string& connection_id) {
    auto it = room.local.find(connection_id);
    if (it == room.local.end()) return;

    it->second.participant.state = ParticipantState::DISCONNECTED;
    room.local.erase(it);
    untrack(connection_id, session_id);

    PresenceEvent left;
    left.type = EventType::USER_LEFT;
    left.session_id = session_id;
    left.participant_id = connection_id;
    left.participants = snapshot(room);

    fan_out(session_id, room, left);
    publish(left);
}

void PresenceHub::publish(const PresenceEvent& event) {
    if (!bus_) return;

    BusMessage message;
    message.origin_node = node_id_;
    message.event = event;
    try {
        bus_->publish(message);
    } catch (const std::exception& e) {
        std::cerr << "[Presence] Failed to publish " << event_name(event.type)
                  << " for session " << event.session_id << ": " << e.what() << std::endl;
    }
}

PresenceStatus PresenceHub::join(const std::string& session_id, const std::string& connection_id,
                                 const std::string& display_name,
                                 std::shared_ptr<PresenceSink> sink) {
    if (!sink) {
        throw std::invalid_argument("join requires a sink");
    }

    while (true) {
        auto room = room_for(session_id);
        std::lock_guard<std::mutex> lock(room->mutex);
        if (room->released) continue;

        // Read under the room lock so the state reflects every language
        // change already broadcast to this room
        auto session = sessions_->find(session_id);
        PresenceStatus status = PresenceStatus::OK;
        if (!session) {
            status = PresenceStatus::SESSION_NOT_FOUND;
        } else if (session->is_expired()) {
            status = PresenceStatus::SESSION_EXPIRED;
        }
        if (status != PresenceStatus::OK) {
            release_if_empty(session_id, *room);
            return status;
        }

        PresenceEvent state;
        state.type = EventType::SESSION_STATE;
        state.session_id = session_id;
        state.session = *session;

        auto existing = room->local.find(connection_id);
        if (existing != room->local.end()) {
            if (!existing->second.sink->deliver(state)) {
                drop_members(session_id, *room, {connection_id});
                release_if_empty(session_id, *room);
            }
            return PresenceStatus::OK;
        }

        Member member;
        member.participant.connection_id = connection_id;
        member.participant.display_name =
            display_name.empty() ? default_display_name(connection_id) : display_name;
        member.participant.joined_at = SystemClock::now();
        member.participant.state = ParticipantState::JOINING;
        member.participant.origin_node = node_id_;
        member.sink = std::move(sink);

        auto& joined = room->local[connection_id] = std::move(member);
        track(connection_id, session_id);

        if (!joined.sink->deliver(state)) {
            room->local.erase(connection_id);
            untrack(connection_id, session_id);
            release_if_empty(session_id, *room);
            return PresenceStatus::OK;
        }
        joined.participant.state = ParticipantState::JOINED;

        PresenceEvent event;
        event.type = EventType::USER_JOINED;
        event.session_id = session_id;
        event.participant_id = connection_id;
        event.display_name = joined.participant.display_name;
        event.participants = snapshot(*room);

        std::cout << "[Presence] " << event.display_name << " (" << connection_id
                  << ") joined session " << session_id << " with "
                  << event.participants.size() << " participant(s)" << std::endl;

        fan_out(session_id, *room, event);
        publish(event);
        release_if_empty(session_id, *room);
        return PresenceStatus::OK;
    }
}

PresenceStatus PresenceHub::update_cursor(const std::string& session_id,
                                          const std::string& connection_id,
                                          const CursorPosition& position,
                                          const std::optional<Selection>& selection) {
    auto room = find_room(session_id);
    if (!room) return PresenceStatus::NOT_JOINED;

    std::lock_guard<std::mutex> lock(room->mutex);
    auto it = room->local.find(connection_id);
    if (room->released || it == room->local.end() ||
        it->second.participant.state != ParticipantState::JOINED) {
        return PresenceStatus::NOT_JOINED;
    }

    PresenceEvent event;
    event.type = EventType::REMOTE_CURSOR;
    event.session_id = session_id;
    event.participant_id = connection_id;
    event.position = position;
    event.selection = selection;

    fan_out(session_id, *room, event, connection_id);
    publish(event);
    release_if_empty(session_id, *room);
    return PresenceStatus::OK;
}

PresenceStatus PresenceHub::update_language(const std::string& session_id,
                                            const std::string& connection_id,
                                            const std::string& language) {
    auto parsed = parse_language(language);
    if (!parsed) return PresenceStatus::UNSUPPORTED_LANGUAGE;

    auto room = find_room(session_id);
    if (!room) return PresenceStatus::NOT_JOINED;

    std::lock_guard<std::mutex> lock(room->mutex);
    auto it = room->local.find(connection_id);
    if (room->released || it == room->local.end() ||
        it->second.participant.state != ParticipantState::JOINED) {
        return PresenceStatus::NOT_JOINED;
    }

    if (!sessions_->update_language(session_id, *parsed)) {
        return PresenceStatus::SESSION_NOT_FOUND;
    }

    PresenceEvent event;
    event.type = EventType::LANGUAGE_CHANGED;
    event.session_id = session_id;
    event.participant_id = connection_id;
    event.language = *parsed;

    std::cout << "[Presence] Session " << session_id << " language changed to "
              << language_name(*parsed) << std::endl;

    fan_out(session_id, *room, event);
    publish(event);
    release_if_empty(session_id, *room);
    return PresenceStatus::OK;
}

PresenceStatus PresenceHub::rename(const std::string& session_id,
                                   const std::string& connection_id,
                                   const std::string& display_name) {
    auto room = find_room(session_id);
    if (!room) return PresenceStatus::NOT_JOINED;

    std::lock_guard<std::mutex> lock(room->mutex);
    auto it = room->local.find(connection_id);
    if (room->released || it == room->local.end() ||
        it->second.participant.state != ParticipantState::JOINED) {
        return PresenceStatus::NOT_JOINED;
    }

    it->second.participant.display_name =
        display_name.empty() ? default_display_name(connection_id) : display_name;

    PresenceEvent event;
    event.type = EventType::USERNAME_CHANGED;
    event.session_id = session_id;
    event.participant_id = connection_id;
    event.display_name = it->second.participant.display_name;
    event.participants = snapshot(*room);

    fan_out(session_id, *room, event);
    publish(event);
    release_if_empty(session_id, *room);
    return PresenceStatus::OK;
}

void PresenceHub::leave(const std::string& connection_id) {
    std::set<std::string> session_ids;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connection_sessions_.find(connection_id);
        if (it == connection_sessions_.end()) return;
        session_ids = it->second;
    }

    for (const auto& session_id : session_ids) {
        leave(session_id, connection_id);
    }
}

bool PresenceHub::leave(const std::string& session_id, const std::string& connection_id) {
    auto room = find_room(session_id);
    if (!room) return false;

    std::lock_guard<std::mutex> lock(room->mutex);
    if (room->released || room->local.count(connection_id) == 0) {
        return false;
    }

    std::cout << "[Presence] " << connection_id << " left session " << session_id << std::endl;
    remove_member(session_id, *room, connection_id);
    release_if_empty(session_id, *room);
    return true;
}

std::vector<Participant> PresenceHub::participants(const std::string& session_id) const {
    auto room = find_room(session_id);
    if (!room) return {};

    std::lock_guard<std::mutex> lock(room->mutex);
    return snapshot(*room);
}

size_t PresenceHub::session_count() const {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    return rooms_.size();
}

void PresenceHub::track(const std::string& connection_id, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connection_sessions_[connection_id].insert(session_id);
}

void PresenceHub::untrack(const std::string& connection_id, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connection_sessions_.find(connection_id);
    if (it == connection_sessions_.end()) return;
    it->second.erase(session_id);
    if (it->second.empty()) {
        connection_sessions_.erase(it);
    }
}

void PresenceHub::on_bus_message(const BusMessage& message) {
    if (message.origin_node == node_id_) return;

    const PresenceEvent& event = message.event;
    const std::string& session_id = event.session_id;

    // Only a join may create a room for a session with no local members
    std::shared_ptr<Room> room;
    while (true) {
        room = event.type == EventType::USER_JOINED ? room_for(session_id) : find_room(session_id);
        if (!room) return;

        std::lock_guard<std::mutex> lock(room->mutex);
        if (room->released) continue;

        PresenceEvent relayed = event;
        switch (event.type) {
            case EventType::USER_JOINED: {
                Participant mirrored;
                mirrored.connection_id = event.participant_id;
                mirrored.display_name = event.display_name;
                mirrored.joined_at = SystemClock::now();
                for (const auto& p : event.participants) {
                    if (p.connection_id == event.participant_id) {
                        mirrored.joined_at = p.joined_at;
                        break;
                    }
                }
                mirrored.state = ParticipantState::JOINED;
                mirrored.origin_node = message.origin_node;
                room->remote[mirrored.connection_id] = mirrored;
                relayed.participants = snapshot(*room);
                break;
            }
            case EventType::USER_LEFT:
                room->remote.erase(event.participant_id);
                relayed.participants = snapshot(*room);
                break;
            case EventType::USERNAME_CHANGED: {
                auto it = room->remote.find(event.participant_id);
                if (it != room->remote.end()) {
                    it->second.display_name = event.display_name;
                }
                relayed.participants = snapshot(*room);
                break;
            }
            case EventType::REMOTE_CURSOR:
            case EventType::LANGUAGE_CHANGED:
                break;
            case EventType::SESSION_STATE:
            case EventType::ERROR:
                return;
        }

        fan_out(session_id, *room, relayed);
        release_if_empty(session_id, *room);
        return;
    }
}

} // namespace codepair
