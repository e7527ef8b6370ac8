#pragma once

#include <string>
#include <vector>
#include <optional>
#include "codepair/language.h"
#include "codepair/session_store.h"

namespace codepair {

struct CursorPosition {
    int line_number = 1;
    int column = 1;
};

struct Selection {
    int start_line_number = 1;
    int start_column = 1;
    int end_line_number = 1;
    int end_column = 1;
};

enum class ParticipantState {
    DISCONNECTED,
    JOINING,
    JOINED
};

// One connection's membership in one session
struct Participant {
    std::string connection_id;
    std::string display_name;
    SystemClock::time_point joined_at;
    ParticipantState state = ParticipantState::DISCONNECTED;
    std::string origin_node;               // hub instance holding the connection
};

enum class EventType {
    SESSION_STATE,
    USER_JOINED,
    USER_LEFT,
    REMOTE_CURSOR,
    LANGUAGE_CHANGED,
    USERNAME_CHANGED,
    ERROR
};

// Server-to-client event. Which fields are set depends on the type.
struct PresenceEvent {
    EventType type = EventType::ERROR;
    std::string session_id;
    std::string participant_id;
    std::string display_name;
    std::vector<Participant> participants;
    std::optional<CursorPosition> position;
    std::optional<Selection> selection;
    std::optional<Language> language;
    std::optional<Session> session;
    std::string message;
};

// Outbound side of one connection. deliver() only enqueues and must not block
// on the network; returning false means the connection is gone.
class PresenceSink {
public:
    virtual ~PresenceSink() = default;

    virtual bool deliver(const PresenceEvent& event) = 0;
};

std::string event_name(EventType type);
std::optional<EventType> parse_event_name(const std::string& name);

} // namespace codepair
