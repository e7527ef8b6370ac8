#include "codepair/event_codec.h"
#include <memory>
#include <stdexcept>

namespace codepair {

namespace {

SystemClock::time_point from_epoch_ms(Json::Int64 ms) {
    return SystemClock::time_point(
        std::chrono::duration_cast<SystemClock::duration>(std::chrono::milliseconds(ms)));
}

Json::Value participant_to_json(const Participant& participant) {
    Json::Value json;
    json["id"] = participant.connection_id;
    json["displayName"] = participant.display_name;
    json["joinedAt"] = static_cast<Json::Int64>(to_epoch_ms(participant.joined_at));
    return json;
}

Json::Value participants_to_json(const std::vector<Participant>& participants) {
    Json::Value list(Json::arrayValue);
    for (const auto& p : participants) {
        list.append(participant_to_json(p));
    }
    return list;
}

Json::Value position_to_json(const CursorPosition& position) {
    Json::Value json;
    json["lineNumber"] = position.line_number;
    json["column"] = position.column;
    return json;
}

Json::Value selection_to_json(const Selection& selection) {
    Json::Value json;
    json["startLineNumber"] = selection.start_line_number;
    json["startColumn"] = selection.start_column;
    json["endLineNumber"] = selection.end_line_number;
    json["endColumn"] = selection.end_column;
    return json;
}

bool read_int(const Json::Value& obj, const char* key, int& out) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isInt()) return false;
    out = obj[key].asInt();
    return true;
}

std::optional<CursorPosition> position_from_json(const Json::Value& json) {
    CursorPosition position;
    if (!read_int(json, "lineNumber", position.line_number) ||
        !read_int(json, "column", position.column)) {
        return std::nullopt;
    }
    return position;
}

std::optional<Selection> selection_from_json(const Json::Value& json) {
    Selection selection;
    if (!read_int(json, "startLineNumber", selection.start_line_number) ||
        !read_int(json, "startColumn", selection.start_column) ||
        !read_int(json, "endLineNumber", selection.end_line_number) ||
        !read_int(json, "endColumn", selection.end_column)) {
        return std::nullopt;
    }
    return selection;
}

std::vector<Participant> participants_from_json(const Json::Value& list) {
    std::vector<Participant> participants;
    if (!list.isArray()) return participants;
    for (const auto& item : list) {
        Participant p;
        p.connection_id = item.get("id", "").asString();
        p.display_name = item.get("displayName", "").asString();
        p.joined_at = from_epoch_ms(item.get("joinedAt", 0).asInt64());
        p.state = ParticipantState::JOINED;
        participants.push_back(p);
    }
    return participants;
}

} // namespace

std::string event_name(EventType type) {
    switch (type) {
        case EventType::SESSION_STATE: return "session-state";
        case EventType::USER_JOINED: return "user-joined";
        case EventType::USER_LEFT: return "user-left";
        case EventType::REMOTE_CURSOR: return "remote-cursor";
        case EventType::LANGUAGE_CHANGED: return "language-changed";
        case EventType::USERNAME_CHANGED: return "username-changed";
        case EventType::ERROR: return "error";
    }
    return "error";
}

std::optional<EventType> parse_event_name(const std::string& name) {
    if (name == "session-state") return EventType::SESSION_STATE;
    if (name == "user-joined") return EventType::USER_JOINED;
    if (name == "user-left") return EventType::USER_LEFT;
    if (name == "remote-cursor") return EventType::REMOTE_CURSOR;
    if (name == "language-changed") return EventType::LANGUAGE_CHANGED;
    if (name == "username-changed") return EventType::USERNAME_CHANGED;
    if (name == "error") return EventType::ERROR;
    return std::nullopt;
}

Json::Value session_to_json(const Session& session) {
    Json::Value json;
    json["id"] = session.id;
    json["language"] = language_name(session.language);
    json["createdAt"] = static_cast<Json::Int64>(to_epoch_ms(session.created_at));
    json["expiresAt"] = session.expires_at
        ? Json::Value(static_cast<Json::Int64>(to_epoch_ms(*session.expires_at)))
        : Json::Value();
    return json;
}

std::string to_compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

bool parse_json(const std::string& text, Json::Value& out, std::string& error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), &out, &error);
}

Json::Value event_to_json(const PresenceEvent& event) {
    Json::Value data(Json::objectValue);

    switch (event.type) {
        case EventType::SESSION_STATE:
            if (event.session) {
                data = session_to_json(*event.session);
            }
            break;
        case EventType::USER_JOINED:
        case EventType::USERNAME_CHANGED:
            data["participantId"] = event.participant_id;
            data["displayName"] = event.display_name;
            data["participants"] = participants_to_json(event.participants);
            break;
        case EventType::USER_LEFT:
            data["participantId"] = event.participant_id;
            data["participants"] = participants_to_json(event.participants);
            break;
        case EventType::REMOTE_CURSOR:
            data["participantId"] = event.participant_id;
            data["position"] = position_to_json(event.position.value_or(CursorPosition()));
            if (event.selection) {
                data["selection"] = selection_to_json(*event.selection);
            }
            break;
        case EventType::LANGUAGE_CHANGED:
            data["participantId"] = event.participant_id;
            if (event.language) {
                data["language"] = language_name(*event.language);
            }
            break;
        case EventType::ERROR:
            data["message"] = event.message;
            break;
    }

    Json::Value json;
    json["event"] = event_name(event.type);
    json["data"] = data;
    return json;
}

std::string encode_event(const PresenceEvent& event) {
    return to_compact_json(event_to_json(event));
}

PresenceEvent event_from_json(const Json::Value& json) {
    if (!json.isObject() || !json["event"].isString()) {
        throw std::runtime_error("Event is missing its name");
    }
    auto type = parse_event_name(json["event"].asString());
    if (!type) {
        throw std::runtime_error("Unknown event: " + json["event"].asString());
    }

    const Json::Value& data = json["data"];
    PresenceEvent event;
    event.type = *type;
    event.participant_id = data.get("participantId", "").asString();
    event.display_name = data.get("displayName", "").asString();
    event.participants = participants_from_json(data["participants"]);
    event.message = data.get("message", "").asString();

    if (data.isMember("position")) {
        event.position = position_from_json(data["position"]);
    }
    if (data.isMember("selection")) {
        event.selection = selection_from_json(data["selection"]);
    }
    if (*type == EventType::LANGUAGE_CHANGED) {
        event.language = parse_language(data.get("language", "").asString());
        if (!event.language) {
            throw std::runtime_error("language-changed without a supported language");
        }
    }
    if (*type == EventType::SESSION_STATE) {
        Session session;
        session.id = data.get("id", "").asString();
        session.language = parse_language(data.get("language", "").asString())
                               .value_or(Language::JAVASCRIPT);
        session.created_at = from_epoch_ms(data.get("createdAt", 0).asInt64());
        if (data["expiresAt"].isIntegral()) {
            session.expires_at = from_epoch_ms(data["expiresAt"].asInt64());
        }
        event.session_id = session.id;
        event.session = session;
    }
    return event;
}

std::optional<ClientMessage> parse_client_message(const std::string& text, std::string& error) {
    Json::Value json;
    if (!parse_json(text, json, error)) {
        error = "Invalid JSON: " + error;
        return std::nullopt;
    }
    if (!json.isObject() || !json["event"].isString() || !json["data"].isObject()) {
        error = "Expected {\"event\": string, \"data\": object}";
        return std::nullopt;
    }

    const std::string name = json["event"].asString();
    const Json::Value& data = json["data"];

    ClientMessage message;
    if (name == "join-session") {
        message.type = ClientEventType::JOIN_SESSION;
    } else if (name == "cursor-change") {
        message.type = ClientEventType::CURSOR_CHANGE;
    } else if (name == "language-change") {
        message.type = ClientEventType::LANGUAGE_CHANGE;
    } else if (name == "username-change") {
        message.type = ClientEventType::USERNAME_CHANGE;
    } else {
        error = "Unknown event: " + name;
        return std::nullopt;
    }

    if (!data["sessionId"].isString() || data["sessionId"].asString().empty()) {
        error = "sessionId is required";
        return std::nullopt;
    }
    message.session_id = data["sessionId"].asString();

    switch (message.type) {
        case ClientEventType::JOIN_SESSION:
            if (data.isMember("displayName") && !data["displayName"].isNull()) {
                if (!data["displayName"].isString()) {
                    error = "displayName must be a string";
                    return std::nullopt;
                }
                message.display_name = data["displayName"].asString();
            }
            break;
        case ClientEventType::CURSOR_CHANGE: {
            auto position = position_from_json(data["position"]);
            if (!position) {
                error = "position requires integer lineNumber and column";
                return std::nullopt;
            }
            message.position = *position;
            if (data.isMember("selection") && !data["selection"].isNull()) {
                message.selection = selection_from_json(data["selection"]);
                if (!message.selection) {
                    error = "selection requires integer start and end coordinates";
                    return std::nullopt;
                }
            }
            break;
        }
        case ClientEventType::LANGUAGE_CHANGE:
            if (!data["language"].isString()) {
                error = "language is required";
                return std::nullopt;
            }
            message.language = data["language"].asString();
            break;
        case ClientEventType::USERNAME_CHANGE:
            if (!data["displayName"].isString()) {
                error = "displayName is required";
                return std::nullopt;
            }
            message.display_name = data["displayName"].asString();
            break;
    }
    return message;
}

std::string encode_bus_message(const BusMessage& message) {
    Json::Value json = event_to_json(message.event);
    json["origin"] = message.origin_node;
    json["sessionId"] = message.event.session_id;
    return to_compact_json(json);
}

std::optional<BusMessage> decode_bus_message(const std::string& text) {
    Json::Value json;
    std::string error;
    if (!parse_json(text, json, error) || !json.isObject()) {
        return std::nullopt;
    }
    if (!json["origin"].isString() || !json["sessionId"].isString()) {
        return std::nullopt;
    }

    BusMessage message;
    message.origin_node = json["origin"].asString();
    try {
        message.event = event_from_json(json);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    message.event.session_id = json["sessionId"].asString();
    return message;
}

} // namespace codepair
