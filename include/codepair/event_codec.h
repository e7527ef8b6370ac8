#pragma once

#include <string>
#include <optional>
#include <json/json.h>
#include "codepair/broadcast_bus.h"
#include "codepair/presence_event.h"

namespace codepair {

enum class ClientEventType {
    JOIN_SESSION,
    CURSOR_CHANGE,
    LANGUAGE_CHANGE,
    USERNAME_CHANGE
};

// One decoded client-to-server WebSocket message
struct ClientMessage {
    ClientEventType type = ClientEventType::JOIN_SESSION;
    std::string session_id;
    std::string display_name;
    std::string language;
    CursorPosition position;
    std::optional<Selection> selection;
};

// Wire form {"event": name, "data": {...}} of server-to-client events
Json::Value event_to_json(const PresenceEvent& event);
std::string encode_event(const PresenceEvent& event);

// Inverse of event_to_json. Throws std::runtime_error on malformed input.
PresenceEvent event_from_json(const Json::Value& json);

// Returns nullopt and fills `error` for anything that is not a well-formed
// client event
std::optional<ClientMessage> parse_client_message(const std::string& text, std::string& error);

// Bus envelope adds origin and session id to the wire event
std::string encode_bus_message(const BusMessage& message);
std::optional<BusMessage> decode_bus_message(const std::string& text);

// {id, language, createdAt, expiresAt}
Json::Value session_to_json(const Session& session);

std::string to_compact_json(const Json::Value& value);
bool parse_json(const std::string& text, Json::Value& out, std::string& error);

} // namespace codepair
