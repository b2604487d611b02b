#pragma once
#include "chat_events.hpp"
#include <optional>
#include <string>

namespace chat_client {

/**
 * Maps one inbound JSON message to a ChatEvent by its "type" field.
 * Unknown types, malformed JSON and audio chunks without a decodable payload
 * yield std::nullopt. Never throws.
 */
class MessageParser {
public:
    static std::optional<ChatEvent> parse(const std::string& json);
};

} // namespace chat_client
