#include "message_parser.hpp"
#include "../utils/constants.hpp"
#include "../utils/encoding/base64.hpp"
#include "../utils/logging/log_helper.hpp"
#include <json/json.h>

namespace chat_client {

namespace {

std::string string_field(const Json::Value& root, const char* name) {
    const Json::Value& value = root[name];
    return value.isString() ? value.asString() : std::string();
}

} // namespace

std::optional<ChatEvent> MessageParser::parse(const std::string& json) {
    try {
        Json::Value root;
        Json::Reader reader;

        if (!reader.parse(json, root) || !root.isObject()) {
            LOG_DEBUG_COMP("MESSAGE_PARSER", "Dropping malformed message");
            return std::nullopt;
        }

        const Json::Value& type_value = root["type"];
        if (!type_value.isString()) {
            LOG_DEBUG_COMP("MESSAGE_PARSER", "Dropping message without type");
            return std::nullopt;
        }
        const std::string type = type_value.asString();

        if (type == constants::message_type::TEXT_CHUNK) {
            return ChatEvent::text_chunk(string_field(root, "chunk"));
        }
        if (type == constants::message_type::AUDIO_CHUNK) {
            std::string data = string_field(root, "data");
            if (data.empty()) {
                return std::nullopt;
            }
            auto bytes = encoding::base64_decode(data);
            if (!bytes || bytes->empty()) {
                LOG_DEBUG_COMP("MESSAGE_PARSER", "Dropping audio chunk with invalid payload");
                return std::nullopt;
            }
            return ChatEvent::audio_chunk(std::move(*bytes));
        }
        if (type == constants::message_type::COMPLETE) {
            return ChatEvent::response_completed();
        }
        if (type == constants::message_type::INTERRUPTED) {
            return ChatEvent::response_interrupted();
        }
        if (type == constants::message_type::ERROR) {
            return ChatEvent::error(string_field(root, "message"));
        }
        if (type == constants::message_type::CONNECTION_STATUS) {
            return ChatEvent::status_message(string_field(root, "message"));
        }

        LOG_DEBUG_COMP("MESSAGE_PARSER", "Ignoring unknown message type: " + type);
    } catch (const std::exception& e) {
        LOG_DEBUG_COMP("MESSAGE_PARSER", "Failed to parse message: " + std::string(e.what()));
    }
    return std::nullopt;
}

} // namespace chat_client
