#include "chat_request_message.hpp"
#include "../utils/constants.hpp"

namespace chat_client {

namespace {

Json::Value to_object(const std::map<std::string, std::string>& values) {
    Json::Value object(Json::objectValue);
    for (const auto& entry : values) {
        object[entry.first] = entry.second;
    }
    return object;
}

} // namespace

Json::Value ChatRequestMessage::to_json() const {
    Json::Value root;
    root["type"] = constants::message_type::CHAT_REQUEST;
    root["user_id"] = user_id;
    root["message"] = message;

    Json::Value personality;
    personality["name"] = configuration.personality.name;
    personality["description"] = configuration.personality.description;
    personality["traits"] = to_object(configuration.personality.traits);
    personality["mood"] = configuration.personality.mood;

    Json::Value agent;
    agent["provider"] = configuration.provider;
    agent["model_name"] = configuration.model_name;
    agent["system_prompt"] = configuration.system_prompt;
    agent["temperature"] = configuration.temperature;
    agent["max_tokens"] = configuration.max_tokens;
    agent["personality"] = personality;

    root["configuration"] = agent;
    root["context"] = to_object(context);
    root["stream_audio"] = stream_audio;
    if (!voice_id.empty()) {
        root["voice_id"] = voice_id;
    }
    return root;
}

std::string ChatRequestMessage::to_json_string() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, to_json());
}

} // namespace chat_client
