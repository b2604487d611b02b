#pragma once
#include <json/json.h>
#include <map>
#include <string>

namespace chat_client {

struct PersonalityPayload {
    std::string name;
    std::string description;
    std::map<std::string, std::string> traits;
    std::string mood;
};

struct AgentConfigurationPayload {
    std::string provider;
    std::string model_name;
    std::string system_prompt;
    double temperature{0.7};
    int max_tokens{500};
    PersonalityPayload personality;
};

/**
 * Outgoing chat request. Always carries the complete agent configuration;
 * the server keeps no per-session agent state.
 */
struct ChatRequestMessage {
    std::string user_id;
    std::string message;
    AgentConfigurationPayload configuration;
    std::map<std::string, std::string> context;
    bool stream_audio{true};
    std::string voice_id;  // omitted from the wire when empty

    Json::Value to_json() const;
    std::string to_json_string() const;
};

} // namespace chat_client
