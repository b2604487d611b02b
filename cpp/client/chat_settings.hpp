#pragma once
#include <map>
#include <string>

namespace config {
class ProcessConfigManager;
}

namespace chat_client {

struct PersonalitySettings {
    std::string name{"Homunculy"};
    std::string description{"A friendly AI assistant"};
    std::map<std::string, std::string> traits;
    std::string mood{"cheerful"};
};

// Agent configuration sent with every request
struct AgentSettings {
    std::string provider;
    std::string model_name;
    std::string voice_id;
    double temperature{0.7};
    int max_tokens{500};
    std::string system_prompt;
    PersonalitySettings personality;
};

struct ChatSettings {
    std::string server_uri;
    std::string user_id;
    bool audio_enabled{true};
    AgentSettings agent;
    std::map<std::string, std::string> context;

    static ChatSettings defaults();

    // Reads [server], [agent] and [audio] enabled on top of defaults()
    static ChatSettings from_config(const config::ProcessConfigManager& config);
};

} // namespace chat_client
