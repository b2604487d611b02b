#include "chat_settings.hpp"
#include "../utils/config/process_config_manager.hpp"
#include "../utils/constants.hpp"

namespace chat_client {

namespace {

const char* DEFAULT_SYSTEM_PROMPT =
    "You are Homunculy, a friendly AI assistant. "
    "Respond directly to the user's message. Be concise. "
    "Never summarize previous conversations. "
    "If interrupted, just respond to the new message naturally.";

} // namespace

ChatSettings ChatSettings::defaults() {
    ChatSettings settings;
    settings.server_uri = constants::chat::DEFAULT_SERVER_URI;
    settings.user_id = constants::chat::DEFAULT_USER_ID;
    settings.audio_enabled = true;
    settings.agent.provider = constants::chat::DEFAULT_PROVIDER;
    settings.agent.model_name = constants::chat::DEFAULT_MODEL;
    settings.agent.voice_id = constants::chat::DEFAULT_VOICE_ID;
    settings.agent.temperature = constants::chat::DEFAULT_TEMPERATURE;
    settings.agent.max_tokens = constants::chat::DEFAULT_MAX_TOKENS;
    settings.agent.system_prompt = DEFAULT_SYSTEM_PROMPT;
    return settings;
}

ChatSettings ChatSettings::from_config(const config::ProcessConfigManager& config) {
    ChatSettings settings = defaults();

    settings.server_uri = config.get_string("server", "uri", settings.server_uri);
    settings.user_id = config.get_string("server", "user_id", settings.user_id);
    settings.audio_enabled = config.get_bool("audio", "enabled", settings.audio_enabled);

    AgentSettings& agent = settings.agent;
    agent.provider = config.get_string("agent", "provider", agent.provider);
    agent.model_name = config.get_string("agent", "model_name", agent.model_name);
    agent.voice_id = config.get_string("agent", "voice_id", agent.voice_id);
    agent.temperature = config.get_double("agent", "temperature", agent.temperature);
    agent.max_tokens = config.get_int("agent", "max_tokens", agent.max_tokens);
    agent.system_prompt = config.get_string("agent", "system_prompt", agent.system_prompt);
    agent.personality.name = config.get_string("agent", "personality_name", agent.personality.name);
    agent.personality.description = config.get_string("agent", "personality_description",
                                                      agent.personality.description);
    agent.personality.mood = config.get_string("agent", "personality_mood", agent.personality.mood);

    // trait.<name> = value
    for (const auto& key : config.get_keys("agent")) {
        if (key.rfind("trait.", 0) == 0 && key.size() > 6) {
            agent.personality.traits[key.substr(6)] = config.get_string("agent", key);
        }
    }
    return settings;
}

} // namespace chat_client
