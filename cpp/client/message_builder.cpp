#include "message_builder.hpp"

namespace chat_client {

ChatRequestMessage MessageBuilder::create_request(const ChatSettings& settings, const std::string& text) {
    const AgentSettings& agent = settings.agent;

    ChatRequestMessage request;
    request.user_id = settings.user_id;
    request.message = text;
    request.configuration.provider = agent.provider;
    request.configuration.model_name = agent.model_name;
    request.configuration.system_prompt = agent.system_prompt;
    request.configuration.temperature = agent.temperature;
    request.configuration.max_tokens = agent.max_tokens;
    request.configuration.personality.name = agent.personality.name;
    request.configuration.personality.description = agent.personality.description;
    request.configuration.personality.traits = agent.personality.traits;
    request.configuration.personality.mood = agent.personality.mood;
    request.context = settings.context;
    request.stream_audio = settings.audio_enabled;
    request.voice_id = agent.voice_id;
    return request;
}

} // namespace chat_client
