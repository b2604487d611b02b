#include "chat_events.hpp"

namespace chat_client {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "Disconnected";
        case ConnectionState::CONNECTING: return "Connecting";
        case ConnectionState::CONNECTED: return "Connected";
        case ConnectionState::RECONNECTING: return "Reconnecting";
        default: return "Unknown";
    }
}

const char* to_string(ChatEventType type) {
    switch (type) {
        case ChatEventType::TEXT_CHUNK_RECEIVED: return "TextChunkReceived";
        case ChatEventType::AUDIO_CHUNK_RECEIVED: return "AudioChunkReceived";
        case ChatEventType::RESPONSE_COMPLETED: return "ResponseCompleted";
        case ChatEventType::RESPONSE_INTERRUPTED: return "ResponseInterrupted";
        case ChatEventType::ERROR_OCCURRED: return "ErrorOccurred";
        case ChatEventType::CONNECTION_STATE_CHANGED: return "ConnectionStateChanged";
        case ChatEventType::STATUS_MESSAGE_RECEIVED: return "StatusMessageReceived";
        default: return "Unknown";
    }
}

ChatEvent ChatEvent::text_chunk(std::string chunk) {
    ChatEvent event;
    event.type = ChatEventType::TEXT_CHUNK_RECEIVED;
    event.text = std::move(chunk);
    return event;
}

ChatEvent ChatEvent::audio_chunk(std::vector<uint8_t> data) {
    ChatEvent event;
    event.type = ChatEventType::AUDIO_CHUNK_RECEIVED;
    event.audio = std::move(data);
    return event;
}

ChatEvent ChatEvent::response_completed() {
    ChatEvent event;
    event.type = ChatEventType::RESPONSE_COMPLETED;
    return event;
}

ChatEvent ChatEvent::response_interrupted() {
    ChatEvent event;
    event.type = ChatEventType::RESPONSE_INTERRUPTED;
    return event;
}

ChatEvent ChatEvent::error(std::string message) {
    ChatEvent event;
    event.type = ChatEventType::ERROR_OCCURRED;
    event.message = std::move(message);
    return event;
}

ChatEvent ChatEvent::connection_state_changed(ConnectionState state) {
    ChatEvent event;
    event.type = ChatEventType::CONNECTION_STATE_CHANGED;
    event.state = state;
    return event;
}

ChatEvent ChatEvent::status_message(std::string message) {
    ChatEvent event;
    event.type = ChatEventType::STATUS_MESSAGE_RECEIVED;
    event.message = std::move(message);
    return event;
}

} // namespace chat_client
