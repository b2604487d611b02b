#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chat_client {

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING
};

const char* to_string(ConnectionState state);

enum class ChatEventType {
    TEXT_CHUNK_RECEIVED,
    AUDIO_CHUNK_RECEIVED,
    RESPONSE_COMPLETED,
    RESPONSE_INTERRUPTED,
    ERROR_OCCURRED,
    CONNECTION_STATE_CHANGED,
    STATUS_MESSAGE_RECEIVED
};

const char* to_string(ChatEventType type);

/**
 * Everything the transport layer reports upwards. Only the fields relevant
 * to the event type are populated.
 */
struct ChatEvent {
    ChatEventType type{ChatEventType::STATUS_MESSAGE_RECEIVED};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::string text;                // TEXT_CHUNK_RECEIVED
    std::vector<uint8_t> audio;      // AUDIO_CHUNK_RECEIVED
    std::string message;             // ERROR_OCCURRED, STATUS_MESSAGE_RECEIVED
    ConnectionState state{ConnectionState::DISCONNECTED};  // CONNECTION_STATE_CHANGED

    static ChatEvent text_chunk(std::string chunk);
    static ChatEvent audio_chunk(std::vector<uint8_t> data);
    static ChatEvent response_completed();
    static ChatEvent response_interrupted();
    static ChatEvent error(std::string message);
    static ChatEvent connection_state_changed(ConnectionState state);
    static ChatEvent status_message(std::string message);
};

} // namespace chat_client
