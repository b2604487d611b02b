#pragma once

/**
 * System-wide constants
 *
 * Centralized location for magic numbers and protocol constants
 * used throughout the chat transport client.
 */

#include <cstddef>

namespace constants {

// Timeouts (in milliseconds unless otherwise specified)
namespace timeout {
    constexpr int CONNECT_MS = 30000;                     // 30 seconds
    constexpr int PING_INTERVAL_MS = 15000;               // mobile profile
    constexpr int STABLE_PING_INTERVAL_MS = 30000;        // stable profile
    constexpr int KEEP_ALIVE_MS = 30000;
    constexpr int STABLE_KEEP_ALIVE_MS = 60000;
    constexpr int PONG_MS = 10000;
    constexpr int CLOSE_HANDSHAKE_MS = 2000;
    constexpr int HTTP_MS = 10000;
}

// Reconnect backoff
namespace retry {
    constexpr int BASE_DELAY_MS = 1000;                   // 1 second
    constexpr int MAX_DELAY_MS = 30000;                   // 30 seconds
    constexpr int MAX_EXPONENT = 10;                      // 2^10 growth cap
    constexpr double JITTER_FRACTION = 0.3;               // up to +30%
    constexpr int STABLE_MAX_ATTEMPTS = 10;
}

// WebSocket protocol
namespace websocket {
    constexpr const char* ACCEPT_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    constexpr size_t RECEIVE_BUFFER_SIZE = 8192;
    constexpr size_t MAX_HANDSHAKE_BYTES = 16384;
    constexpr size_t MAX_MESSAGE_BYTES = 16 * 1024 * 1024;
    constexpr unsigned short CLOSE_NORMAL = 1000;
    constexpr unsigned short CLOSE_GOING_AWAY = 1001;
    constexpr unsigned short CLOSE_PROTOCOL_ERROR = 1002;
}

// Chat wire protocol discriminators
namespace message_type {
    constexpr const char* CHAT_REQUEST = "chat_request";
    constexpr const char* TEXT_CHUNK = "text_chunk";
    constexpr const char* AUDIO_CHUNK = "audio_chunk";
    constexpr const char* COMPLETE = "complete";
    constexpr const char* INTERRUPTED = "interrupted";
    constexpr const char* ERROR = "error";
    constexpr const char* CONNECTION_STATUS = "connection_status";
}

// Audio output
namespace audio {
    constexpr int SAMPLE_RATE = 24000;
    constexpr int CHANNELS = 1;
    constexpr int BITS_PER_SAMPLE = 16;
}

// Chat defaults
namespace chat {
    constexpr const char* DEFAULT_SERVER_URI = "ws://localhost:8000/api/v1/ws/chat";
    constexpr const char* DEFAULT_USER_ID = "User";
    constexpr const char* DEFAULT_PROVIDER = "langraph";
    constexpr const char* DEFAULT_MODEL = "gpt-4o-mini";
    constexpr const char* DEFAULT_VOICE_ID = "lhTvHflPVOqgSWyuWQry";
    constexpr double DEFAULT_TEMPERATURE = 0.7;
    constexpr int DEFAULT_MAX_TOKENS = 500;
}

} // namespace constants
