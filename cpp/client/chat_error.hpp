#pragma once
#include <stdexcept>
#include <string>

namespace chat_client {

enum class ErrorCode {
    CONNECT_TIMEOUT,               // handshake exceeded connect_timeout
    CONNECTION_FAILED,
    TRANSPORT_CLOSED_DURING_READ,  // one-shot read hit a close frame
    SEND_WHILE_DISCONNECTED,
    SEND_FAILED,
    RECEIVE_FAILED,
    OPERATION_CANCELLED,
    PLAYBACK_ADAPTER_ERROR,
    TOKEN_REQUEST_FAILED
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECT_TIMEOUT: return "CONNECT_TIMEOUT";
        case ErrorCode::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case ErrorCode::TRANSPORT_CLOSED_DURING_READ: return "TRANSPORT_CLOSED_DURING_READ";
        case ErrorCode::SEND_WHILE_DISCONNECTED: return "SEND_WHILE_DISCONNECTED";
        case ErrorCode::SEND_FAILED: return "SEND_FAILED";
        case ErrorCode::RECEIVE_FAILED: return "RECEIVE_FAILED";
        case ErrorCode::OPERATION_CANCELLED: return "OPERATION_CANCELLED";
        case ErrorCode::PLAYBACK_ADAPTER_ERROR: return "PLAYBACK_ADAPTER_ERROR";
        case ErrorCode::TOKEN_REQUEST_FAILED: return "TOKEN_REQUEST_FAILED";
        default: return "UNKNOWN";
    }
}

class ChatError : public std::runtime_error {
public:
    ChatError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace chat_client
