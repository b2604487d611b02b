#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include "../utils/cancellation/cancellation.hpp"

namespace websocket_transport {

// WebSocket connection states
enum class WebSocketState {
    DISCONNECTED,   // never connected
    CONNECTING,
    CONNECTED,
    CLOSING,
    CLOSED,
    ERROR
};

const char* to_string(WebSocketState state);

// Raised for handshake, protocol and socket failures
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

struct ConnectOptions {
    // Ping cadence; zero disables keep-alive
    std::chrono::milliseconds keep_alive_interval{30000};
    // Silence after a ping that fails the connection
    std::chrono::milliseconds pong_timeout{10000};
    std::map<std::string, std::string> headers;
    bool verify_tls{true};
};

// One slice of an inbound message
struct ReceiveResult {
    std::string data;
    bool end_of_message{true};
    bool is_close{false};
    bool is_binary{false};
};

/**
 * One physical WebSocket connection.
 *
 * Instances are single use: connect() once, then receive/send until the
 * connection closes or fails. Blocking calls honour the cancellation token
 * and throw cancellation::OperationCancelledError when it fires.
 */
class IWebSocketTransport {
public:
    virtual ~IWebSocketTransport() = default;

    // Throws TransportError on failure. A failed or cancelled connect leaves
    // no socket behind.
    virtual void connect(const std::string& url, const ConnectOptions& options,
                         const cancellation::CancellationToken& cancel) = 0;

    // Blocks for the next frame slice of at most max_bytes (0 means no limit).
    // A close frame is reported with is_close set; other failures throw TransportError.
    virtual ReceiveResult receive(size_t max_bytes, const cancellation::CancellationToken& cancel) = 0;

    // Returns once the frame has been written to the socket
    virtual void send_text(const std::string& text, const cancellation::CancellationToken& cancel) = 0;

    // Graceful close handshake followed by teardown. Never throws.
    virtual void close(uint16_t code, const std::string& reason) = 0;

    // Immediate teardown. Never throws, idempotent.
    virtual void abort() = 0;

    virtual WebSocketState get_state() const = 0;
    virtual bool is_open() const = 0;
};

} // namespace websocket_transport
