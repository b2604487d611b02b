#pragma once
#include "socket_connection.hpp"
#include <memory>
#include <optional>
#include <string>

namespace chat_client {

/**
 * Lazy, pull-based sequence of complete messages read from one transport.
 *
 * next() blocks until a message is complete. It returns std::nullopt once the
 * stream has completed: close frame, cancellation, or a connection that was
 * not open. Any other transport failure is thrown as ChatError(RECEIVE_FAILED)
 * and also completes the stream. A completed stream cannot be restarted.
 */
class ReceiveStream {
public:
    ReceiveStream(std::shared_ptr<websocket_transport::IWebSocketTransport> transport,
                  std::unique_ptr<cancellation::CancellationSource> cancel,
                  size_t chunk_size);

    ReceiveStream(ReceiveStream&&) = default;
    ReceiveStream& operator=(ReceiveStream&&) = default;

    std::optional<std::string> next();
    bool is_completed() const { return completed_; }

private:
    std::optional<std::string> complete();

    std::shared_ptr<websocket_transport::IWebSocketTransport> transport_;
    std::unique_ptr<cancellation::CancellationSource> cancel_;
    size_t chunk_size_;
    std::string buffer_;
    bool completed_{false};
};

// Reassembles transport frame slices into logical messages
class SocketReceiver {
public:
    explicit SocketReceiver(size_t chunk_size);

    // The stream also ends when the connection's lifetime token fires
    ReceiveStream create_receive_stream(const SocketConnection& connection,
                                        const cancellation::CancellationToken& cancel) const;

    // Single message read for handshake-style exchanges. A close frame throws
    // ChatError(TRANSPORT_CLOSED_DURING_READ), cancellation ChatError(OPERATION_CANCELLED).
    std::string receive_one(const SocketConnection& connection,
                            const cancellation::CancellationToken& cancel) const;

private:
    size_t chunk_size_;
};

} // namespace chat_client
