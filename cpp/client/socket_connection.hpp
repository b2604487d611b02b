#pragma once
#include "websocket_config.hpp"
#include "../utils/cancellation/cancellation.hpp"
#include "../websocket/websocket_transport.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace chat_client {

/**
 * Owns at most one physical transport at a time.
 *
 * connect() disposes the previous transport before building a new one, so a
 * SocketConnection never holds two live sockets. Each transport gets its own
 * lifetime token, cancelled by dispose(), which every read and write on that
 * transport should observe.
 */
class SocketConnection {
public:
    SocketConnection(const WebSocketConfig& config, websocket_transport::TransportFactory factory);
    ~SocketConnection();

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    // Throws ChatError: CONNECT_TIMEOUT, OPERATION_CANCELLED or CONNECTION_FAILED
    void connect(const std::string& uri, const cancellation::CancellationToken& cancel);

    // Graceful close handshake; failures are logged and swallowed
    void close();

    // Cancels in-flight work, closes if open and releases the transport
    void dispose();

    bool is_open() const;
    std::shared_ptr<websocket_transport::IWebSocketTransport> transport() const;
    cancellation::CancellationToken token() const;

private:
    WebSocketConfig config_;
    websocket_transport::TransportFactory factory_;

    mutable std::mutex mutex_;
    std::shared_ptr<websocket_transport::IWebSocketTransport> transport_;
    std::shared_ptr<cancellation::CancellationSource> lifetime_;
};

} // namespace chat_client
