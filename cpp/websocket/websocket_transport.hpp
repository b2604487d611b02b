#pragma once
#include "i_websocket_transport.hpp"
#include <functional>
#include <memory>

namespace websocket_transport {

// Builds a fresh, unconnected transport; injected so tests can script the wire
using TransportFactory = std::function<std::shared_ptr<IWebSocketTransport>()>;

// Transport factory
class WebSocketTransportFactory {
public:
    /**
     * Create a WebSocket transport implementation
     * @return A fresh, unconnected libuv transport
     */
    static std::shared_ptr<IWebSocketTransport> create();

    static TransportFactory default_factory();
};

} // namespace websocket_transport
