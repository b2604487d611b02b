#include "websocket_transport.hpp"
#include "libuv_websocket_transport.hpp"

namespace websocket_transport {

const char* to_string(WebSocketState state) {
    switch (state) {
        case WebSocketState::DISCONNECTED: return "DISCONNECTED";
        case WebSocketState::CONNECTING: return "CONNECTING";
        case WebSocketState::CONNECTED: return "CONNECTED";
        case WebSocketState::CLOSING: return "CLOSING";
        case WebSocketState::CLOSED: return "CLOSED";
        case WebSocketState::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::shared_ptr<IWebSocketTransport> WebSocketTransportFactory::create() {
    return std::make_shared<LibuvWebSocketTransport>();
}

TransportFactory WebSocketTransportFactory::default_factory() {
    return []() { return create(); };
}

} // namespace websocket_transport
