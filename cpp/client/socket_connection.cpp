#include "socket_connection.hpp"
#include "chat_error.hpp"
#include "../utils/constants.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"

namespace chat_client {

using websocket_transport::IWebSocketTransport;

SocketConnection::SocketConnection(const WebSocketConfig& config, websocket_transport::TransportFactory factory)
    : config_(config), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = websocket_transport::WebSocketTransportFactory::default_factory();
    }
}

SocketConnection::~SocketConnection() {
    dispose();
}

void SocketConnection::connect(const std::string& uri, const cancellation::CancellationToken& cancel) {
    dispose();

    std::shared_ptr<IWebSocketTransport> transport = factory_();
    if (!transport) {
        throw ChatError(ErrorCode::CONNECTION_FAILED, "Transport factory returned no transport");
    }
    auto lifetime = std::make_shared<cancellation::CancellationSource>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_ = transport;
        lifetime_ = lifetime;
    }

    cancellation::CancellationSource timeout;
    timeout.cancel_after(config_.connect_timeout());
    auto linked = cancellation::CancellationSource::create_linked(
        {cancel, lifetime->token(), timeout.token()});

    websocket_transport::ConnectOptions options;
    options.keep_alive_interval = config_.keep_alive_interval();
    options.pong_timeout = config_.pong_timeout();

    LOG_INFO_COMP("SOCKET_CONNECTION", "Connecting to " + uri);

    auto release = [this, &transport]() {
        transport->abort();
        std::lock_guard<std::mutex> lock(mutex_);
        if (transport_ == transport) {
            transport_.reset();
            lifetime_.reset();
        }
    };

    try {
        transport->connect(uri, options, linked->token());
    } catch (const cancellation::OperationCancelledError&) {
        release();
        if (timeout.is_cancellation_requested() && !cancel.is_cancellation_requested() &&
            !lifetime->is_cancellation_requested()) {
            LOG_WARN_COMP("SOCKET_CONNECTION", "Connect timed out after " +
                          std::to_string(config_.connect_timeout().count()) + "ms");
            throw ChatError(ErrorCode::CONNECT_TIMEOUT, "Connection timed out after " +
                            std::to_string(config_.connect_timeout().count()) + "ms");
        }
        throw ChatError(ErrorCode::OPERATION_CANCELLED, "Connect was cancelled");
    } catch (const websocket_transport::TransportError& e) {
        release();
        if (linked->is_cancellation_requested()) {
            if (timeout.is_cancellation_requested() && !cancel.is_cancellation_requested()) {
                throw ChatError(ErrorCode::CONNECT_TIMEOUT, "Connection timed out: " + std::string(e.what()));
            }
            throw ChatError(ErrorCode::OPERATION_CANCELLED, "Connect was cancelled");
        }
        LOG_WARN_COMP("SOCKET_CONNECTION", "Connect failed: " + std::string(e.what()));
        throw ChatError(ErrorCode::CONNECTION_FAILED, e.what());
    }

    // dispose() may have run while the handshake was finishing
    if (lifetime->is_cancellation_requested()) {
        release();
        throw ChatError(ErrorCode::OPERATION_CANCELLED, "Connection was disposed while connecting");
    }

    LOG_INFO_COMP("SOCKET_CONNECTION", "Connected to " + uri);
}

void SocketConnection::close() {
    std::shared_ptr<IWebSocketTransport> transport = this->transport();
    if (!transport || !transport->is_open()) {
        return;
    }
    error_handling::safe_execute_void([&]() {
        transport->close(constants::websocket::CLOSE_NORMAL, "Closing");
    }, "SOCKET_CONNECTION", "close");
}

void SocketConnection::dispose() {
    std::shared_ptr<IWebSocketTransport> transport;
    std::shared_ptr<cancellation::CancellationSource> lifetime;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport.swap(transport_);
        lifetime.swap(lifetime_);
    }

    if (lifetime) {
        lifetime->cancel();
    }
    if (!transport) {
        return;
    }

    error_handling::safe_execute_void([&]() {
        if (transport->is_open()) {
            transport->close(constants::websocket::CLOSE_NORMAL, "Closing");
        }
        transport->abort();
    }, "SOCKET_CONNECTION", "dispose");
    LOG_DEBUG_COMP("SOCKET_CONNECTION", "Transport disposed");
}

bool SocketConnection::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_ && transport_->is_open();
}

std::shared_ptr<IWebSocketTransport> SocketConnection::transport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_;
}

cancellation::CancellationToken SocketConnection::token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lifetime_ ? lifetime_->token() : cancellation::CancellationToken::none();
}

} // namespace chat_client
