#include "socket_receiver.hpp"
#include "chat_error.hpp"
#include "../utils/logging/log_helper.hpp"

namespace chat_client {

ReceiveStream::ReceiveStream(std::shared_ptr<websocket_transport::IWebSocketTransport> transport,
                             std::unique_ptr<cancellation::CancellationSource> cancel,
                             size_t chunk_size)
    : transport_(std::move(transport)), cancel_(std::move(cancel)), chunk_size_(chunk_size) {
    if (!transport_ || !transport_->is_open()) {
        completed_ = true;
    }
}

std::optional<std::string> ReceiveStream::next() {
    if (completed_) {
        return std::nullopt;
    }

    cancellation::CancellationToken token = cancel_->token();
    for (;;) {
        if (token.is_cancellation_requested()) {
            return complete();
        }

        websocket_transport::ReceiveResult result;
        try {
            result = transport_->receive(chunk_size_, token);
        } catch (const cancellation::OperationCancelledError&) {
            return complete();
        } catch (const websocket_transport::TransportError& e) {
            complete();
            if (token.is_cancellation_requested()) {
                return std::nullopt;
            }
            LOG_WARN_COMP("SOCKET_RECEIVER", "Receive failed: " + std::string(e.what()));
            throw ChatError(ErrorCode::RECEIVE_FAILED, e.what());
        }

        if (result.is_close) {
            LOG_DEBUG_COMP("SOCKET_RECEIVER", "Close frame received, stream completed");
            return complete();
        }

        buffer_.append(result.data);
        if (result.end_of_message) {
            std::string message;
            message.swap(buffer_);
            return message;
        }
    }
}

std::optional<std::string> ReceiveStream::complete() {
    completed_ = true;
    buffer_.clear();
    transport_.reset();
    return std::nullopt;
}

SocketReceiver::SocketReceiver(size_t chunk_size) : chunk_size_(chunk_size) {}

ReceiveStream SocketReceiver::create_receive_stream(const SocketConnection& connection,
                                                    const cancellation::CancellationToken& cancel) const {
    auto linked = cancellation::CancellationSource::create_linked({cancel, connection.token()});
    std::shared_ptr<websocket_transport::IWebSocketTransport> transport;
    if (connection.is_open()) {
        transport = connection.transport();
    }
    return ReceiveStream(std::move(transport), std::move(linked), chunk_size_);
}

std::string SocketReceiver::receive_one(const SocketConnection& connection,
                                        const cancellation::CancellationToken& cancel) const {
    auto transport = connection.transport();
    if (!transport || !transport->is_open()) {
        throw ChatError(ErrorCode::TRANSPORT_CLOSED_DURING_READ, "Connection is not open");
    }

    auto linked = cancellation::CancellationSource::create_linked({cancel, connection.token()});
    std::string buffer;
    for (;;) {
        websocket_transport::ReceiveResult result;
        try {
            result = transport->receive(chunk_size_, linked->token());
        } catch (const cancellation::OperationCancelledError&) {
            throw ChatError(ErrorCode::OPERATION_CANCELLED, "Receive was cancelled");
        } catch (const websocket_transport::TransportError& e) {
            if (linked->is_cancellation_requested()) {
                throw ChatError(ErrorCode::OPERATION_CANCELLED, "Receive was cancelled");
            }
            throw ChatError(ErrorCode::RECEIVE_FAILED, e.what());
        }

        if (result.is_close) {
            throw ChatError(ErrorCode::TRANSPORT_CLOSED_DURING_READ, "Connection closed during receive");
        }
        buffer.append(result.data);
        if (result.end_of_message) {
            return buffer;
        }
    }
}

} // namespace chat_client
