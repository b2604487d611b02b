#include "websocket_chat_client.hpp"
#include "chat_error.hpp"
#include "message_builder.hpp"
#include "message_parser.hpp"
#include "../utils/logging/log_helper.hpp"

namespace chat_client {

WebSocketChatClient::WebSocketChatClient(const ChatSettings& settings, const WebSocketConfig& config,
                                         websocket_transport::TransportFactory factory)
    : settings_(settings),
      config_(config),
      connection_(config, std::move(factory)),
      strategy_(config),
      receiver_(config.receive_buffer_size()) {}

WebSocketChatClient::~WebSocketChatClient() {
    if (state_.load() != ConnectionState::DISCONNECTED) {
        disconnect();
    } else {
        strategy_.prevent_auto_reconnect();
        stop_session();
        connection_.dispose();
    }
    events_.complete();
}

bool WebSocketChatClient::connect(const cancellation::CancellationToken& cancel) {
    if (state_.load() == ConnectionState::CONNECTED) {
        return true;
    }

    // A background retry loop may still be running from an earlier failure
    stop_session();
    if (strategy_.is_auto_reconnect_prevented()) {
        strategy_.reset();
    }

    set_state(ConnectionState::CONNECTING);
    try {
        open_session(cancel);
    } catch (const ChatError& e) {
        LOG_ERROR_COMP("CHAT_CLIENT", "Connection failed: " + std::string(e.what()));
        events_.publish(ChatEvent::error("Connection failed: " + std::string(e.what())));
        set_state(ConnectionState::DISCONNECTED);

        strategy_.record_attempt();
        if (!cancel.is_cancellation_requested() && strategy_.can_retry()) {
            start_session(false);
        }
        return false;
    }

    strategy_.reset();
    set_state(ConnectionState::CONNECTED);
    start_session(true);
    return true;
}

void WebSocketChatClient::send(const std::string& message, const cancellation::CancellationToken& cancel) {
    if (state_.load() != ConnectionState::CONNECTED) {
        throw ChatError(ErrorCode::SEND_WHILE_DISCONNECTED,
                        std::string("Not connected (state: ") + to_string(state_.load()) + ")");
    }

    auto transport = connection_.transport();
    if (!transport || !transport->is_open()) {
        throw ChatError(ErrorCode::SEND_WHILE_DISCONNECTED, "Not connected");
    }

    std::string json = MessageBuilder::create_request(settings_, message).to_json_string();
    auto linked = cancellation::CancellationSource::create_linked({cancel, connection_.token()});
    try {
        transport->send_text(json, linked->token());
    } catch (const cancellation::OperationCancelledError&) {
        throw ChatError(ErrorCode::OPERATION_CANCELLED, "Send was cancelled");
    } catch (const websocket_transport::TransportError& e) {
        LOG_ERROR_COMP("CHAT_CLIENT", "Send failed: " + std::string(e.what()));
        throw ChatError(ErrorCode::SEND_FAILED, e.what());
    }
    LOG_DEBUG_COMP("CHAT_CLIENT", "Sent chat request (" + std::to_string(json.size()) + " bytes)");
}

void WebSocketChatClient::disconnect(const cancellation::CancellationToken& cancel) {
    LOG_INFO_COMP("CHAT_CLIENT", "Disconnecting");
    strategy_.prevent_auto_reconnect();
    stop_session();
    // The session thread may have reset the strategy while it was stopping
    strategy_.prevent_auto_reconnect();

    if (!cancel.is_cancellation_requested()) {
        connection_.close();
    }
    connection_.dispose();
    set_state(ConnectionState::DISCONNECTED);
}

void WebSocketChatClient::open_session(const cancellation::CancellationToken& cancel) {
    connection_.connect(settings_.server_uri, cancel);
    try {
        if (config_.expect_status_message()) {
            read_status_message(cancel);
        }
    } catch (...) {
        connection_.dispose();
        throw;
    }
}

void WebSocketChatClient::read_status_message(const cancellation::CancellationToken& cancel) {
    cancellation::CancellationSource timeout;
    timeout.cancel_after(config_.connect_timeout());
    auto linked = cancellation::CancellationSource::create_linked({cancel, timeout.token()});

    std::string message;
    try {
        message = receiver_.receive_one(connection_, linked->token());
    } catch (const ChatError& e) {
        if (e.code() == ErrorCode::OPERATION_CANCELLED && timeout.is_cancellation_requested() &&
            !cancel.is_cancellation_requested()) {
            throw ChatError(ErrorCode::CONNECT_TIMEOUT, "Timed out waiting for status message");
        }
        throw;
    }

    auto event = MessageParser::parse(message);
    if (!event) {
        LOG_WARN_COMP("CHAT_CLIENT", "Unrecognized handshake message ignored");
        return;
    }
    if (event->type == ChatEventType::STATUS_MESSAGE_RECEIVED) {
        LOG_INFO_COMP("CHAT_CLIENT", "Server status: " + event->message);
    }
    events_.publish(*event);
}

void WebSocketChatClient::start_session(bool connected) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_thread_.joinable()) {
        // Left behind by a disconnect() issued from the session thread itself
        session_thread_.join();
    }
    session_cancel_ = std::make_unique<cancellation::CancellationSource>();
    cancellation::CancellationToken stop = session_cancel_->token();
    session_thread_ = std::thread([this, connected, stop]() { run_session(connected, stop); });
}

void WebSocketChatClient::stop_session() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_cancel_) {
        session_cancel_->cancel();
    }
    if (session_thread_.joinable() && session_thread_.get_id() != std::this_thread::get_id()) {
        session_thread_.join();
    }
}

void WebSocketChatClient::run_session(bool connected, cancellation::CancellationToken stop) {
    LOG_DEBUG_COMP("CHAT_CLIENT", "Session thread started");
    if (!connected && !reconnect(stop)) {
        return;
    }

    for (;;) {
        drain_receive_stream(stop);
        if (stop.is_cancellation_requested() || strategy_.is_auto_reconnect_prevented()) {
            break;
        }

        LOG_WARN_COMP("CHAT_CLIENT", "Connection lost, reconnecting");
        connection_.dispose();
        set_state(ConnectionState::RECONNECTING);
        if (!reconnect(stop)) {
            break;
        }
    }
    LOG_DEBUG_COMP("CHAT_CLIENT", "Session thread stopped");
}

void WebSocketChatClient::drain_receive_stream(const cancellation::CancellationToken& stop) {
    ReceiveStream stream = receiver_.create_receive_stream(connection_, stop);
    try {
        while (auto message = stream.next()) {
            publish_message(*message);
        }
    } catch (const ChatError& e) {
        LOG_ERROR_COMP("CHAT_CLIENT", "Receive error: " + std::string(e.what()));
        events_.publish(ChatEvent::error("Receive error: " + std::string(e.what())));
    }
}

bool WebSocketChatClient::reconnect(const cancellation::CancellationToken& stop) {
    for (;;) {
        if (stop.is_cancellation_requested()) {
            return false;
        }
        if (!strategy_.can_retry()) {
            LOG_WARN_COMP("CHAT_CLIENT", "Reconnect attempts exhausted after " +
                          std::to_string(strategy_.attempts()));
            connection_.dispose();
            set_state(ConnectionState::DISCONNECTED);
            return false;
        }

        auto delay = strategy_.get_next_delay();
        LOG_INFO_COMP("CHAT_CLIENT", "Reconnecting in " + std::to_string(delay.count()) + "ms");
        if (stop.wait_for(delay)) {
            return false;
        }

        strategy_.record_attempt();
        if (state_.load() != ConnectionState::RECONNECTING) {
            set_state(ConnectionState::RECONNECTING);
        }

        try {
            open_session(stop);
        } catch (const ChatError& e) {
            if (stop.is_cancellation_requested()) {
                return false;
            }
            LOG_WARN_COMP("CHAT_CLIENT", "Reconnect attempt " + std::to_string(strategy_.attempts()) +
                          " failed: " + e.what());
            continue;
        }

        if (stop.is_cancellation_requested()) {
            return false;
        }
        strategy_.reset();
        // disconnect() may have started while the strategy was being reset
        if (stop.is_cancellation_requested()) {
            strategy_.prevent_auto_reconnect();
            return false;
        }
        set_state(ConnectionState::CONNECTED);
        LOG_INFO_COMP("CHAT_CLIENT", "Reconnected");
        return true;
    }
}

void WebSocketChatClient::set_state(ConnectionState state) {
    ConnectionState previous = state_.exchange(state);
    if (previous != state) {
        LOG_INFO_COMP("CHAT_CLIENT", std::string("State ") + to_string(previous) + " -> " + to_string(state));
    }
    events_.publish(ChatEvent::connection_state_changed(state));
}

void WebSocketChatClient::publish_message(const std::string& json) {
    auto event = MessageParser::parse(json);
    if (event) {
        events_.publish(*event);
    }
}

} // namespace chat_client
