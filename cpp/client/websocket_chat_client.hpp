#pragma once
#include "chat_settings.hpp"
#include "event_stream.hpp"
#include "i_chat_client.hpp"
#include "reconnect_strategy.hpp"
#include "socket_connection.hpp"
#include "socket_receiver.hpp"
#include "websocket_config.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace chat_client {

/**
 * Session orchestrator over one SocketConnection.
 *
 * State machine:
 *   DISCONNECTED -> CONNECTING -> CONNECTED -> RECONNECTING -> CONNECTED
 *   RECONNECTING -> DISCONNECTED when retries are exhausted or prevented
 *   any -> DISCONNECTED on disconnect()
 *
 * A background session thread drains the receive stream and runs the
 * reconnect loop. connect() and disconnect() are driven from the caller's
 * thread; two concurrent connect() calls are not supported.
 */
class WebSocketChatClient : public IChatClient {
public:
    WebSocketChatClient(const ChatSettings& settings, const WebSocketConfig& config,
                        websocket_transport::TransportFactory factory = nullptr);
    ~WebSocketChatClient() override;

    WebSocketChatClient(const WebSocketChatClient&) = delete;
    WebSocketChatClient& operator=(const WebSocketChatClient&) = delete;

    bool connect(const cancellation::CancellationToken& cancel = cancellation::CancellationToken::none()) override;
    void send(const std::string& message,
              const cancellation::CancellationToken& cancel = cancellation::CancellationToken::none()) override;
    void disconnect(const cancellation::CancellationToken& cancel = cancellation::CancellationToken::none()) override;

    EventStream& events() override { return events_; }
    ConnectionState state() const override { return state_.load(); }
    int reconnect_attempts() const override { return strategy_.attempts(); }

    const ChatSettings& settings() const { return settings_; }
    const WebSocketConfig& config() const { return config_; }

private:
    // Opens the socket and reads the status handshake; throws ChatError
    void open_session(const cancellation::CancellationToken& cancel);
    void read_status_message(const cancellation::CancellationToken& cancel);

    void start_session(bool connected);
    void stop_session();
    void run_session(bool connected, cancellation::CancellationToken stop);
    void drain_receive_stream(const cancellation::CancellationToken& stop);
    // Returns true once reconnected, false when the session should end
    bool reconnect(const cancellation::CancellationToken& stop);

    void set_state(ConnectionState state);
    void publish_message(const std::string& json);

    ChatSettings settings_;
    WebSocketConfig config_;
    SocketConnection connection_;
    ReconnectStrategy strategy_;
    SocketReceiver receiver_;
    EventStream events_;

    std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};

    std::mutex session_mutex_;
    std::thread session_thread_;
    std::unique_ptr<cancellation::CancellationSource> session_cancel_;
};

} // namespace chat_client
