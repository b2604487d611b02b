#pragma once
#include "../utils/app_service/app_service.hpp"
#include "../audio/i_audio_player.hpp"
#include "../client/chat_session.hpp"
#include "../client/chat_settings.hpp"
#include "../client/websocket_chat_client.hpp"
#include "../client/websocket_config.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chat_cli {

/**
 * Chat CLI Service
 *
 * Composition root for the terminal chat client: builds the transport,
 * chat client, audio player and session from configuration, then relays
 * stdin lines to the server and streams responses to stdout.
 */
class ChatCliService : public app_service::AppService {
public:
    ChatCliService();
    ~ChatCliService() override = default;

    // Handles one line of user input; returns false once the user asked to quit
    bool handle_input_line(const std::string& line);

protected:
    bool configure_service() override;
    bool start_service() override;
    void stop_service() override;
    void print_service_stats() override;

    bool handle_argument(const std::string& arg, int& index, int argc, char** argv) override;
    void print_service_usage() override;

private:
    bool request_livekit_token();
    void on_chat_event(const chat_client::ChatEvent& event);
    void on_message_added(const chat_client::ChatMessage& message);
    void input_loop();
    void print_prompt();

    chat_client::ChatSettings settings_;
    std::unique_ptr<chat_client::WebSocketConfig> ws_config_;
    std::shared_ptr<chat_client::WebSocketChatClient> client_;
    std::shared_ptr<audio::IAudioPlayer> audio_player_;
    std::unique_ptr<chat_client::ChatSession> session_;
    size_t event_subscription_{0};

    bool fetch_token_{false};
    std::string livekit_url_;
    std::string livekit_endpoint_;
    std::string livekit_room_;
    std::string livekit_identity_;
    int livekit_ttl_seconds_{3600};

    std::thread input_thread_;
    std::atomic<bool> input_running_{false};
    std::mutex output_mutex_;
};

} // namespace chat_cli
