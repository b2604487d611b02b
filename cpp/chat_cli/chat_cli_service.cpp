#include "chat_cli_service.hpp"
#include "../audio/file_playback_adapter.hpp"
#include "../audio/streaming_audio_player.hpp"
#include "../livekit/token_client.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../websocket/websocket_transport.hpp"
#include <cerrno>
#include <iostream>
#include <poll.h>
#include <unistd.h>

namespace chat_cli {

using chat_client::ChatEvent;
using chat_client::ChatEventType;

ChatCliService::ChatCliService()
    : app_service::AppService("chat_cli") {
}

bool ChatCliService::handle_argument(const std::string& arg, int& index, int argc, char** argv) {
    (void)index; (void)argc; (void)argv;
    if (arg == "--token") {
        fetch_token_ = true;
        return true;
    }
    return false;
}

void ChatCliService::print_service_usage() {
    std::cout << "  --token                   Request a LiveKit access token before connecting" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands while running:" << std::endl;
    std::cout << "  /quit                     Exit" << std::endl;
    std::cout << "  /reconnect                Connect again after a disconnect" << std::endl;
    std::cout << "  /disconnect               Close the connection" << std::endl;
}

bool ChatCliService::configure_service() {
    auto* config = get_config_manager();

    settings_ = chat_client::ChatSettings::from_config(*config);
    ws_config_ = std::make_unique<chat_client::WebSocketConfig>(chat_client::WebSocketConfig::from_config(*config));

    LOG_INFO_COMP("CHAT_CLI", "Server: " + settings_.server_uri);
    LOG_INFO_COMP("CHAT_CLI", "User: " + settings_.user_id);
    LOG_INFO_COMP("CHAT_CLI", "Agent: " + settings_.agent.provider + "/" + settings_.agent.model_name);

    if (settings_.audio_enabled) {
        audio::FilePlaybackAdapter::Options options;
        options.output_dir = config->get_string("audio", "output_dir", options.output_dir);
        options.sample_rate = config->get_int("audio", "sample_rate", constants::audio::SAMPLE_RATE);
        options.channels = constants::audio::CHANNELS;
        options.bits_per_sample = constants::audio::BITS_PER_SAMPLE;
        options.wrap_pcm = config->get_bool("audio", "wrap_pcm", true);

        auto player = std::make_shared<audio::StreamingAudioPlayer>(audio::FilePlaybackAdapter::factory(options));
        player->set_error_callback([this](const chat_client::ChatError& error) {
            increment_error_count();
            LOG_ERROR_COMP("CHAT_CLI", "Audio output failed: " + std::string(error.what()));
        });
        player->initialize();
        audio_player_ = player;
        LOG_INFO_COMP("CHAT_CLI", "Audio output directory: " + options.output_dir);
    } else {
        audio_player_ = std::make_shared<audio::NullAudioPlayer>();
    }

    livekit_url_ = config->get_string("livekit", "url", "");
    livekit_endpoint_ = config->get_string("livekit", "token_endpoint", "");
    livekit_room_ = config->get_string("livekit", "room", "homunculy");
    livekit_identity_ = config->get_string("livekit", "identity", settings_.user_id);
    livekit_ttl_seconds_ = config->get_int("livekit", "ttl_seconds", 3600);

    client_ = std::make_shared<chat_client::WebSocketChatClient>(
        settings_, *ws_config_, websocket_transport::WebSocketTransportFactory::default_factory());
    event_subscription_ = client_->events().subscribe([this](const ChatEvent& event) { on_chat_event(event); });

    session_ = std::make_unique<chat_client::ChatSession>(client_, audio_player_);
    session_->set_message_added_callback([this](const chat_client::ChatMessage& message) {
        on_message_added(message);
    });
    return true;
}

bool ChatCliService::start_service() {
    if (!session_) {
        return false;
    }

    if (fetch_token_ && !request_livekit_token()) {
        return false;
    }

    if (!session_->connect()) {
        // Background retries are already scheduled by the client
        LOG_WARN_COMP("CHAT_CLI", "Initial connect failed, retrying in background");
    }

    input_running_.store(true);
    input_thread_ = std::thread(&ChatCliService::input_loop, this);
    return true;
}

void ChatCliService::stop_service() {
    input_running_.store(false);
    if (input_thread_.joinable()) {
        input_thread_.join();
    }

    if (session_) {
        session_->disconnect();
    }
    if (client_) {
        client_->events().unsubscribe(event_subscription_);
    }
    session_.reset();
    client_.reset();
    audio_player_.reset();
}

void ChatCliService::print_service_stats() {
    const auto& stats = get_statistics();
    std::string state = client_ ? chat_client::to_string(client_->state()) : "n/a";
    std::string stats_msg = get_service_name() + " - " +
                            "State: " + state +
                            ", Messages sent: " + std::to_string(stats.messages_sent.load()) +
                            ", Events received: " + std::to_string(stats.events_received.load()) +
                            ", Errors: " + std::to_string(stats.errors_count.load()) +
                            ", Reconnects: " + std::to_string(stats.reconnects.load()) +
                            ", Uptime: " + std::to_string(stats.uptime_seconds.load()) + "s";
    LOG_INFO_COMP("STATS", stats_msg);
}

bool ChatCliService::handle_input_line(const std::string& line) {
    if (line == "/quit" || line == "/exit") {
        request_stop();
        return false;
    }
    if (!session_) {
        return true;
    }
    if (line == "/reconnect") {
        session_->connect();
        return true;
    }
    if (line == "/disconnect") {
        session_->disconnect();
        return true;
    }

    if (session_->send_message(line)) {
        increment_sent_count();
    }
    return true;
}

bool ChatCliService::request_livekit_token() {
    auto http = std::shared_ptr<IHttpHandler>(HttpHandlerFactory::create());
    if (!http || !http->initialize()) {
        LOG_ERROR_COMP("CHAT_CLI", "Failed to initialize HTTP handler");
        return false;
    }

    livekit::TokenClient token_client(http, livekit_endpoint_);
    auto result = token_client.fetch_token(livekit_room_, livekit_identity_, livekit_ttl_seconds_);
    http->shutdown();

    if (!result) {
        LOG_ERROR_COMP("CHAT_CLI", "LiveKit token unavailable: " + result.error());
        return false;
    }

    const auto& token = result.value();
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "LiveKit room: " << token.room << " identity: " << token.identity << std::endl;
    if (!livekit_url_.empty()) {
        std::cout << "LiveKit url: " << livekit_url_ << std::endl;
    }
    std::cout << "LiveKit token: " << token.token << std::endl;
    return true;
}

void ChatCliService::on_chat_event(const ChatEvent& event) {
    increment_event_count();

    std::lock_guard<std::mutex> lock(output_mutex_);
    switch (event.type) {
        case ChatEventType::TEXT_CHUNK_RECEIVED:
            std::cout << event.text << std::flush;
            break;
        case ChatEventType::RESPONSE_COMPLETED:
            std::cout << std::endl;
            break;
        case ChatEventType::RESPONSE_INTERRUPTED:
            std::cout << " [Interrupted]" << std::endl;
            break;
        case ChatEventType::ERROR_OCCURRED:
            increment_error_count();
            break;
        case ChatEventType::CONNECTION_STATE_CHANGED:
            if (event.state == chat_client::ConnectionState::RECONNECTING) {
                increment_reconnect_count();
            }
            std::cout << "[" << chat_client::to_string(event.state) << "]" << std::endl;
            break;
        default:
            break;
    }
}

void ChatCliService::on_message_added(const chat_client::ChatMessage& message) {
    if (message.role != chat_client::MessageRole::SYSTEM) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "* " << message.content << std::endl;
}

void ChatCliService::print_prompt() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "> " << std::flush;
}

void ChatCliService::input_loop() {
    print_prompt();
    std::string pending;
    char buffer[1024];

    while (input_running_.load()) {
        struct pollfd fd;
        fd.fd = STDIN_FILENO;
        fd.events = POLLIN;
        fd.revents = 0;

        int ready = poll(&fd, 1, 100);
        if (ready <= 0) {
            continue;
        }

        ssize_t n = read(STDIN_FILENO, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            // EOF on stdin ends the session
            request_stop();
            break;
        }
        pending.append(buffer, static_cast<size_t>(n));

        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!handle_input_line(line)) {
                input_running_.store(false);
                return;
            }
            print_prompt();
        }
    }
}

} // namespace chat_cli
