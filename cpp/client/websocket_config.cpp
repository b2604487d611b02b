#include "websocket_config.hpp"
#include "../utils/config/process_config_manager.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include <algorithm>
#include <cctype>

namespace chat_client {

namespace {

std::chrono::milliseconds read_ms(const config::ProcessConfigManager& config, const std::string& key,
                                  std::chrono::milliseconds fallback) {
    int value = config.get_int("websocket", key, static_cast<int>(fallback.count()));
    return std::chrono::milliseconds(std::max(0, value));
}

} // namespace

WebSocketConfig WebSocketConfig::mobile() {
    return WebSocketConfig(Values{});
}

WebSocketConfig WebSocketConfig::stable() {
    Values values;
    values.ping_interval = std::chrono::milliseconds(constants::timeout::STABLE_PING_INTERVAL_MS);
    values.keep_alive_interval = std::chrono::milliseconds(constants::timeout::STABLE_KEEP_ALIVE_MS);
    values.max_reconnect_attempts = constants::retry::STABLE_MAX_ATTEMPTS;
    values.infinite_reconnect = false;
    return WebSocketConfig(values);
}

WebSocketConfig WebSocketConfig::from_config(const config::ProcessConfigManager& config) {
    std::string profile = config.get_string("websocket", "profile", "mobile");
    std::transform(profile.begin(), profile.end(), profile.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (profile != "stable" && profile != "mobile") {
        LOG_WARN_COMP("CONFIG", "Unknown websocket profile '" + profile + "', using mobile");
        profile = "mobile";
    }
    Values values = (profile == "stable" ? stable() : mobile()).values();

    values.connect_timeout = read_ms(config, "connect_timeout_ms", values.connect_timeout);
    values.ping_interval = read_ms(config, "ping_interval_ms", values.ping_interval);
    values.reconnect_base_delay = read_ms(config, "reconnect_base_delay_ms", values.reconnect_base_delay);
    values.reconnect_max_delay = read_ms(config, "reconnect_max_delay_ms", values.reconnect_max_delay);
    values.keep_alive_interval = read_ms(config, "keep_alive_interval_ms", values.keep_alive_interval);
    values.pong_timeout = read_ms(config, "pong_timeout_ms", values.pong_timeout);
    values.max_reconnect_attempts = std::max(0, config.get_int("websocket", "max_reconnect_attempts",
                                                               values.max_reconnect_attempts));
    values.receive_buffer_size = static_cast<size_t>(std::max(1, config.get_int("websocket", "receive_buffer_size",
                                                                                static_cast<int>(values.receive_buffer_size))));
    values.infinite_reconnect = config.get_bool("websocket", "infinite_reconnect", values.infinite_reconnect);
    values.expect_status_message = config.get_bool("websocket", "expect_status_message", values.expect_status_message);

    if (values.reconnect_max_delay < values.reconnect_base_delay) {
        LOG_WARN_COMP("CONFIG", "reconnect_max_delay_ms below reconnect_base_delay_ms, raising it");
        values.reconnect_max_delay = values.reconnect_base_delay;
    }

    LOG_INFO_COMP("CONFIG", "WebSocket profile '" + profile + "': connect timeout " +
                  std::to_string(values.connect_timeout.count()) + "ms, " +
                  (values.infinite_reconnect ? std::string("infinite") : std::to_string(values.max_reconnect_attempts)) +
                  " reconnect attempts");
    return WebSocketConfig(values);
}

} // namespace chat_client
