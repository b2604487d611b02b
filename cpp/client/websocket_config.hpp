#pragma once
#include <chrono>
#include <climits>
#include <cstddef>

namespace config {
class ProcessConfigManager;
}

namespace chat_client {

/**
 * Connection tuning for one client instance. Built once and never mutated;
 * a different profile means a new client.
 */
class WebSocketConfig {
public:
    struct Values {
        std::chrono::milliseconds connect_timeout{30000};
        std::chrono::milliseconds ping_interval{15000};
        std::chrono::milliseconds reconnect_base_delay{1000};
        std::chrono::milliseconds reconnect_max_delay{30000};
        std::chrono::milliseconds keep_alive_interval{30000};
        std::chrono::milliseconds pong_timeout{10000};
        int max_reconnect_attempts{INT_MAX};
        size_t receive_buffer_size{8192};
        bool infinite_reconnect{true};
        bool expect_status_message{true};
    };

    WebSocketConfig() = default;
    explicit WebSocketConfig(const Values& values) : values_(values) {}

    // Infinite retries, short ping interval
    static WebSocketConfig mobile();
    // Bounded retries, longer intervals
    static WebSocketConfig stable();

    // [websocket] profile selects the preset, remaining keys override it
    static WebSocketConfig from_config(const config::ProcessConfigManager& config);

    std::chrono::milliseconds connect_timeout() const { return values_.connect_timeout; }
    std::chrono::milliseconds ping_interval() const { return values_.ping_interval; }
    std::chrono::milliseconds reconnect_base_delay() const { return values_.reconnect_base_delay; }
    std::chrono::milliseconds reconnect_max_delay() const { return values_.reconnect_max_delay; }
    std::chrono::milliseconds keep_alive_interval() const { return values_.keep_alive_interval; }
    std::chrono::milliseconds pong_timeout() const { return values_.pong_timeout; }
    int max_reconnect_attempts() const { return values_.max_reconnect_attempts; }
    size_t receive_buffer_size() const { return values_.receive_buffer_size; }
    bool infinite_reconnect() const { return values_.infinite_reconnect; }
    bool expect_status_message() const { return values_.expect_status_message; }

    const Values& values() const { return values_; }

private:
    Values values_;
};

} // namespace chat_client
