#pragma once
#include "websocket_config.hpp"
#include <chrono>
#include <functional>
#include <mutex>

namespace chat_client {

/**
 * Exponential backoff with jitter plus the retry budget.
 *
 * delay = min(base * 2^min(attempts - 1, 10) * (1 + jitter), max_delay)
 * with jitter uniform in [0, 0.3).
 */
class ReconnectStrategy {
public:
    // Returns a value in [0, 1); injectable so tests can pin the jitter
    using RandomSource = std::function<double()>;

    explicit ReconnectStrategy(const WebSocketConfig& config);
    ReconnectStrategy(const WebSocketConfig& config, RandomSource random);

    bool can_retry() const;
    void record_attempt();
    std::chrono::milliseconds get_next_delay();
    void reset();
    void prevent_auto_reconnect();

    int attempts() const;
    // INT_MAX when reconnecting forever
    int max_attempts() const;
    bool is_auto_reconnect_prevented() const;

private:
    WebSocketConfig config_;
    RandomSource random_;
    mutable std::mutex mutex_;
    int attempts_{0};
    bool prevented_{false};
};

} // namespace chat_client
