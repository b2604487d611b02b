#include "doctest.h"
#include "../../../client/reconnect_strategy.hpp"
#include <climits>

using chat_client::ReconnectStrategy;
using chat_client::WebSocketConfig;

namespace {

WebSocketConfig bounded_backoff_config(int max_attempts) {
    WebSocketConfig::Values values;
    values.reconnect_base_delay = std::chrono::milliseconds(1000);
    values.reconnect_max_delay = std::chrono::milliseconds(30000);
    values.max_reconnect_attempts = max_attempts;
    values.infinite_reconnect = false;
    return WebSocketConfig(values);
}

} // namespace

TEST_CASE("ReconnectStrategy - Delay Doubles From Half Base Without Jitter") {
    ReconnectStrategy strategy(bounded_backoff_config(5), []() { return 0.0; });

    // No attempt recorded yet: base * 2^-1
    CHECK(strategy.get_next_delay() == std::chrono::milliseconds(500));
    strategy.record_attempt();
    CHECK(strategy.get_next_delay() == std::chrono::milliseconds(1000));
    strategy.record_attempt();
    CHECK(strategy.get_next_delay() == std::chrono::milliseconds(2000));
    strategy.record_attempt();
    CHECK(strategy.get_next_delay() == std::chrono::milliseconds(4000));
}

TEST_CASE("ReconnectStrategy - Jitter Adds Up To Thirty Percent") {
    ReconnectStrategy strategy(bounded_backoff_config(5), []() { return 0.5; });
    strategy.record_attempt();
    strategy.record_attempt();

    // 2000 * (1 + 0.3 * 0.5)
    CHECK(strategy.get_next_delay() == std::chrono::milliseconds(2300));
}

TEST_CASE("ReconnectStrategy - Delay Capped At Max") {
    ReconnectStrategy strategy(bounded_backoff_config(100), []() { return 0.99; });
    for (int i = 0; i < 40; ++i) {
        strategy.record_attempt();
    }
    CHECK(strategy.get_next_delay() == std::chrono::milliseconds(30000));
}

TEST_CASE("ReconnectStrategy - Random Delays Stay In Range") {
    ReconnectStrategy strategy(bounded_backoff_config(10));
    strategy.record_attempt();
    strategy.record_attempt();
    strategy.record_attempt();

    for (int i = 0; i < 50; ++i) {
        auto delay = strategy.get_next_delay();
        CHECK(delay >= std::chrono::milliseconds(4000));
        CHECK(delay <= std::chrono::milliseconds(5200));
    }
}

TEST_CASE("ReconnectStrategy - Bounded Budget Exhausts") {
    ReconnectStrategy strategy(bounded_backoff_config(2));

    CHECK(strategy.can_retry());
    strategy.record_attempt();
    CHECK(strategy.can_retry());
    strategy.record_attempt();
    CHECK(!strategy.can_retry());
    CHECK(strategy.attempts() == 2);
    CHECK(strategy.max_attempts() == 2);

    strategy.reset();
    CHECK(strategy.attempts() == 0);
    CHECK(strategy.can_retry());
}

TEST_CASE("ReconnectStrategy - Infinite Reconnect Ignores Budget") {
    ReconnectStrategy strategy(WebSocketConfig::mobile());
    for (int i = 0; i < 1000; ++i) {
        strategy.record_attempt();
    }
    CHECK(strategy.can_retry());
    CHECK(strategy.max_attempts() == INT_MAX);
}

TEST_CASE("ReconnectStrategy - Infinite Reconnect Reports Unbounded Max Attempts") {
    WebSocketConfig::Values values = WebSocketConfig::stable().values();
    values.infinite_reconnect = true;
    ReconnectStrategy strategy{WebSocketConfig(values)};

    CHECK(WebSocketConfig(values).max_reconnect_attempts() == 10);
    CHECK(strategy.max_attempts() == INT_MAX);
}

TEST_CASE("ReconnectStrategy - Prevent Stops Retries Until Reset") {
    ReconnectStrategy strategy(WebSocketConfig::mobile());

    strategy.prevent_auto_reconnect();
    CHECK(strategy.is_auto_reconnect_prevented());
    CHECK(!strategy.can_retry());

    strategy.reset();
    CHECK(!strategy.is_auto_reconnect_prevented());
    CHECK(strategy.can_retry());
}
