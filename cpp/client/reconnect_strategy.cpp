#include "reconnect_strategy.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <random>

namespace chat_client {

namespace {

ReconnectStrategy::RandomSource default_random_source() {
    auto engine = std::make_shared<std::mt19937_64>(std::random_device{}());
    auto mutex = std::make_shared<std::mutex>();
    return [engine, mutex]() {
        std::uniform_real_distribution<double> distribution(0.0, 1.0);
        std::lock_guard<std::mutex> lock(*mutex);
        return distribution(*engine);
    };
}

} // namespace

ReconnectStrategy::ReconnectStrategy(const WebSocketConfig& config)
    : ReconnectStrategy(config, default_random_source()) {}

ReconnectStrategy::ReconnectStrategy(const WebSocketConfig& config, RandomSource random)
    : config_(config), random_(std::move(random)) {}

bool ReconnectStrategy::can_retry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (prevented_) {
        return false;
    }
    return config_.infinite_reconnect() || attempts_ < config_.max_reconnect_attempts();
}

void ReconnectStrategy::record_attempt() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempts_ < INT_MAX) {
        ++attempts_;
    }
}

std::chrono::milliseconds ReconnectStrategy::get_next_delay() {
    int attempts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attempts = attempts_;
    }

    // attempts == 0 yields half the base delay
    const int exponent = std::min(attempts - 1, constants::retry::MAX_EXPONENT);
    const double base = static_cast<double>(config_.reconnect_base_delay().count()) * std::pow(2.0, exponent);

    double sample = random_ ? random_() : 0.0;
    sample = std::min(std::max(sample, 0.0), 1.0);
    const double jitter = base * constants::retry::JITTER_FRACTION * sample;

    const double capped = std::min(base + jitter, static_cast<double>(config_.reconnect_max_delay().count()));
    auto delay = std::chrono::milliseconds(static_cast<int64_t>(capped));

    LOG_DEBUG_COMP("RECONNECT", "Attempt " + std::to_string(attempts) + " backoff " +
                   std::to_string(delay.count()) + "ms");
    return delay;
}

void ReconnectStrategy::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_ = 0;
    prevented_ = false;
}

void ReconnectStrategy::prevent_auto_reconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    prevented_ = true;
}

int ReconnectStrategy::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

int ReconnectStrategy::max_attempts() const {
    return config_.infinite_reconnect() ? INT_MAX : config_.max_reconnect_attempts();
}

bool ReconnectStrategy::is_auto_reconnect_prevented() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prevented_;
}

} // namespace chat_client
