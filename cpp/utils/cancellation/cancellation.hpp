#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace cancellation {

class OperationCancelledError : public std::runtime_error {
public:
    OperationCancelledError() : std::runtime_error("Operation was cancelled") {}
    explicit OperationCancelledError(const std::string& message) : std::runtime_error(message) {}
};

namespace detail {

// Shared cancellation flag plus the callbacks to run when it flips.
class CancellationState {
public:
    bool is_cancelled() const { return cancelled_.load(); }

    void cancel();
    size_t add_callback(std::function<void()> callback);
    void remove_callback(size_t id);
    bool wait_for(std::chrono::milliseconds timeout);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<size_t, std::function<void()>> callbacks_;
    size_t next_id_{1};
    bool invoking_{false};
    std::thread::id invoking_thread_;
};

} // namespace detail

/**
 * Unregisters a cancellation callback on destruction.
 * If the callback is running on another thread, destruction waits for it.
 */
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, size_t id)
        : state_(std::move(state)), id_(id) {}
    ~CancellationRegistration() { reset(); }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {
        other.id_ = 0;
    }
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }

    void reset() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
        }
        state_.reset();
        id_ = 0;
    }

private:
    std::shared_ptr<detail::CancellationState> state_;
    size_t id_{0};
};

/**
 * Observer side of a cancellation signal. Cheap to copy; a default
 * constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    static CancellationToken none() { return CancellationToken(); }

    bool is_cancellation_requested() const { return state_ && state_->is_cancelled(); }
    bool can_be_cancelled() const { return static_cast<bool>(state_); }

    void throw_if_cancellation_requested() const {
        if (is_cancellation_requested()) {
            throw OperationCancelledError();
        }
    }

    // Runs the callback immediately if already cancelled.
    CancellationRegistration register_callback(std::function<void()> callback) const;

    // Sleeps up to timeout; returns true if cancelled before or during the wait.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * Owner side of a cancellation signal.
 */
class CancellationSource {
public:
    CancellationSource();
    ~CancellationSource();

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    CancellationToken token() const { return CancellationToken(state_); }
    bool is_cancellation_requested() const { return state_->is_cancelled(); }

    void cancel();

    // Starts a timer that cancels this source once delay has elapsed.
    void cancel_after(std::chrono::milliseconds delay);

    // A source that is cancelled when any of the given tokens is.
    static std::unique_ptr<CancellationSource> create_linked(const std::vector<CancellationToken>& tokens);

private:
    void stop_timer();

    std::shared_ptr<detail::CancellationState> state_;
    std::vector<CancellationRegistration> links_;

    std::thread timer_thread_;
    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool timer_stop_{false};
};

} // namespace cancellation
