#include "cancellation.hpp"
#include "../error_handling.hpp"

namespace cancellation {

namespace detail {

void CancellationState::cancel() {
    std::map<size_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true)) {
            return;
        }
        callbacks.swap(callbacks_);
        invoking_ = true;
        invoking_thread_ = std::this_thread::get_id();
    }
    cv_.notify_all();

    for (auto& [id, callback] : callbacks) {
        error_handling::safe_callback(callback, "CANCELLATION", "cancellation");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        invoking_ = false;
    }
    cv_.notify_all();
}

size_t CancellationState::add_callback(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load()) {
            size_t id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    error_handling::safe_callback(callback, "CANCELLATION", "cancellation");
    return 0;
}

void CancellationState::remove_callback(size_t id) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (callbacks_.erase(id) > 0) {
        return;
    }
    // Already handed to cancel(); wait until it has finished running
    if (invoking_ && invoking_thread_ != std::this_thread::get_id()) {
        cv_.wait(lock, [this] { return !invoking_; });
    }
}

bool CancellationState::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
    return cancelled_.load();
}

} // namespace detail

CancellationRegistration CancellationToken::register_callback(std::function<void()> callback) const {
    if (!state_) {
        return CancellationRegistration();
    }
    size_t id = state_->add_callback(std::move(callback));
    if (id == 0) {
        return CancellationRegistration();
    }
    return CancellationRegistration(state_, id);
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    return state_->wait_for(timeout);
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource::~CancellationSource() {
    stop_timer();
    links_.clear();
}

void CancellationSource::cancel() {
    state_->cancel();
}

void CancellationSource::cancel_after(std::chrono::milliseconds delay) {
    stop_timer();
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_stop_ = false;
    }

    std::weak_ptr<detail::CancellationState> weak_state = state_;
    timer_thread_ = std::thread([this, delay, weak_state]() {
        std::unique_lock<std::mutex> lock(timer_mutex_);
        bool stopped = timer_cv_.wait_for(lock, delay, [this] { return timer_stop_; });
        lock.unlock();
        if (stopped) {
            return;
        }
        if (auto state = weak_state.lock()) {
            state->cancel();
        }
    });
}

std::unique_ptr<CancellationSource> CancellationSource::create_linked(const std::vector<CancellationToken>& tokens) {
    auto source = std::make_unique<CancellationSource>();
    std::weak_ptr<detail::CancellationState> weak_state = source->state_;

    for (const auto& token : tokens) {
        source->links_.push_back(token.register_callback([weak_state]() {
            if (auto state = weak_state.lock()) {
                state->cancel();
            }
        }));
    }
    return source;
}

void CancellationSource::stop_timer() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_stop_ = true;
    }
    timer_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

} // namespace cancellation
