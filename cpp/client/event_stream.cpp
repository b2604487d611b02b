#include "event_stream.hpp"
#include "../utils/error_handling.hpp"

namespace chat_client {

size_t EventStream::subscribe(ChatEventCallback on_event, CompletedCallback on_completed) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (completed_) {
        error_handling::safe_callback(on_completed, "CHAT_CLIENT", "completed");
        return 0;
    }
    size_t id = next_id_++;
    subscribers_.emplace(id, Subscriber{std::move(on_event), std::move(on_completed)});
    return id;
}

void EventStream::unsubscribe(size_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    subscribers_.erase(id);
}

void EventStream::publish(const ChatEvent& event) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (completed_) {
        return;
    }
    // Copy so a subscriber may unsubscribe from inside its callback
    auto subscribers = subscribers_;
    for (auto& entry : subscribers) {
        error_handling::safe_callback(entry.second.on_event, "CHAT_CLIENT", "event", event);
    }
}

void EventStream::complete() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (completed_) {
        return;
    }
    completed_ = true;
    auto subscribers = std::move(subscribers_);
    subscribers_.clear();
    for (auto& entry : subscribers) {
        error_handling::safe_callback(entry.second.on_completed, "CHAT_CLIENT", "completed");
    }
}

bool EventStream::is_completed() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return completed_;
}

size_t EventStream::subscriber_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace chat_client
