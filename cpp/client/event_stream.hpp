#pragma once
#include "chat_events.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace chat_client {

using ChatEventCallback = std::function<void(const ChatEvent&)>;
using CompletedCallback = std::function<void()>;

/**
 * Shared observable sequence of ChatEvents.
 *
 * publish() dispatches synchronously and in order to every subscriber; a
 * subscriber that throws is logged and skipped. complete() is idempotent and
 * anything published afterwards is dropped.
 */
class EventStream {
public:
    EventStream() = default;

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    // Returns an id for unsubscribe(). Subscribing after completion only
    // delivers on_completed.
    size_t subscribe(ChatEventCallback on_event, CompletedCallback on_completed = nullptr);
    void unsubscribe(size_t id);

    void publish(const ChatEvent& event);
    void complete();

    bool is_completed() const;
    size_t subscriber_count() const;

private:
    struct Subscriber {
        ChatEventCallback on_event;
        CompletedCallback on_completed;
    };

    mutable std::recursive_mutex mutex_;
    std::map<size_t, Subscriber> subscribers_;
    size_t next_id_{1};
    bool completed_{false};
};

} // namespace chat_client
