#include "audio_stream_buffer.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"

namespace audio {

AudioStreamBuffer::AudioStreamBuffer(PlaybackAdapterFactory factory)
    : factory_(std::move(factory)) {}

AudioStreamBuffer::~AudioStreamBuffer() {
    clear();
}

void AudioStreamBuffer::enqueue(std::vector<uint8_t> chunk) {
    std::shared_ptr<IPlaybackAdapter> adapter;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!adapter_) {
            if (!factory_) {
                LOG_WARN_COMP("AUDIO_BUFFER", "No playback adapter factory, dropping chunk");
                return;
            }
            adapter_ = factory_();
            if (!adapter_) {
                LOG_WARN_COMP("AUDIO_BUFFER", "Playback adapter factory returned nothing");
                return;
            }
            ++generation_;
            uint64_t bound = generation_;
            adapter_->set_ended_callback([this, bound]() { on_adapter_ended(bound); });
            adapter_->set_error_callback([this, bound](const std::string& message) {
                on_adapter_error(bound, message);
            });
            LOG_DEBUG_COMP("AUDIO_BUFFER", "Playback adapter created (generation " + std::to_string(bound) + ")");
        }

        ++pending_;
        if (append_in_flight_) {
            queue_.push_back(std::move(chunk));
            return;
        }
        append_in_flight_ = true;
        adapter = adapter_;
        generation = generation_;
    }
    submit(std::move(adapter), std::move(chunk), generation);
}

void AudioStreamBuffer::flush() {
    std::shared_ptr<IPlaybackAdapter> adapter;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!adapter_) {
            return;
        }
        flushing_ = true;
        if (pending_ > 0 || end_signalled_) {
            return;
        }
        end_signalled_ = true;
        adapter = adapter_;
        generation = generation_;
    }
    signal_end(std::move(adapter), generation);
}

void AudioStreamBuffer::clear() noexcept {
    std::shared_ptr<IPlaybackAdapter> adapter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        adapter = reset_locked();
    }
    if (adapter) {
        error_handling::safe_execute_void([&]() { adapter->stop(); }, "AUDIO_BUFFER", "stop");
        LOG_DEBUG_COMP("AUDIO_BUFFER", "Playback cleared");
    }
}

void AudioStreamBuffer::set_error_callback(BufferErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    error_callback_ = std::move(callback);
}

size_t AudioStreamBuffer::pending_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

bool AudioStreamBuffer::is_flushing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flushing_;
}

bool AudioStreamBuffer::has_adapter() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(adapter_);
}

void AudioStreamBuffer::submit(std::shared_ptr<IPlaybackAdapter> adapter, std::vector<uint8_t> chunk,
                               uint64_t generation) {
    try {
        adapter->append(std::move(chunk), [this, generation]() { on_append_complete(generation); });
    } catch (const std::exception& e) {
        on_adapter_error(generation, e.what());
    }
}

void AudioStreamBuffer::on_append_complete(uint64_t generation) {
    std::shared_ptr<IPlaybackAdapter> adapter;
    std::vector<uint8_t> next;
    bool has_next = false;
    bool end_now = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !adapter_) {
            return;
        }
        if (pending_ > 0) {
            --pending_;
        }
        adapter = adapter_;
        if (!queue_.empty()) {
            next = std::move(queue_.front());
            queue_.pop_front();
            has_next = true;
        } else {
            append_in_flight_ = false;
            if (flushing_ && pending_ == 0 && !end_signalled_) {
                end_signalled_ = true;
                end_now = true;
            }
        }
    }

    if (has_next) {
        submit(std::move(adapter), std::move(next), generation);
    } else if (end_now) {
        signal_end(std::move(adapter), generation);
    }
}

void AudioStreamBuffer::on_adapter_ended(uint64_t generation) {
    std::shared_ptr<IPlaybackAdapter> adapter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        adapter = reset_locked();
    }
    if (adapter) {
        error_handling::safe_execute_void([&]() { adapter->stop(); }, "AUDIO_BUFFER", "release");
        LOG_DEBUG_COMP("AUDIO_BUFFER", "Playback ended");
    }
}

void AudioStreamBuffer::on_adapter_error(uint64_t generation, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !adapter_) {
            return;
        }
    }
    LOG_ERROR_COMP("AUDIO_BUFFER", "Playback adapter error: " + message);

    BufferErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = error_callback_;
    }
    chat_client::ChatError error(chat_client::ErrorCode::PLAYBACK_ADAPTER_ERROR, message);
    error_handling::safe_callback(callback, "AUDIO_BUFFER", "error", error);

    std::shared_ptr<IPlaybackAdapter> adapter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        adapter = reset_locked();
    }
    if (adapter) {
        error_handling::safe_execute_void([&]() { adapter->stop(); }, "AUDIO_BUFFER", "stop");
    }
}

void AudioStreamBuffer::signal_end(std::shared_ptr<IPlaybackAdapter> adapter, uint64_t generation) {
    try {
        adapter->end();
    } catch (const std::exception& e) {
        on_adapter_error(generation, e.what());
    }
}

std::shared_ptr<IPlaybackAdapter> AudioStreamBuffer::reset_locked() {
    ++generation_;
    queue_.clear();
    pending_ = 0;
    append_in_flight_ = false;
    flushing_ = false;
    end_signalled_ = false;
    return std::move(adapter_);
}

} // namespace audio
