#pragma once
#include "i_playback_adapter.hpp"
#include "../client/chat_error.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace audio {

using BufferErrorCallback = std::function<void(const chat_client::ChatError&)>;

/**
 * Ordered, interruptible feed into one playback adapter.
 *
 * Chunks are appended strictly one at a time in arrival order. clear() drops
 * everything not yet appended and tears the adapter down; completions that
 * belong to a torn-down adapter are recognised by their generation number and
 * ignored. At most one adapter is live at any time.
 */
class AudioStreamBuffer {
public:
    explicit AudioStreamBuffer(PlaybackAdapterFactory factory);
    ~AudioStreamBuffer();

    AudioStreamBuffer(const AudioStreamBuffer&) = delete;
    AudioStreamBuffer& operator=(const AudioStreamBuffer&) = delete;

    void enqueue(std::vector<uint8_t> chunk);
    void flush();
    void clear() noexcept;

    // Receives PLAYBACK_ADAPTER_ERROR before the buffer clears itself
    void set_error_callback(BufferErrorCallback callback);

    size_t pending_chunks() const;
    bool is_flushing() const;
    bool has_adapter() const;

private:
    void submit(std::shared_ptr<IPlaybackAdapter> adapter, std::vector<uint8_t> chunk, uint64_t generation);
    void on_append_complete(uint64_t generation);
    void on_adapter_ended(uint64_t generation);
    void on_adapter_error(uint64_t generation, const std::string& message);
    void signal_end(std::shared_ptr<IPlaybackAdapter> adapter, uint64_t generation);
    std::shared_ptr<IPlaybackAdapter> reset_locked();

    PlaybackAdapterFactory factory_;

    mutable std::mutex mutex_;
    std::shared_ptr<IPlaybackAdapter> adapter_;
    std::deque<std::vector<uint8_t>> queue_;
    size_t pending_{0};
    bool append_in_flight_{false};
    bool flushing_{false};
    bool end_signalled_{false};
    uint64_t generation_{0};

    std::mutex callback_mutex_;
    BufferErrorCallback error_callback_;
};

} // namespace audio
