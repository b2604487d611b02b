#pragma once
#include "audio_stream_buffer.hpp"
#include "i_audio_player.hpp"
#include <atomic>

namespace audio {

class StreamingAudioPlayer : public IAudioPlayer {
public:
    explicit StreamingAudioPlayer(PlaybackAdapterFactory factory);
    ~StreamingAudioPlayer() override;

    bool is_enabled() const override { return initialized_.load(); }
    bool initialize() override;

    void queue(std::vector<uint8_t> audio_data) override;
    void flush() override;
    void stop() override;
    void reset() override;
    void clear() override;

    void set_error_callback(BufferErrorCallback callback) { buffer_.set_error_callback(std::move(callback)); }
    const AudioStreamBuffer& buffer() const { return buffer_; }

private:
    bool has_factory_;
    std::atomic<bool> initialized_{false};
    AudioStreamBuffer buffer_;
};

// Used when audio output is disabled
class NullAudioPlayer : public IAudioPlayer {
public:
    bool is_enabled() const override { return false; }
    bool initialize() override { return false; }
    void queue(std::vector<uint8_t>) override {}
    void flush() override {}
    void stop() override {}
    void reset() override {}
    void clear() override {}
};

} // namespace audio
