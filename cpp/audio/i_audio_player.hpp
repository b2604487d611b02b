#pragma once
#include <cstdint>
#include <vector>

namespace audio {

// Audio output facade used by the chat session
class IAudioPlayer {
public:
    virtual ~IAudioPlayer() = default;

    virtual bool is_enabled() const = 0;
    virtual bool initialize() = 0;

    // Queue audio data for playback
    virtual void queue(std::vector<uint8_t> audio_data) = 0;

    // No more audio for the current response
    virtual void flush() = 0;

    // Stop playback and drop anything queued
    virtual void stop() = 0;

    // Prepare for a new response stream
    virtual void reset() = 0;

    // Interruption: discard pending audio immediately
    virtual void clear() = 0;
};

} // namespace audio
