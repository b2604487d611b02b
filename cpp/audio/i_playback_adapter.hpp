#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace audio {

using AppendCompleteCallback = std::function<void()>;
using PlaybackEndedCallback = std::function<void()>;
using PlaybackErrorCallback = std::function<void(const std::string&)>;

/**
 * Output device boundary. append() is asynchronous: on_done fires once the
 * bytes have been accepted, possibly on another thread. Failures are reported
 * through the error callback, never thrown from a worker.
 */
class IPlaybackAdapter {
public:
    virtual ~IPlaybackAdapter() = default;

    virtual void append(std::vector<uint8_t> bytes, AppendCompleteCallback on_done) = 0;

    // No more data for this turn; "ended" fires once playback finishes
    virtual void end() = 0;

    // Immediate teardown; pending data is discarded. Idempotent.
    virtual void stop() = 0;

    virtual void set_ended_callback(PlaybackEndedCallback callback) = 0;
    virtual void set_error_callback(PlaybackErrorCallback callback) = 0;
};

using PlaybackAdapterFactory = std::function<std::shared_ptr<IPlaybackAdapter>()>;

} // namespace audio
