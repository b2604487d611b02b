#pragma once
#include "i_playback_adapter.hpp"
#include <memory>
#include <string>
#include <thread>

namespace audio {

/**
 * Playback device stand-in that writes each turn to its own file.
 *
 * Raw PCM is wrapped in a WAV container whose header is patched with the
 * final length on end(); data that already carries a container is written
 * as-is. All file I/O runs on a worker thread, which is also where the
 * append, ended and error callbacks fire.
 */
class FilePlaybackAdapter : public IPlaybackAdapter {
public:
    struct Options {
        std::string output_dir{"audio_out"};
        int sample_rate{24000};
        int channels{1};
        int bits_per_sample{16};
        bool wrap_pcm{true};
    };

    explicit FilePlaybackAdapter(const Options& options);
    ~FilePlaybackAdapter() override;

    FilePlaybackAdapter(const FilePlaybackAdapter&) = delete;
    FilePlaybackAdapter& operator=(const FilePlaybackAdapter&) = delete;

    void append(std::vector<uint8_t> bytes, AppendCompleteCallback on_done) override;
    void end() override;
    void stop() override;

    void set_ended_callback(PlaybackEndedCallback callback) override;
    void set_error_callback(PlaybackErrorCallback callback) override;

    // Empty until the first chunk has been written
    std::string output_path() const;

    static PlaybackAdapterFactory factory(const Options& options);

private:
    struct State;
    static void run(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::thread worker_;
};

} // namespace audio
