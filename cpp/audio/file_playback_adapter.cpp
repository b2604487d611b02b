#include "file_playback_adapter.hpp"
#include "wav_utils.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <queue>

namespace audio {

namespace {

std::atomic<uint64_t> next_file_id{1};

std::string make_file_name(const std::string& extension) {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "response_" + std::to_string(now) + "_" + std::to_string(next_file_id++) + extension;
}

} // namespace

struct FilePlaybackAdapter::State {
    explicit State(const Options& opts) : options(opts) {}

    Options options;

    std::mutex mutex;
    std::condition_variable cv;
    std::queue<std::function<void(State&)>> jobs;
    bool stopping{false};
    PlaybackEndedCallback on_ended;
    PlaybackErrorCallback on_error;
    std::string path;

    // Worker thread only
    std::ofstream file;
    bool wrapped{false};
    bool failed{false};
    uint64_t data_bytes{0};

    void report_error(const std::string& message) {
        failed = true;
        PlaybackErrorCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                return;
            }
            callback = on_error;
        }
        error_handling::safe_callback(callback, "AUDIO_PLAYER", "playback error", message);
    }

    bool open(const std::vector<uint8_t>& first_chunk) {
        wrapped = options.wrap_pcm && !wav::is_container(first_chunk);
        std::string extension = ".pcm";
        if (wrapped) {
            extension = ".wav";
        } else if (wav::is_container(first_chunk)) {
            extension = first_chunk.size() >= 4 && first_chunk[0] == 'R' ? ".wav" : ".mp3";
        }

        std::error_code ec;
        std::filesystem::create_directories(options.output_dir, ec);
        if (ec) {
            report_error("Cannot create " + options.output_dir + ": " + ec.message());
            return false;
        }

        std::string file_path = (std::filesystem::path(options.output_dir) / make_file_name(extension)).string();
        file.open(file_path, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            report_error("Cannot open " + file_path);
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            path = file_path;
        }
        if (wrapped) {
            auto header = wav::create_header(0, options.sample_rate, options.channels, options.bits_per_sample);
            file.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
        }
        LOG_INFO_COMP("AUDIO_PLAYER", "Writing audio to " + file_path);
        return true;
    }

    void write(const std::vector<uint8_t>& chunk) {
        if (failed) {
            return;
        }
        if (!file.is_open() && !open(chunk)) {
            return;
        }
        file.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        if (!file) {
            report_error("Write failed for " + path);
            return;
        }
        data_bytes += chunk.size();
    }

    void finalize() {
        if (!file.is_open()) {
            return;
        }
        if (wrapped) {
            auto header = wav::create_header(static_cast<uint32_t>(data_bytes), options.sample_rate,
                                             options.channels, options.bits_per_sample);
            file.seekp(0);
            file.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
        }
        file.close();
        LOG_DEBUG_COMP("AUDIO_PLAYER", "Finished " + path + " (" + std::to_string(data_bytes) + " bytes)");
    }
};

FilePlaybackAdapter::FilePlaybackAdapter(const Options& options)
    : state_(std::make_shared<State>(options)) {
    worker_ = std::thread(&FilePlaybackAdapter::run, state_);
}

FilePlaybackAdapter::~FilePlaybackAdapter() {
    stop();
    if (!worker_.joinable()) {
        return;
    }
    // The last owner may release us from inside one of our own callbacks
    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

void FilePlaybackAdapter::append(std::vector<uint8_t> bytes, AppendCompleteCallback on_done) {
    auto chunk = std::make_shared<std::vector<uint8_t>>(std::move(bytes));
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) {
            return;
        }
        state_->jobs.push([chunk, on_done](State& state) {
            state.write(*chunk);
            error_handling::safe_callback(on_done, "AUDIO_PLAYER", "append");
        });
    }
    state_->cv.notify_one();
}

void FilePlaybackAdapter::end() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) {
            return;
        }
        state_->jobs.push([](State& state) {
            state.finalize();
            PlaybackEndedCallback callback;
            {
                std::lock_guard<std::mutex> lock(state.mutex);
                if (state.stopping) {
                    return;
                }
                callback = state.on_ended;
            }
            error_handling::safe_callback(callback, "AUDIO_PLAYER", "ended");
        });
    }
    state_->cv.notify_one();
}

void FilePlaybackAdapter::stop() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) {
            return;
        }
        state_->stopping = true;
        std::queue<std::function<void(State&)>> discarded;
        state_->jobs.swap(discarded);
    }
    state_->cv.notify_all();
}

void FilePlaybackAdapter::set_ended_callback(PlaybackEndedCallback callback) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_ended = std::move(callback);
}

void FilePlaybackAdapter::set_error_callback(PlaybackErrorCallback callback) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_error = std::move(callback);
}

std::string FilePlaybackAdapter::output_path() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->path;
}

PlaybackAdapterFactory FilePlaybackAdapter::factory(const Options& options) {
    return [options]() -> std::shared_ptr<IPlaybackAdapter> {
        return std::make_shared<FilePlaybackAdapter>(options);
    };
}

void FilePlaybackAdapter::run(std::shared_ptr<State> state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
        state->cv.wait(lock, [&state] { return !state->jobs.empty() || state->stopping; });
        if (state->stopping) {
            break;
        }

        auto job = std::move(state->jobs.front());
        state->jobs.pop();
        lock.unlock();

        job(*state);

        lock.lock();
    }
    lock.unlock();
    state->finalize();
}

} // namespace audio
