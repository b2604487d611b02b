#include "streaming_audio_player.hpp"
#include "../utils/logging/log_helper.hpp"

namespace audio {

StreamingAudioPlayer::StreamingAudioPlayer(PlaybackAdapterFactory factory)
    : has_factory_(static_cast<bool>(factory)), buffer_(std::move(factory)) {}

StreamingAudioPlayer::~StreamingAudioPlayer() {
    buffer_.clear();
}

bool StreamingAudioPlayer::initialize() {
    if (!has_factory_) {
        LOG_WARN_COMP("AUDIO_PLAYER", "Audio output unavailable");
        return false;
    }
    if (!initialized_.exchange(true)) {
        LOG_INFO_COMP("AUDIO_PLAYER", "Audio output initialized");
    }
    return true;
}

void StreamingAudioPlayer::queue(std::vector<uint8_t> audio_data) {
    if (audio_data.empty()) {
        return;
    }
    if (!initialized_.load() && !initialize()) {
        return;
    }
    buffer_.enqueue(std::move(audio_data));
}

void StreamingAudioPlayer::flush() {
    buffer_.flush();
}

void StreamingAudioPlayer::stop() {
    buffer_.clear();
}

void StreamingAudioPlayer::reset() {
    buffer_.clear();
}

void StreamingAudioPlayer::clear() {
    buffer_.clear();
}

} // namespace audio
