#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {
namespace wav {

constexpr size_t HEADER_SIZE = 44;

// 44-byte canonical RIFF/WAVE header for PCM data of data_length bytes
std::vector<uint8_t> create_header(uint32_t data_length, int sample_rate, int channels, int bits_per_sample);

// True when the bytes already carry a container: RIFF, ID3 or an MPEG frame sync
bool is_container(const uint8_t* data, size_t length);
bool is_container(const std::vector<uint8_t>& data);

} // namespace wav
} // namespace audio
