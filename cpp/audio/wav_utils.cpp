#include "wav_utils.hpp"
#include <cstring>

namespace audio {
namespace wav {

namespace {

void put_tag(std::vector<uint8_t>& out, size_t offset, const char* tag) {
    std::memcpy(out.data() + offset, tag, 4);
}

void put_u32(std::vector<uint8_t>& out, size_t offset, uint32_t value) {
    out[offset] = static_cast<uint8_t>(value & 0xFF);
    out[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[offset + 2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[offset + 3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

void put_u16(std::vector<uint8_t>& out, size_t offset, uint16_t value) {
    out[offset] = static_cast<uint8_t>(value & 0xFF);
    out[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

} // namespace

std::vector<uint8_t> create_header(uint32_t data_length, int sample_rate, int channels, int bits_per_sample) {
    std::vector<uint8_t> header(HEADER_SIZE, 0);
    const uint16_t block_align = static_cast<uint16_t>(channels * (bits_per_sample / 8));

    put_tag(header, 0, "RIFF");
    put_u32(header, 4, 36 + data_length);
    put_tag(header, 8, "WAVE");
    put_tag(header, 12, "fmt ");
    put_u32(header, 16, 16);               // fmt chunk size
    put_u16(header, 20, 1);                // PCM
    put_u16(header, 22, static_cast<uint16_t>(channels));
    put_u32(header, 24, static_cast<uint32_t>(sample_rate));
    put_u32(header, 28, static_cast<uint32_t>(sample_rate) * block_align);
    put_u16(header, 32, block_align);
    put_u16(header, 34, static_cast<uint16_t>(bits_per_sample));
    put_tag(header, 36, "data");
    put_u32(header, 40, data_length);
    return header;
}

bool is_container(const uint8_t* data, size_t length) {
    if (!data || length < 2) {
        return false;
    }
    if (length >= 4 && std::memcmp(data, "RIFF", 4) == 0) {
        return true;
    }
    if (length >= 3 && std::memcmp(data, "ID3", 3) == 0) {
        return true;
    }
    // MPEG audio frame sync: 11 set bits
    return data[0] == 0xFF && (data[1] & 0xE0) == 0xE0;
}

bool is_container(const std::vector<uint8_t>& data) {
    return is_container(data.data(), data.size());
}

} // namespace wav
} // namespace audio
