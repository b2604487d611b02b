#include "doctest.h"
#include "../../../audio/wav_utils.hpp"

namespace {

uint32_t read_le32(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) | (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) | (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

uint16_t read_le16(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

} // namespace

TEST_CASE("WavUtils - Header Layout") {
    auto header = audio::wav::create_header(48000, 24000, 1, 16);

    REQUIRE(header.size() == audio::wav::HEADER_SIZE);
    CHECK(std::string(header.begin(), header.begin() + 4) == "RIFF");
    CHECK(read_le32(header, 4) == 36 + 48000);
    CHECK(std::string(header.begin() + 8, header.begin() + 16) == "WAVEfmt ");
    CHECK(read_le16(header, 20) == 1);
    CHECK(read_le16(header, 22) == 1);
    CHECK(read_le32(header, 24) == 24000);
    CHECK(read_le32(header, 28) == 48000);
    CHECK(read_le16(header, 32) == 2);
    CHECK(read_le16(header, 34) == 16);
    CHECK(std::string(header.begin() + 36, header.begin() + 40) == "data");
    CHECK(read_le32(header, 40) == 48000);
}

TEST_CASE("WavUtils - Container Detection") {
    CHECK(audio::wav::is_container(audio::wav::create_header(0, 24000, 1, 16)));
    CHECK(audio::wav::is_container(std::vector<uint8_t>{'I', 'D', '3', 4}));
    CHECK(audio::wav::is_container(std::vector<uint8_t>{0xFF, 0xFB, 0x90, 0x00}));

    CHECK(!audio::wav::is_container(std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04}));
    CHECK(!audio::wav::is_container(std::vector<uint8_t>{0xFF, 0x10}));
    CHECK(!audio::wav::is_container(std::vector<uint8_t>{0xFF}));
    CHECK(!audio::wav::is_container(nullptr, 0));
}
