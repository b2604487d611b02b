#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include "../utils/constants.hpp"

namespace websocket_transport {

// Decoded WebSocket frame (RFC 6455 section 5.2)
struct WebSocketFrame {
    bool fin{true};
    uint8_t opcode{0};
    std::string payload;

    static const uint8_t OPCODE_CONTINUATION = 0x0;
    static const uint8_t OPCODE_TEXT = 0x1;
    static const uint8_t OPCODE_BINARY = 0x2;
    static const uint8_t OPCODE_CLOSE = 0x8;
    static const uint8_t OPCODE_PING = 0x9;
    static const uint8_t OPCODE_PONG = 0xA;

    bool is_control() const { return (opcode & 0x08) != 0; }
};

using MaskingKey = std::array<uint8_t, 4>;

// Client frames are always masked
std::string encode_frame(uint8_t opcode, const std::string& payload, bool fin, const MaskingKey& mask);
std::string encode_frame(uint8_t opcode, const std::string& payload, bool fin = true);

// Random key from the OpenSSL CSPRNG
MaskingKey generate_masking_key();

std::string encode_close_payload(uint16_t code, const std::string& reason);
std::pair<uint16_t, std::string> decode_close_payload(const std::string& payload);

/**
 * Incremental frame parser. Bytes are fed as they arrive from the socket and
 * complete frames are pulled with next(). Protocol violations throw TransportError.
 */
class FrameDecoder {
public:
    explicit FrameDecoder(size_t max_payload = constants::websocket::MAX_MESSAGE_BYTES)
        : max_payload_(max_payload) {}

    void feed(const char* data, size_t length);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    // Returns false when more bytes are needed
    bool next(WebSocketFrame& frame);

    size_t buffered() const { return buffer_.size() - offset_; }

private:
    void compact();

    std::string buffer_;
    size_t offset_{0};
    size_t max_payload_;
    bool in_fragmented_message_{false};
};

} // namespace websocket_transport
