#include "websocket_frame.hpp"
#include "i_websocket_transport.hpp"
#include <openssl/rand.h>

namespace websocket_transport {

MaskingKey generate_masking_key() {
    MaskingKey key{};
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        throw TransportError("Failed to generate masking key");
    }
    return key;
}

std::string encode_frame(uint8_t opcode, const std::string& payload, bool fin) {
    return encode_frame(opcode, payload, fin, generate_masking_key());
}

std::string encode_frame(uint8_t opcode, const std::string& payload, bool fin, const MaskingKey& mask) {
    std::string result;
    result.reserve(payload.size() + 14);

    result.push_back(static_cast<char>((fin ? 0x80 : 0x00) | (opcode & 0x0F)));

    const uint64_t length = payload.size();
    if (length < 126) {
        result.push_back(static_cast<char>(0x80 | length));
    } else if (length < 65536) {
        result.push_back(static_cast<char>(0x80 | 126));
        result.push_back(static_cast<char>((length >> 8) & 0xFF));
        result.push_back(static_cast<char>(length & 0xFF));
    } else {
        result.push_back(static_cast<char>(0x80 | 127));
        for (int i = 7; i >= 0; --i) {
            result.push_back(static_cast<char>((length >> (i * 8)) & 0xFF));
        }
    }

    for (uint8_t byte : mask) {
        result.push_back(static_cast<char>(byte));
    }

    for (size_t i = 0; i < payload.size(); ++i) {
        result.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]));
    }
    return result;
}

std::string encode_close_payload(uint16_t code, const std::string& reason) {
    std::string payload;
    payload.push_back(static_cast<char>((code >> 8) & 0xFF));
    payload.push_back(static_cast<char>(code & 0xFF));
    // Control frame payloads are limited to 125 bytes
    payload.append(reason.substr(0, 123));
    return payload;
}

std::pair<uint16_t, std::string> decode_close_payload(const std::string& payload) {
    if (payload.size() < 2) {
        return {static_cast<uint16_t>(1005), ""};  // no status received
    }
    uint16_t code = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) | static_cast<uint8_t>(payload[1]));
    return {code, payload.substr(2)};
}

void FrameDecoder::feed(const char* data, size_t length) {
    buffer_.append(data, length);
}

bool FrameDecoder::next(WebSocketFrame& frame) {
    const size_t available = buffer_.size() - offset_;
    if (available < 2) {
        return false;
    }

    const auto* bytes = reinterpret_cast<const uint8_t*>(buffer_.data() + offset_);

    if (bytes[0] & 0x70) {
        throw TransportError("Reserved bits set without a negotiated extension");
    }

    const bool fin = (bytes[0] & 0x80) != 0;
    const uint8_t opcode = bytes[0] & 0x0F;
    const bool masked = (bytes[1] & 0x80) != 0;
    uint64_t payload_length = bytes[1] & 0x7F;

    size_t header_size = 2;
    if (payload_length == 126) {
        if (available < 4) return false;
        payload_length = (static_cast<uint64_t>(bytes[2]) << 8) | bytes[3];
        header_size = 4;
    } else if (payload_length == 127) {
        if (available < 10) return false;
        payload_length = 0;
        for (int i = 0; i < 8; ++i) {
            payload_length = (payload_length << 8) | bytes[2 + i];
        }
        header_size = 10;
    }

    const bool control = (opcode & 0x08) != 0;
    if (control) {
        if (opcode != WebSocketFrame::OPCODE_CLOSE && opcode != WebSocketFrame::OPCODE_PING &&
            opcode != WebSocketFrame::OPCODE_PONG) {
            throw TransportError("Unknown control opcode " + std::to_string(opcode));
        }
        if (!fin || payload_length > 125) {
            throw TransportError("Invalid control frame");
        }
    } else {
        if (opcode != WebSocketFrame::OPCODE_CONTINUATION && opcode != WebSocketFrame::OPCODE_TEXT &&
            opcode != WebSocketFrame::OPCODE_BINARY) {
            throw TransportError("Unknown data opcode " + std::to_string(opcode));
        }
        if (opcode == WebSocketFrame::OPCODE_CONTINUATION && !in_fragmented_message_) {
            throw TransportError("Continuation frame without a message in progress");
        }
        if (opcode != WebSocketFrame::OPCODE_CONTINUATION && in_fragmented_message_) {
            throw TransportError("New data frame while a fragmented message is in progress");
        }
    }

    if (payload_length > max_payload_) {
        throw TransportError("Frame payload of " + std::to_string(payload_length) + " bytes exceeds limit");
    }

    MaskingKey mask{};
    if (masked) {
        if (available < header_size + 4) return false;
        for (size_t i = 0; i < 4; ++i) {
            mask[i] = bytes[header_size + i];
        }
        header_size += 4;
    }

    if (available < header_size + payload_length) {
        return false;
    }

    frame.fin = fin;
    frame.opcode = opcode;
    frame.payload.assign(buffer_.data() + offset_ + header_size, static_cast<size_t>(payload_length));
    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); ++i) {
            frame.payload[i] = static_cast<char>(static_cast<uint8_t>(frame.payload[i]) ^ mask[i % 4]);
        }
    }

    if (!control) {
        in_fragmented_message_ = !fin;
    }

    offset_ += header_size + static_cast<size_t>(payload_length);
    compact();
    return true;
}

void FrameDecoder::compact() {
    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    } else if (offset_ > 65536) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
}

} // namespace websocket_transport
