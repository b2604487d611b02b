#include "base64.hpp"
#include <cctype>
#include <openssl/evp.h>

namespace encoding {

std::string base64_encode(const uint8_t* data, size_t length) {
    if (length == 0) {
        return "";
    }

    std::string result(4 * ((length + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]), data, static_cast<int>(length));
    result.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return result;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

std::string base64_encode(const std::string& data) {
    return base64_encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& input) {
    std::string clean;
    clean.reserve(input.size());
    for (char c : input) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            clean.push_back(c);
        }
    }

    if (clean.empty()) {
        return std::vector<uint8_t>();
    }
    if (clean.size() % 4 != 0) {
        return std::nullopt;
    }

    // Padding is only allowed as the last one or two characters
    size_t first_pad = clean.find('=');
    size_t padding = 0;
    if (first_pad != std::string::npos) {
        padding = clean.size() - first_pad;
        if (padding > 2 || clean.find_first_not_of('=', first_pad) != std::string::npos) {
            return std::nullopt;
        }
    }

    std::vector<uint8_t> output(clean.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(output.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }

    output.resize(static_cast<size_t>(decoded) - padding);
    return output;
}

} // namespace encoding
