#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace encoding {

// Standard alphabet with padding, no line breaks
std::string base64_encode(const uint8_t* data, size_t length);
std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& data);

// Whitespace is ignored. Returns nullopt for anything that is not valid padded base64.
std::optional<std::vector<uint8_t>> base64_decode(const std::string& input);

} // namespace encoding
