#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// OpenSSL-backed base64. decode ignores whitespace and throws
// AudioException(DecodeFailure) on malformed input.
std::vector<uint8_t> base64Decode(const std::string& text);
std::string          base64Encode(const uint8_t* data, size_t size);

inline std::string base64Encode(const std::vector<uint8_t>& data) {
    return base64Encode(data.data(), data.size());
}
