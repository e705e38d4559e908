#include "audio/Base64.hpp"
#include "core/AudioError.hpp"
#include <openssl/evp.h>
#include <cctype>

std::vector<uint8_t> base64Decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text)
        if (!std::isspace(static_cast<unsigned char>(c)))
            clean.push_back(c);

    if (clean.empty()) return {};
    if (clean.size() % 4 != 0)
        throw AudioException(ErrorKind::DecodeFailure,
                             "base64 length " + std::to_string(clean.size()) +
                             " is not a multiple of 4");

    std::vector<uint8_t> out(clean.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0)
        throw AudioException(ErrorKind::DecodeFailure, "invalid base64 payload");

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') padding++;
    if (clean[clean.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

std::string base64Encode(const uint8_t* data, size_t size) {
    if (size == 0) return {};
    std::string out(4 * ((size + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            data, static_cast<int>(size));
    out.resize(static_cast<size_t>(n));
    return out;
}
