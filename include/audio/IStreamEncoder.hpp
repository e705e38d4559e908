#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Incremental encoder fed with drained capture chunks.
class IStreamEncoder {
public:
    virtual ~IStreamEncoder() = default;

    virtual std::string mime() const = 0;

    // Interleaved float samples, `frames` frames.
    virtual void push(const float* interleaved, size_t frames) = 0;

    // Flushes any partial frame and returns the complete stream.
    virtual std::vector<uint8_t> finish() = 0;

    virtual size_t bytesEncoded() const = 0;
};
