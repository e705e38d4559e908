#pragma once
#include "IStreamEncoder.hpp"
#include "PcmBuffer.hpp"
#include <memory>
#include <string>

// Platform default container: raw big-endian 16-bit PCM (RFC 2586),
// described by "audio/L16;rate=R;channels=C".
class L16StreamEncoder : public IStreamEncoder {
public:
    L16StreamEncoder(int sampleRate, int channels)
        : sampleRate_(sampleRate), channels_(channels) {}

    std::string mime() const override;
    void push(const float* interleaved, size_t frames) override;
    std::vector<uint8_t> finish() override { return std::move(out_); }
    size_t bytesEncoded() const override { return out_.size(); }

private:
    int sampleRate_;
    int channels_;
    std::vector<uint8_t> out_;
};

PcmBuffer decodeL16(const std::vector<uint8_t>& bytes, int sampleRate, int channels);

// Whether `mime` can be produced for a stream of this shape.
bool isTypeSupported(const std::string& mime, int sampleRate, int channels);

// Preferred codec if supported, else the L16 fallback.
std::unique_ptr<IStreamEncoder> makeStreamEncoder(const std::string& preferredMime,
                                                  int sampleRate, int channels);
