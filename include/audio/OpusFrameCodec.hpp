#pragma once
#include "IStreamEncoder.hpp"
#include "PcmBuffer.hpp"

// Forward declare libopus types to avoid including opus.h in header
struct OpusEncoder;

// Opus packets in a small length-prefixed container:
//
//   "VXOP" | u8 version | u8 channels | u32 sampleRate | u16 frameSize
//   | u32 totalFrames | { u16 packetLength | packet }*
//
// All integers little-endian. totalFrames is patched in finish() so the
// decoder can drop the padding of the last 20ms frame.
class OpusStreamEncoder : public IStreamEncoder {
public:
    static constexpr const char* kMime = "audio/x-opus-frames";

    OpusStreamEncoder(int sampleRate, int channels, int bitrate = 64000);
    ~OpusStreamEncoder() override;

    OpusStreamEncoder(const OpusStreamEncoder&) = delete;
    OpusStreamEncoder& operator=(const OpusStreamEncoder&) = delete;

    std::string mime() const override { return kMime; }
    void push(const float* interleaved, size_t frames) override;
    std::vector<uint8_t> finish() override;
    size_t bytesEncoded() const override { return out_.size(); }

    static bool supports(int sampleRate, int channels);

private:
    void encodeFrame(const float* frame);

    OpusEncoder*         encoder_ = nullptr;
    int                  sampleRate_;
    int                  channels_;
    int                  frameSize_;     // samples per channel per packet
    std::vector<float>   pending_;
    std::vector<uint8_t> out_;
    uint32_t             totalFrames_ = 0;
};

PcmBuffer decodeOpusFrames(const std::vector<uint8_t>& bytes);
