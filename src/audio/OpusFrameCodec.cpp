#include "audio/OpusFrameCodec.hpp"
#include "core/AudioError.hpp"
#include <opus/opus.h>
#include <algorithm>
#include <cstring>
#include <memory>

namespace {

constexpr size_t kHeaderSize    = 16;
constexpr int    kMaxPacket     = 4000;
constexpr int    kMaxFrameSize  = 5760;   // 120ms at 48kHz
constexpr size_t kTotalFramesAt = 12;

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; i++)
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

uint16_t getU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t getU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

OpusStreamEncoder::OpusStreamEncoder(int sampleRate, int channels, int bitrate)
    : sampleRate_(sampleRate)
    , channels_(channels)
    , frameSize_(sampleRate / 50)   // 20ms
{
    if (!supports(sampleRate, channels))
        throw AudioException(ErrorKind::EncodeFailure,
                             "Opus does not support " + std::to_string(sampleRate) +
                             "Hz/" + std::to_string(channels) + "ch");

    int error = OPUS_OK;
    encoder_ = opus_encoder_create(sampleRate, channels, OPUS_APPLICATION_VOIP, &error);
    if (error != OPUS_OK || !encoder_)
        throw AudioException(ErrorKind::EncodeFailure,
                             std::string("opus_encoder_create: ") + opus_strerror(error));

    opus_encoder_ctl(encoder_, OPUS_SET_BITRATE(bitrate));
    opus_encoder_ctl(encoder_, OPUS_SET_VBR(1));
    opus_encoder_ctl(encoder_, OPUS_SET_COMPLEXITY(10));

    out_.insert(out_.end(), {'V', 'X', 'O', 'P'});
    out_.push_back(1);
    out_.push_back(static_cast<uint8_t>(channels));
    putU32(out_, static_cast<uint32_t>(sampleRate));
    putU16(out_, static_cast<uint16_t>(frameSize_));
    putU32(out_, 0);
}

OpusStreamEncoder::~OpusStreamEncoder() {
    if (encoder_)
        opus_encoder_destroy(encoder_);
}

bool OpusStreamEncoder::supports(int sampleRate, int channels) {
    switch (sampleRate) {
        case 8000: case 12000: case 16000: case 24000: case 48000:
            return channels == 1 || channels == 2;
        default:
            return false;
    }
}

void OpusStreamEncoder::push(const float* interleaved, size_t frames) {
    pending_.insert(pending_.end(), interleaved, interleaved + frames * channels_);
    totalFrames_ += static_cast<uint32_t>(frames);

    size_t frameSamples = static_cast<size_t>(frameSize_) * channels_;
    size_t offset = 0;
    while (pending_.size() - offset >= frameSamples) {
        encodeFrame(pending_.data() + offset);
        offset += frameSamples;
    }
    pending_.erase(pending_.begin(), pending_.begin() + offset);
}

void OpusStreamEncoder::encodeFrame(const float* frame) {
    unsigned char packet[kMaxPacket];
    int bytes = opus_encode_float(encoder_, frame, frameSize_, packet, kMaxPacket);
    if (bytes < 0)
        throw AudioException(ErrorKind::EncodeFailure,
                             std::string("opus_encode_float: ") + opus_strerror(bytes));
    putU16(out_, static_cast<uint16_t>(bytes));
    out_.insert(out_.end(), packet, packet + bytes);
}

std::vector<uint8_t> OpusStreamEncoder::finish() {
    if (!pending_.empty()) {
        pending_.resize(static_cast<size_t>(frameSize_) * channels_, 0.0f);
        encodeFrame(pending_.data());
        pending_.clear();
    }
    for (int i = 0; i < 4; i++)
        out_[kTotalFramesAt + i] = static_cast<uint8_t>((totalFrames_ >> (8 * i)) & 0xFF);
    return std::move(out_);
}

PcmBuffer decodeOpusFrames(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kHeaderSize || std::memcmp(bytes.data(), "VXOP", 4) != 0)
        throw AudioException(ErrorKind::DecodeFailure, "not an Opus frame stream");
    if (bytes[4] != 1)
        throw AudioException(ErrorKind::DecodeFailure,
                             "unsupported Opus frame stream version " +
                             std::to_string(bytes[4]));

    PcmBuffer pcm;
    pcm.channels   = bytes[5];
    pcm.sampleRate = static_cast<int>(getU32(&bytes[6]));
    uint32_t totalFrames = getU32(&bytes[kTotalFramesAt]);

    int error = OPUS_OK;
    std::unique_ptr<OpusDecoder, void (*)(OpusDecoder*)> decoder(
        opus_decoder_create(pcm.sampleRate, pcm.channels, &error),
        opus_decoder_destroy);
    if (error != OPUS_OK || !decoder)
        throw AudioException(ErrorKind::DecodeFailure,
                             std::string("opus_decoder_create: ") + opus_strerror(error));

    std::vector<float> frame(static_cast<size_t>(kMaxFrameSize) * pcm.channels);
    size_t pos = kHeaderSize;
    while (pos + 2 <= bytes.size()) {
        uint16_t len = getU16(&bytes[pos]);
        pos += 2;
        if (pos + len > bytes.size())
            throw AudioException(ErrorKind::DecodeFailure, "truncated Opus packet");

        int n = opus_decode_float(decoder.get(), &bytes[pos], len,
                                  frame.data(), kMaxFrameSize, 0);
        if (n < 0)
            throw AudioException(ErrorKind::DecodeFailure,
                                 std::string("opus_decode_float: ") + opus_strerror(n));
        pcm.samples.insert(pcm.samples.end(), frame.begin(),
                           frame.begin() + static_cast<size_t>(n) * pcm.channels);
        pos += len;
    }

    size_t wanted = static_cast<size_t>(totalFrames) * pcm.channels;
    if (pcm.samples.size() > wanted)
        pcm.samples.resize(wanted);
    return pcm;
}
