#include <gtest/gtest.h>
#include "audio/AudioCanonicalizer.hpp"
#include "audio/Base64.hpp"
#include "audio/MimeType.hpp"
#include "audio/OpusFrameCodec.hpp"
#include "audio/StreamEncoder.hpp"
#include "audio/WavCodec.hpp"
#include "core/AudioError.hpp"
#include <cmath>

namespace {

PcmBuffer sine(int rate, int channels, double seconds, float amp = 0.5f) {
    PcmBuffer pcm;
    pcm.sampleRate = rate;
    pcm.channels   = channels;
    int frames = static_cast<int>(rate * seconds);
    for (int f = 0; f < frames; f++) {
        float v = amp * static_cast<float>(std::sin(2.0 * M_PI * 440.0 * f / rate));
        for (int c = 0; c < channels; c++) pcm.samples.push_back(v);
    }
    return pcm;
}

std::vector<uint8_t> l16Bytes(const PcmBuffer& pcm) {
    L16StreamEncoder enc(pcm.sampleRate, pcm.channels);
    enc.push(pcm.samples.data(), pcm.frames());
    return enc.finish();
}

} // namespace

TEST(MimeTypeTest, ParsesParametersCaseInsensitively) {
    auto m = MimeType::parse("Audio/L16; Rate=48000; channels=\"2\"");
    EXPECT_EQ(m.type, "audio");
    EXPECT_EQ(m.subtype, "l16");
    EXPECT_EQ(m.intParam("rate", 0), 48000);
    EXPECT_EQ(m.intParam("channels", 0), 2);
    EXPECT_EQ(m.intParam("missing", 7), 7);
}

TEST(MimeTypeTest, RecognisesWavAliases) {
    EXPECT_TRUE(MimeType::parse("audio/wav").isWav());
    EXPECT_TRUE(MimeType::parse("audio/x-wav").isWav());
    EXPECT_TRUE(MimeType::parse("audio/vnd.wave; codec=1").isWav());
    EXPECT_FALSE(MimeType::parse("audio/ogg").isWav());
}

TEST(Base64Test, DecodesWithPaddingAndWhitespace) {
    auto bytes = base64Decode("aGVs\nbG8=");
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "hello");

    std::vector<uint8_t> two = {0xFF, 0x00};
    EXPECT_EQ(base64Encode(two), "/wA=");
    EXPECT_EQ(base64Decode("/wA="), two);
    EXPECT_TRUE(base64Decode("").empty());
}

TEST(Base64Test, MalformedInputIsDecodeFailure) {
    try {
        base64Decode("abc");
        FAIL() << "expected AudioException";
    } catch (const AudioException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DecodeFailure);
    }
    EXPECT_THROW(base64Decode("@@@@"), AudioException);
}

TEST(StreamEncoderTest, L16IsBigEndianAndDescribed) {
    L16StreamEncoder enc(16000, 1);
    float s[] = {1.0f, -1.0f, 0.0f};
    enc.push(s, 3);
    EXPECT_EQ(enc.mime(), "audio/L16;rate=16000;channels=1");
    EXPECT_EQ(enc.bytesEncoded(), 6u);

    auto out = enc.finish();
    ASSERT_EQ(out.size(), 6u);
    EXPECT_EQ(out[0], 0x7F);
    EXPECT_EQ(out[1], 0xFF);
    EXPECT_EQ(out[2], 0x80);
    EXPECT_EQ(out[3], 0x00);
}

TEST(StreamEncoderTest, DecodeL16RequiresShape) {
    std::vector<uint8_t> bytes = {0, 1, 0, 2};
    EXPECT_THROW(decodeL16(bytes, 0, 1), AudioException);
    EXPECT_THROW(decodeL16({0, 1, 2}, 16000, 1), AudioException);
    EXPECT_EQ(decodeL16(bytes, 16000, 2).frames(), 1u);
}

TEST(StreamEncoderTest, TypeSupportAndFallback) {
    EXPECT_TRUE(isTypeSupported("audio/x-opus-frames", 48000, 1));
    EXPECT_FALSE(isTypeSupported("audio/x-opus-frames", 44100, 2));
    EXPECT_TRUE(isTypeSupported("audio/L16", 44100, 2));
    EXPECT_FALSE(isTypeSupported("audio/webm;codecs=opus", 48000, 1));

    EXPECT_EQ(makeStreamEncoder("audio/x-opus-frames", 48000, 1)->mime(),
              OpusStreamEncoder::kMime);
    EXPECT_EQ(makeStreamEncoder("audio/x-opus-frames", 44100, 1)->mime(),
              "audio/L16;rate=44100;channels=1");
    EXPECT_EQ(makeStreamEncoder("", 8000, 2)->mime(),
              "audio/L16;rate=8000;channels=2");
}

TEST(OpusFrameCodecTest, DecodedLengthMatchesInput) {
    auto pcm = sine(48000, 1, 0.25);
    // Not a multiple of the 20ms frame
    pcm.samples.resize(pcm.samples.size() - 100);

    OpusStreamEncoder enc(48000, 1);
    enc.push(pcm.samples.data(), pcm.frames());
    auto bytes = enc.finish();
    ASSERT_GT(bytes.size(), 4u);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "VXOP");

    auto decoded = decodeOpusFrames(bytes);
    EXPECT_EQ(decoded.sampleRate, 48000);
    EXPECT_EQ(decoded.channels, 1);
    EXPECT_EQ(decoded.frames(), pcm.frames());
}

TEST(OpusFrameCodecTest, RejectsForeignBytes) {
    EXPECT_THROW(decodeOpusFrames({'R', 'I', 'F', 'F', 0, 0}), AudioException);
    EXPECT_THROW(OpusStreamEncoder(44100, 1), AudioException);
}

TEST(WavCodecTest, EncodesPcm16WithSameShape) {
    auto pcm = sine(22050, 2, 0.1);
    auto wav = WavCodec::encodePcm16(pcm);
    EXPECT_EQ(std::string(wav.begin(), wav.begin() + 4), "RIFF");
    EXPECT_TRUE(WavCodec::isPcm16Wav(wav));

    auto back = WavCodec::decode(wav);
    EXPECT_EQ(back.sampleRate, 22050);
    EXPECT_EQ(back.channels, 2);
    EXPECT_EQ(back.frames(), pcm.frames());
    EXPECT_NEAR(back.samples[101], pcm.samples[101], 1e-3);
}

TEST(WavCodecTest, GarbageIsNotWav) {
    std::vector<uint8_t> junk(64, 0x42);
    EXPECT_FALSE(WavCodec::isPcm16Wav(junk));
    EXPECT_FALSE(WavCodec::isPcm16Wav({}));
    EXPECT_THROW(WavCodec::decode(junk), AudioException);
}

TEST(WavCodecTest, EncodeNeedsShape) {
    PcmBuffer pcm;
    pcm.samples = {0.1f};
    EXPECT_THROW(WavCodec::encodePcm16(pcm), AudioException);
}

TEST(CanonicalizerTest, ConvertsL16ToWav) {
    auto pcm = sine(16000, 1, 0.2);
    WavCanonicalizer canon;
    auto wav = canon.convert(l16Bytes(pcm), "audio/L16;rate=16000;channels=1");

    EXPECT_TRUE(WavCodec::isPcm16Wav(wav));
    auto back = WavCodec::decode(wav);
    EXPECT_EQ(back.frames(), pcm.frames());
    EXPECT_EQ(canon.canonicalMime(), "audio/wav");
}

TEST(CanonicalizerTest, IdempotentOnCanonicalInput) {
    WavCanonicalizer canon;
    auto once  = canon.convert(WavCodec::encodePcm16(sine(16000, 1, 0.1)), "audio/wav");
    auto twice = canon.convert(once, "audio/wav");
    EXPECT_EQ(once, twice);
}

TEST(CanonicalizerTest, ConvertsOpusFrames) {
    auto pcm = sine(16000, 1, 0.3);
    OpusStreamEncoder enc(16000, 1);
    enc.push(pcm.samples.data(), pcm.frames());

    WavCanonicalizer canon;
    auto wav = canon.convert(enc.finish(), OpusStreamEncoder::kMime);
    EXPECT_NEAR(WavCodec::decode(wav).durationSeconds(), 0.3, 0.001);
}

TEST(CanonicalizerTest, FailuresAreEncodeFailure) {
    WavCanonicalizer canon;
    for (auto& [bytes, mime] : std::vector<std::pair<std::vector<uint8_t>, std::string>>{
             {{}, "audio/wav"},
             {{1, 2, 3, 4}, "application/octet-stream"},
             {{1, 2, 3}, "audio/L16"}}) {
        try {
            canon.convert(bytes, mime);
            ADD_FAILURE() << "accepted " << mime;
        } catch (const AudioException& e) {
            EXPECT_EQ(e.kind(), ErrorKind::EncodeFailure) << mime;
        }
    }
}

TEST(DecodeAudioTest, DispatchesOnMime) {
    auto pcm = sine(8000, 2, 0.05);
    auto fromL16 = decodeAudio(l16Bytes(pcm), "audio/L16; rate=8000; channels=2");
    EXPECT_EQ(fromL16.channels, 2);
    EXPECT_EQ(fromL16.frames(), pcm.frames());

    auto fromWav = decodeAudio(WavCodec::encodePcm16(pcm), "");
    EXPECT_EQ(fromWav.sampleRate, 8000);

    EXPECT_THROW(decodeAudio({}, "audio/wav"), AudioException);
}
