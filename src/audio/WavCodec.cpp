#include "audio/WavCodec.hpp"
#include "core/AudioError.hpp"
#include <sndfile.h>
#include <algorithm>
#include <cstring>
#include <memory>

namespace {

// Backing store for SF_VIRTUAL_IO. Reads come from `in`, writes go to `out`.
struct MemoryStream {
    const std::vector<uint8_t>* in  = nullptr;
    std::vector<uint8_t>*       out = nullptr;
    sf_count_t                  pos = 0;

    sf_count_t size() const {
        return static_cast<sf_count_t>(out ? out->size() : in->size());
    }
};

sf_count_t vioLength(void* user) {
    return static_cast<MemoryStream*>(user)->size();
}

sf_count_t vioSeek(sf_count_t offset, int whence, void* user) {
    auto* s = static_cast<MemoryStream*>(user);
    sf_count_t base = 0;
    switch (whence) {
        case SEEK_SET: base = 0;         break;
        case SEEK_CUR: base = s->pos;    break;
        case SEEK_END: base = s->size(); break;
        default: return -1;
    }
    s->pos = std::max<sf_count_t>(0, base + offset);
    return s->pos;
}

sf_count_t vioRead(void* ptr, sf_count_t count, void* user) {
    auto* s = static_cast<MemoryStream*>(user);
    const auto& src = s->out ? *s->out : *s->in;
    sf_count_t avail = static_cast<sf_count_t>(src.size()) - s->pos;
    sf_count_t n = std::max<sf_count_t>(0, std::min(count, avail));
    if (n > 0) std::memcpy(ptr, src.data() + s->pos, static_cast<size_t>(n));
    s->pos += n;
    return n;
}

sf_count_t vioWrite(const void* ptr, sf_count_t count, void* user) {
    auto* s = static_cast<MemoryStream*>(user);
    if (!s->out) return 0;
    size_t end = static_cast<size_t>(s->pos + count);
    if (end > s->out->size()) s->out->resize(end);
    std::memcpy(s->out->data() + s->pos, ptr, static_cast<size_t>(count));
    s->pos += count;
    return count;
}

sf_count_t vioTell(void* user) {
    return static_cast<MemoryStream*>(user)->pos;
}

SF_VIRTUAL_IO makeVio() {
    SF_VIRTUAL_IO vio;
    vio.get_filelen = vioLength;
    vio.seek        = vioSeek;
    vio.read        = vioRead;
    vio.write       = vioWrite;
    vio.tell        = vioTell;
    return vio;
}

using SndFilePtr = std::unique_ptr<SNDFILE, int (*)(SNDFILE*)>;

SndFilePtr openRead(MemoryStream& stream, SF_INFO& info, SF_VIRTUAL_IO& vio) {
    std::memset(&info, 0, sizeof(info));
    return SndFilePtr(sf_open_virtual(&vio, SFM_READ, &info, &stream), sf_close);
}

} // namespace

std::vector<uint8_t> WavCodec::encodePcm16(const PcmBuffer& pcm) {
    if (pcm.sampleRate <= 0 || pcm.channels <= 0)
        throw AudioException(ErrorKind::EncodeFailure,
                             "cannot encode WAV without sample rate and channels");

    std::vector<uint8_t> out;
    MemoryStream stream;
    stream.out = &out;
    auto vio = makeVio();

    SF_INFO info;
    std::memset(&info, 0, sizeof(info));
    info.samplerate = pcm.sampleRate;
    info.channels   = pcm.channels;
    info.format     = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    {
        SndFilePtr file(sf_open_virtual(&vio, SFM_WRITE, &info, &stream), sf_close);
        if (!file)
            throw AudioException(ErrorKind::EncodeFailure,
                                 std::string("sf_open_virtual(write): ") +
                                 sf_strerror(nullptr));

        sf_command(file.get(), SFC_SET_CLIPPING, nullptr, SF_TRUE);
        sf_count_t frames = static_cast<sf_count_t>(pcm.frames());
        if (frames > 0 && sf_writef_float(file.get(), pcm.samples.data(), frames) != frames)
            throw AudioException(ErrorKind::EncodeFailure,
                                 std::string("sf_writef_float: ") +
                                 sf_strerror(file.get()));
    }   // sf_close rewrites the header with final sizes

    return out;
}

PcmBuffer WavCodec::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty())
        throw AudioException(ErrorKind::DecodeFailure, "empty audio payload");

    MemoryStream stream;
    stream.in = &bytes;
    auto vio = makeVio();
    SF_INFO info;
    auto file = openRead(stream, info, vio);
    if (!file)
        throw AudioException(ErrorKind::DecodeFailure,
                             std::string("unrecognised audio container: ") +
                             sf_strerror(nullptr));

    PcmBuffer pcm;
    pcm.sampleRate = info.samplerate;
    pcm.channels   = info.channels;
    if (info.frames > 0 && info.frames < (1LL << 31))
        pcm.samples.reserve(static_cast<size_t>(info.frames) * info.channels);

    std::vector<float> chunk(4096 * static_cast<size_t>(info.channels));
    while (true) {
        sf_count_t n = sf_readf_float(file.get(), chunk.data(), 4096);
        if (n <= 0) break;
        pcm.samples.insert(pcm.samples.end(), chunk.begin(),
                           chunk.begin() + n * info.channels);
    }
    return pcm;
}

bool WavCodec::isPcm16Wav(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) return false;
    MemoryStream stream;
    stream.in = &bytes;
    auto vio = makeVio();
    SF_INFO info;
    auto file = openRead(stream, info, vio);
    if (!file) return false;
    return (info.format & SF_FORMAT_TYPEMASK) == SF_FORMAT_WAV &&
           (info.format & SF_FORMAT_SUBMASK) == SF_FORMAT_PCM_16;
}
