#include "audio/wav_reader.hpp"
#include "stt/stt_error.hpp"

#include <cstring>
#include <fstream>
#include <iterator>

static std::uint32_t le32(const std::uint8_t* p) {
    return (std::uint32_t)p[0] | ((std::uint32_t)p[1] << 8) |
           ((std::uint32_t)p[2] << 16) | ((std::uint32_t)p[3] << 24);
}

static std::uint16_t le16(const std::uint8_t* p) {
    return (std::uint16_t)(p[0] | (p[1] << 8));
}

WavData readWav(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw SttError(SttErrorKind::InvalidAudio, "cannot open audio file: " + path);

    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parseWav(bytes);
}

WavData parseWav(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < 12) throw SttError(SttErrorKind::InvalidAudio, "WAV file too short");

    const std::uint8_t* data = bytes.data();
    if (std::memcmp(data, "RIFF", 4) != 0 || std::memcmp(data + 8, "WAVE", 4) != 0) {
        throw SttError(SttErrorKind::InvalidAudio, "not a valid WAV file");
    }

    WavData wav;
    int bitsPerSample = 0;
    bool haveFmt = false;

    // Walk the chunk list; chunks are word aligned
    std::size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const std::uint8_t* chunk = data + pos;
        const std::uint32_t size = le32(chunk + 4);
        const std::size_t body = pos + 8;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16 || body + 16 > bytes.size()) {
                throw SttError(SttErrorKind::InvalidAudio, "truncated WAV fmt chunk");
            }
            const std::uint16_t format = le16(data + body);
            wav.channels = le16(data + body + 2);
            wav.sampleRate = (int)le32(data + body + 4);
            bitsPerSample = le16(data + body + 14);
            if (format != 1 || bitsPerSample != 16) {
                throw SttError(SttErrorKind::InvalidAudio, "unsupported WAV encoding, expected 16-bit PCM");
            }
            haveFmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!haveFmt) throw SttError(SttErrorKind::InvalidAudio, "WAV data chunk before fmt chunk");

            std::size_t available = bytes.size() - body;
            std::size_t length = size < available ? size : available;
            const std::size_t n = length / 2;

            wav.samples.resize(n);
            for (std::size_t i = 0; i < n; ++i) {
                const auto s = (std::int16_t)le16(data + body + i * 2);
                wav.samples[i] = (float)s / 32768.0f;
            }
            return wav;
        }

        pos = body + size + (size & 1);
    }

    throw SttError(SttErrorKind::InvalidAudio, "WAV file has no data chunk");
}
