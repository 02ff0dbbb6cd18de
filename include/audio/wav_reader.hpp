#ifndef WAV_READER_HPP
#define WAV_READER_HPP

#include <cstdint>
#include <string>
#include <vector>

struct WavData {
    std::vector<float> samples;  // [-1, 1), channels interleaved
    int sampleRate = 0;
    int channels = 0;
};

// Reads a 16-bit PCM RIFF/WAVE file. Throws SttError InvalidAudio.
WavData readWav(const std::string& path);

// Same, over an in-memory file image
WavData parseWav(const std::vector<std::uint8_t>& bytes);

#endif
