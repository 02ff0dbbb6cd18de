#ifndef AUDIO_PREPARER_HPP
#define AUDIO_PREPARER_HPP

#include <string>
#include <vector>

struct PreparedAudio {
    std::vector<float> samples;  // mono
    int sampleRate = 0;
};

// Normalizes an arbitrary audio or video file into mono PCM samples
class AudioPreparer {
public:
    virtual ~AudioPreparer() = default;

    // Throws SttError ExternalToolFailure or InvalidAudio
    virtual PreparedAudio prepare(const std::string& inputPath) = 0;
};

// Converts through an ffmpeg child process into a temporary WAV file
class FfmpegAudioPreparer : public AudioPreparer {
public:
    struct Config {
        std::string ffmpegPath = "ffmpeg";
        int sampleRate = 16000;
        int channels = 1;
        std::string tempDir;  // empty: system temp directory
    };

    FfmpegAudioPreparer();
    explicit FfmpegAudioPreparer(Config config);

    PreparedAudio prepare(const std::string& inputPath) override;

    // Command line (argv) used to convert inputPath into outputPath
    std::vector<std::string> buildCommand(const std::string& inputPath, const std::string& outputPath) const;

private:
    Config config_;
};

bool isVideoFile(const std::string& path);

#endif
