#include "audio/audio_preparer.hpp"
#include "audio/wav_reader.hpp"
#include "stt/stt_error.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <set>
#include <utility>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

// Removes the file when it goes out of scope
class TempFile {
public:
    explicit TempFile(std::string path) : path_(std::move(path)) {}
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::string makeTempWav(const std::string& dir) {
    std::string base = dir;
    if (base.empty()) {
        std::error_code ec;
        base = std::filesystem::temp_directory_path(ec).string();
        if (ec) base = "/tmp";
    }

    std::string pattern = (std::filesystem::path(base) / "whisper_audio_XXXXXX.wav").string();
    std::vector<char> buff(pattern.begin(), pattern.end());
    buff.push_back('\0');

    const int fd = ::mkstemps(buff.data(), 4);
    if (fd < 0) {
        throw SttError(SttErrorKind::ExternalToolFailure,
                       std::string("cannot create temporary audio file: ") + std::strerror(errno));
    }
    ::close(fd);
    return std::string(buff.data());
}

// Runs argv[0] from PATH and waits for it. Returns the exit status.
int runProcess(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = 0;
    const int rc = ::posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        throw SttError(SttErrorKind::ExternalToolFailure,
                       "cannot start " + args[0] + ": " + std::strerror(rc) + " (is ffmpeg installed?)");
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw SttError(SttErrorKind::ExternalToolFailure,
                           std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

}  // namespace

// Constructors
FfmpegAudioPreparer::FfmpegAudioPreparer() : FfmpegAudioPreparer(Config{}) {}

FfmpegAudioPreparer::FfmpegAudioPreparer(Config config) : config_(std::move(config)) {}

std::vector<std::string> FfmpegAudioPreparer::buildCommand(const std::string& inputPath,
                                                           const std::string& outputPath) const {
    return {
        config_.ffmpegPath,
        "-hide_banner", "-loglevel", "error",
        "-i", inputPath,
        "-vn",
        "-acodec", "pcm_s16le",
        "-ar", std::to_string(config_.sampleRate),
        "-ac", std::to_string(config_.channels),
        "-f", "wav",
        "-y",
        outputPath,
    };
}

// Converts inputPath to mono PCM at the configured rate
PreparedAudio FfmpegAudioPreparer::prepare(const std::string& inputPath) {
    TempFile wav(makeTempWav(config_.tempDir));

    const int status = runProcess(buildCommand(inputPath, wav.path()));
    if (status != 0) {
        throw SttError(SttErrorKind::ExternalToolFailure,
                       "ffmpeg conversion failed with exit status " + std::to_string(status));
    }

    WavData data = readWav(wav.path());
    if (data.channels != 1) {
        throw SttError(SttErrorKind::InvalidAudio,
                       "expected mono audio, got " + std::to_string(data.channels) + " channels");
    }

    PreparedAudio out;
    out.samples = std::move(data.samples);
    out.sampleRate = data.sampleRate;
    return out;
}

bool isVideoFile(const std::string& path) {
    static const std::set<std::string> kVideoExts = {
        ".mp4", ".avi", ".mov", ".mkv", ".webm", ".flv", ".wmv", ".m4v", ".3gp",
    };

    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return kVideoExts.count(ext) != 0;
}
