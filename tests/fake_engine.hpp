#ifndef FAKE_ENGINE_HPP
#define FAKE_ENGINE_HPP

#include "audio/audio_preparer.hpp"
#include "config/model_catalog.hpp"
#include "stt/speech_engine.hpp"
#include "stt/stt_error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

// What a fake model produces when run
struct FakeScript {
    std::vector<RawSegment> segments;
    int status = 0;
    std::vector<int> progressSteps;
    bool liveSegments = true;
    std::chrono::milliseconds runTime{0};
    bool throwInRun = false;
};

struct RunWindow {
    std::string modelPath;
    std::chrono::steady_clock::time_point begin;
    std::chrono::steady_clock::time_point end;
};

// Scriptable in-process SpeechEngine
class FakeEngine : public SpeechEngine {
public:
    NativeContext* load(const std::string& modelPath) override;
    void release(NativeContext* ctx) override;
    int run(NativeContext* ctx, const InferenceParams& params,
            const std::vector<float>& samples, const CallbackHooks* hooks) override;
    int segmentCount(NativeContext* ctx) override;
    RawSegment segment(NativeContext* ctx, int index) override;

    void setScript(const std::string& modelPath, FakeScript script);
    void rejectModel(const std::string& modelPath);

    // run() waits (up to timeout) until this many runs are in flight at once
    void setRendezvous(int runs, std::chrono::milliseconds timeout);

    // Delay inside load(), to widen the load race window
    void setLoadDelay(std::chrono::milliseconds delay) { loadDelay_ = delay; }

    int loadCount(const std::string& modelPath) const;
    int releaseCount() const { return releases_.load(); }
    int runCount() const { return runs_.load(); }
    int liveContexts() const { return live_.load(); }
    int maxConcurrentRuns() const { return maxActive_.load(); }
    bool sameContextOverlap() const { return overlap_.load(); }
    bool rendezvousReached() const { return rendezvousReached_.load(); }

    std::vector<RunWindow> windows() const;
    std::vector<CallbackRegistry::Token> tokens() const;
    InferenceParams lastParams() const;

private:
    struct Context {
        std::string path;
        FakeScript script;
        std::atomic<int> active{0};
    };

    static Context* fake(NativeContext* ctx) { return reinterpret_cast<Context*>(ctx); }

    mutable std::mutex mutex_;
    std::map<std::string, FakeScript> scripts_;
    std::set<std::string> rejected_;
    std::map<std::string, int> loads_;
    std::vector<RunWindow> windows_;
    std::vector<CallbackRegistry::Token> tokens_;
    InferenceParams lastParams_;

    std::chrono::milliseconds loadDelay_{0};

    std::atomic<int> releases_{0};
    std::atomic<int> runs_{0};
    std::atomic<int> live_{0};
    std::atomic<int> active_{0};
    std::atomic<int> maxActive_{0};
    std::atomic<bool> overlap_{false};

    std::mutex rendezvousMutex_;
    std::condition_variable rendezvousCv_;
    int rendezvousRuns_ = 0;
    std::chrono::milliseconds rendezvousTimeout_{0};
    std::atomic<bool> rendezvousReached_{false};
};

// Returns a fixed buffer instead of running ffmpeg
class FakeAudioPreparer : public AudioPreparer {
public:
    PreparedAudio prepare(const std::string& inputPath) override;

    int sampleRate = 16000;
    std::size_t sampleCount = 16000;
    std::optional<SttErrorKind> failWith;

    int calls() const { return calls_.load(); }

private:
    std::atomic<int> calls_{0};
};

// Temporary directory holding empty model files, removed on destruction
class ModelDir {
public:
    explicit ModelDir(std::initializer_list<std::string> modelIds);
    ~ModelDir();

    ModelDir(const ModelDir&) = delete;
    ModelDir& operator=(const ModelDir&) = delete;

    const std::string& path() const { return path_; }
    std::string modelPath(const std::string& modelId) const;
    ModelCatalog catalog() const;

private:
    std::string path_;
    std::vector<std::string> ids_;
};

RawSegment rawSegment(long long t0, long long t1, const std::string& text, bool turnNext = false);

#endif
