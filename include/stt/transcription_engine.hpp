#ifndef TRANSCRIPTION_ENGINE_HPP
#define TRANSCRIPTION_ENGINE_HPP

#include "audio/audio_preparer.hpp"
#include "config/model_catalog.hpp"
#include "stt/segment.hpp"
#include "stt/stt_runtime.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

struct TranscribeRequest {
    std::string inputPath;
    std::string modelId;
    int threads = 4;

    // Unset or empty: plain transcription, served from and stored in the cache
    std::optional<std::string> translateTo;

    ProgressSink onProgress;
    SegmentSink onSegment;      // final segments, in order, once inference is done
    SegmentSink onLiveSegment;  // segments as the engine decodes them

    // Checked once, right before the native call starts
    const std::atomic<bool>* stopRequested = nullptr;
};

// Runs one transcription against the shared runtime state.
// Safe to call from many threads at once: calls on the same model are
// serialized by that model's lock, calls on different models run in parallel.
class TranscriptionEngine {
public:
    struct Config {
        std::string language = "he";
        int sampleRate = 16000;
        std::chrono::milliseconds pollInterval{200};

        // The only language the native engine can translate into
        std::string nativeTranslationTarget = "en";
        bool speakerTurns = true;
    };

    TranscriptionEngine(SttRuntime& runtime, AudioPreparer& preparer, const ModelCatalog& catalog);
    TranscriptionEngine(SttRuntime& runtime, AudioPreparer& preparer, const ModelCatalog& catalog, Config config);

    TranscriptionEngine(const TranscriptionEngine&) = delete;
    TranscriptionEngine& operator=(const TranscriptionEngine&) = delete;

    // Throws SttError: NotFound, LoadFailure, InvalidAudio,
    // ExternalToolFailure, InferenceFailure, Cancelled
    SegmentList transcribe(const TranscribeRequest& request);

    bool supportsModel(const std::string& modelId) const { return catalog_.contains(modelId); }

    const Config& config() const { return config_; }

private:
    SegmentList extractSegments(NativeContext* ctx);

    SttRuntime& runtime_;
    AudioPreparer& preparer_;
    const ModelCatalog& catalog_;
    Config config_;
};

#endif
