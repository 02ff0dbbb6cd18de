#include "stt/transcription_engine.hpp"
#include "stt/progress_poller.hpp"
#include "stt/stt_error.hpp"
#include "util/utf8.hpp"

#include <utility>

static void report(const ProgressSink& sink, const std::string& message) {
    if (sink) sink(message);
}

// Constructors
TranscriptionEngine::TranscriptionEngine(SttRuntime& runtime, AudioPreparer& preparer, const ModelCatalog& catalog)
    : TranscriptionEngine(runtime, preparer, catalog, Config{}) {}

TranscriptionEngine::TranscriptionEngine(SttRuntime& runtime, AudioPreparer& preparer,
                                         const ModelCatalog& catalog, Config config)
    : runtime_(runtime), preparer_(preparer), catalog_(catalog), config_(std::move(config)) {}

SegmentList TranscriptionEngine::transcribe(const TranscribeRequest& request) {
    const bool translating = request.translateTo && !request.translateTo->empty();
    const CacheKey key{request.inputPath, request.modelId};

    // Translated output is never cached: the key does not carry the target language
    if (!translating) {
        if (auto cached = runtime_.transcriptions().get(key)) {
            report(request.onProgress, "Using cached transcription...");
            if (request.onSegment) {
                for (const auto& segment : *cached) request.onSegment(segment);
            }
            report(request.onProgress, "Loaded cached transcription (" + std::to_string(cached->size()) + " segments)");
            return *cached;
        }
    }

    const std::string modelPath = catalog_.resolve(request.modelId);
    std::shared_ptr<ModelHandle> model = runtime_.models().acquire(modelPath);

    // Held until the native results are copied out
    auto inference = model->lock();
    NativeContext* ctx = model->context();
    if (!ctx) {
        throw SttError(SttErrorKind::LoadFailure, "model has been released: " + modelPath);
    }

    report(request.onProgress, "Transcribing with native whisper.cpp (model: " + request.modelId + ")...");
    report(request.onProgress, isVideoFile(request.inputPath) ? "Extracting audio from video..." : "Preparing audio file...");

    PreparedAudio audio = preparer_.prepare(request.inputPath);
    if (audio.sampleRate != config_.sampleRate) {
        throw SttError(SttErrorKind::InvalidAudio,
                       "sample rate must be " + std::to_string(config_.sampleRate) + " Hz, got " +
                       std::to_string(audio.sampleRate));
    }
    if (audio.samples.empty()) {
        throw SttError(SttErrorKind::InvalidAudio, "no audio samples in " + request.inputPath);
    }

    if (request.stopRequested && request.stopRequested->load()) {
        throw SttError(SttErrorKind::Cancelled, "transcription stopped");
    }

    InferenceParams params;
    params.threads = request.threads;
    params.language = config_.language;
    params.translate = translating && *request.translateTo == config_.nativeTranslationTarget;
    params.speakerTurns = config_.speakerTurns;

    report(request.onProgress, "Starting transcription...");

    int status = 0;
    {
        std::atomic<int> progress{0};
        CallbackRegistration registration(runtime_.callbacks(), &progress, request.onLiveSegment);
        CallbackHooks hooks{&runtime_.callbacks(), registration.token()};

        ProgressPoller poller(progress, request.onProgress, config_.pollInterval);
        poller.start();

        // Blocks this thread for the whole inference; cannot be interrupted
        status = runtime_.engine().run(ctx, params, audio.samples, &hooks);
    }  // poller stopped, slot unregistered

    if (status != 0) {
        throw SttError(SttErrorKind::InferenceFailure,
                       "whisper_full failed with code " + std::to_string(status), status);
    }

    SegmentList segments = extractSegments(ctx);
    inference.unlock();

    report(request.onProgress, "Processing " + std::to_string(segments.size()) + " segments...");
    if (request.onSegment) {
        for (const auto& segment : segments) request.onSegment(segment);
    }
    report(request.onProgress, "Transcription complete (" + std::to_string(segments.size()) + " segments)");

    if (!translating) runtime_.transcriptions().put(key, segments);

    return segments;
}

// Reads every segment of the last run. The model lock must be held.
SegmentList TranscriptionEngine::extractSegments(NativeContext* ctx) {
    SpeechEngine& engine = runtime_.engine();

    const int n = engine.segmentCount(ctx);
    SegmentList segments;
    segments.reserve(n > 0 ? (size_t)n : 0);

    // Speaker ids are rebuilt from the turn flags so the result stays
    // consistent even if live segment events were missed
    int speaker = 0;
    bool turnAfterPrevious = false;
    for (int i = 0; i < n; ++i) {
        RawSegment raw = engine.segment(ctx, i);
        if (i > 0 && turnAfterPrevious) ++speaker;
        turnAfterPrevious = raw.speakerTurnNext;

        Segment segment;
        segment.start = centisToSeconds(raw.t0Centis);
        segment.end = centisToSeconds(raw.t1Centis);
        segment.text = sanitizeUtf8(raw.text);
        segment.speaker = speaker;
        segments.push_back(std::move(segment));
    }
    return segments;
}
