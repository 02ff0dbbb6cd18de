#include "pipeline/transcription_pipeline.hpp"
#include "stt/stt_error.hpp"

static void throwIfStopped(const std::atomic<bool>* stopRequested) {
    if (stopRequested && stopRequested->load()) {
        throw SttError(SttErrorKind::Cancelled, "transcription stopped");
    }
}

// Constructor
TranscriptionPipeline::TranscriptionPipeline(TranscriptionEngine& engine, Translator* translator)
    : engine_(engine), translator_(translator) {}

SegmentList TranscriptionPipeline::run(const TranscriptionJob& job, const ProgressSink& onProgress,
                                       const SegmentSink& onSegment, const std::atomic<bool>* stopRequested) {
    throwIfStopped(stopRequested);

    const bool translating = !job.translateTo.empty();
    const bool native = translating && job.nativeTranslation &&
                        job.translateTo == engine_.config().nativeTranslationTarget;

    TranscribeRequest request;
    request.inputPath = job.inputPath;
    request.modelId = job.modelId;
    request.threads = job.threads;
    if (native) request.translateTo = job.translateTo;
    request.onProgress = onProgress;
    request.stopRequested = stopRequested;

    // With text translation the caller sees translated segments only
    if (!translating || native) request.onSegment = onSegment;

    SegmentList segments = engine_.transcribe(request);
    if (!translating || native) return segments;

    throwIfStopped(stopRequested);

    if (!translator_) {
        throw SttError(SttErrorKind::TranslationFailure, "no translation service configured");
    }

    if (onProgress) onProgress("Translating to " + languageName(job.translateTo) + "...");

    const bool keepOriginal = job.keepOriginal;
    SegmentSink sink;
    if (onSegment) {
        sink = [&onSegment, keepOriginal](const Segment& seg) {
            if (keepOriginal) {
                onSegment(seg);
                return;
            }
            Segment copy = seg;
            copy.original.clear();
            onSegment(copy);
        };
    }

    SegmentList translated = translateSegments(*translator_, segments, job.translateTo, onProgress, sink);
    if (!keepOriginal) {
        for (auto& seg : translated) seg.original.clear();
    }

    if (onProgress) onProgress("Translation complete");
    return translated;
}
