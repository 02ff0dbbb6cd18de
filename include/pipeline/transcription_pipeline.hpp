#ifndef TRANSCRIPTION_PIPELINE_HPP
#define TRANSCRIPTION_PIPELINE_HPP

#include "stt/segment.hpp"
#include "stt/transcription_engine.hpp"
#include "translate/translator.hpp"

#include <atomic>
#include <string>

struct TranscriptionJob {
    std::string inputPath;
    std::string modelId = "turbo";
    int threads = 4;

    std::string translateTo;   // empty: no translation
    bool keepOriginal = true;  // keep the source text next to the translation

    // Translate inside the native engine when it supports the target
    // instead of going through the text translation service
    bool nativeTranslation = false;
};

// transcribe -> (stop check) -> translate -> keep-original policy.
// A stop request is honoured only between stages; a running native call is
// always allowed to finish.
class TranscriptionPipeline {
public:
    // translator may be null when no job asks for text translation
    TranscriptionPipeline(TranscriptionEngine& engine, Translator* translator);

    // Throws SttError. A translation failure fails the whole job and the
    // finished transcription is not returned.
    SegmentList run(const TranscriptionJob& job,
                    const ProgressSink& onProgress = nullptr,
                    const SegmentSink& onSegment = nullptr,
                    const std::atomic<bool>* stopRequested = nullptr);

private:
    TranscriptionEngine& engine_;
    Translator* translator_;
};

#endif
