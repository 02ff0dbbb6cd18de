#ifndef STT_RUNTIME_HPP
#define STT_RUNTIME_HPP

#include "stt/callback_registry.hpp"
#include "stt/model_cache.hpp"
#include "stt/speech_engine.hpp"
#include "stt/transcription_cache.hpp"

// Process-lifetime state shared by every transcription: loaded models,
// finished transcriptions and the native callback side table.
// Create once at startup, call shutdown() once before exit.
class SttRuntime {
public:
    explicit SttRuntime(SpeechEngine& engine);
    ~SttRuntime();

    SttRuntime(const SttRuntime&) = delete;
    SttRuntime& operator=(const SttRuntime&) = delete;

    SpeechEngine& engine() { return engine_; }
    ModelCache& models() { return models_; }
    TranscriptionCache& transcriptions() { return transcriptions_; }
    CallbackRegistry& callbacks() { return callbacks_; }

    // Frees every native context once in-flight calls finish and drops
    // finished transcriptions
    void shutdown();

private:
    SpeechEngine& engine_;
    ModelCache models_;
    TranscriptionCache transcriptions_;
    CallbackRegistry callbacks_;
};

#endif
