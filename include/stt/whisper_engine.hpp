#ifndef WHISPER_ENGINE_HPP
#define WHISPER_ENGINE_HPP

#include "stt/speech_engine.hpp"

#include <string>
#include <vector>

// SpeechEngine backed by whisper.cpp
class WhisperEngine : public SpeechEngine {
public:
    struct Config {
        bool useGpu = true;
        bool flashAttn = false;
    };

    WhisperEngine();
    explicit WhisperEngine(Config config);

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    NativeContext* load(const std::string& modelPath) override;
    void release(NativeContext* ctx) override;

    int run(NativeContext* ctx, const InferenceParams& params,
            const std::vector<float>& samples, const CallbackHooks* hooks) override;

    int segmentCount(NativeContext* ctx) override;
    RawSegment segment(NativeContext* ctx, int index) override;

private:
    Config config_;
};

#endif
