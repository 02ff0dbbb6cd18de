#ifndef SPEECH_ENGINE_HPP
#define SPEECH_ENGINE_HPP

#include "stt/callback_registry.hpp"

#include <string>
#include <vector>

// Opaque handle to a loaded native inference context
struct NativeContext;

struct InferenceParams {
    int threads = 4;
    std::string language = "he";
    bool translate = false;
    bool speakerTurns = true;
};

// Routes native callback events to the registry slot of one call.
// Passed to the engine as callback user data; it lives in the caller's
// frame for the duration of run().
struct CallbackHooks {
    CallbackRegistry* registry = nullptr;
    CallbackRegistry::Token token = 0;
};

struct RawSegment {
    long long t0Centis = 0;
    long long t1Centis = 0;
    std::string text;
    bool speakerTurnNext = false;  // the following segment is a new speaker
};

// Blocking, non-reentrant speech inference engine.
// run() must never be called concurrently on the same context.
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;

    // Returns nullptr when the engine rejects the file
    virtual NativeContext* load(const std::string& modelPath) = 0;
    virtual void release(NativeContext* ctx) = 0;

    // Blocks for the full inference. Returns the native status, 0 on success.
    // hooks may be null, in which case no callbacks are installed.
    virtual int run(NativeContext* ctx, const InferenceParams& params,
                    const std::vector<float>& samples, const CallbackHooks* hooks) = 0;

    virtual int segmentCount(NativeContext* ctx) = 0;
    virtual RawSegment segment(NativeContext* ctx, int index) = 0;
};

#endif
