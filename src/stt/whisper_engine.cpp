#include "stt/whisper_engine.hpp"

#include <whisper.h>

static whisper_context* native(NativeContext* ctx) {
    return reinterpret_cast<whisper_context*>(ctx);
}

// Runs on whisper's stack inside whisper_full. One atomic store, nothing else.
static void progress_trampoline(whisper_context*, whisper_state*, int progress, void* user_data) {
    const auto* hooks = static_cast<const CallbackHooks*>(user_data);
    hooks->registry->onProgress(hooks->token, progress);
}

// Copies the new segments out of the context before the registry is touched
static void new_segment_trampoline(whisper_context* ctx, whisper_state*, int n_new, void* user_data) {
    const auto* hooks = static_cast<const CallbackHooks*>(user_data);

    const int n_segments = whisper_full_n_segments(ctx);
    if (n_segments == 0) return;

    int first = n_segments - n_new;
    if (first < 0) first = 0;

    for (int i = first; i < n_segments; ++i) {
        SegmentEvent event;
        event.speakerTurn = i > 0 && whisper_full_get_segment_speaker_turn_next(ctx, i - 1);
        event.t0Centis = whisper_full_get_segment_t0(ctx, i);
        event.t1Centis = whisper_full_get_segment_t1(ctx, i);
        const char* text = whisper_full_get_segment_text(ctx, i);
        if (text) event.text = text;

        hooks->registry->onSegment(hooks->token, event);
    }
}

// Constructors
WhisperEngine::WhisperEngine() : WhisperEngine(Config{}) {}

WhisperEngine::WhisperEngine(Config config) : config_(config) {}

NativeContext* WhisperEngine::load(const std::string& modelPath) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.useGpu;
    cparams.flash_attn = config_.flashAttn;

    whisper_context* ctx = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    return reinterpret_cast<NativeContext*>(ctx);
}

void WhisperEngine::release(NativeContext* ctx) {
    if (ctx) whisper_free(native(ctx));
}

int WhisperEngine::run(NativeContext* ctx, const InferenceParams& params,
                       const std::vector<float>& samples, const CallbackHooks* hooks) {
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    wparams.n_threads = params.threads;
    wparams.language = params.language.c_str();
    wparams.translate = params.translate;
    wparams.tdrz_enable = params.speakerTurns;

    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;

    if (hooks && hooks->registry) {
        void* user_data = const_cast<CallbackHooks*>(hooks);
        wparams.progress_callback = progress_trampoline;
        wparams.progress_callback_user_data = user_data;
        wparams.new_segment_callback = new_segment_trampoline;
        wparams.new_segment_callback_user_data = user_data;
    }

    return whisper_full(native(ctx), wparams, samples.data(), (int)samples.size());
}

int WhisperEngine::segmentCount(NativeContext* ctx) {
    return whisper_full_n_segments(native(ctx));
}

RawSegment WhisperEngine::segment(NativeContext* ctx, int index) {
    whisper_context* wctx = native(ctx);

    RawSegment out;
    out.t0Centis = whisper_full_get_segment_t0(wctx, index);
    out.t1Centis = whisper_full_get_segment_t1(wctx, index);
    const char* text = whisper_full_get_segment_text(wctx, index);
    if (text) out.text = text;
    out.speakerTurnNext = whisper_full_get_segment_speaker_turn_next(wctx, index);
    return out;
}
