#include "stt/stt_runtime.hpp"

// Constructor
SttRuntime::SttRuntime(SpeechEngine& engine) : engine_(engine), models_(engine) {}

// Destructor
SttRuntime::~SttRuntime() { shutdown(); }

void SttRuntime::shutdown() {
    models_.teardown();
    transcriptions_.clear();
}
