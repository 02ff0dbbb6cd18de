#include "stt/callback_registry.hpp"
#include "util/utf8.hpp"

#include <mutex>
#include <utility>

CallbackRegistry::Token CallbackRegistry::registerSlot(std::atomic<int>* progressCell, SegmentSink sink) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const Token token = nextToken_++;
    Slot& slot = slots_[token];
    slot.progress = progressCell;
    slot.sink = std::move(sink);
    return token;
}

void CallbackRegistry::unregisterSlot(Token token) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    slots_.erase(token);
}

void CallbackRegistry::onProgress(Token token, int progress) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = slots_.find(token);
    if (it != slots_.end() && it->second.progress) {
        it->second.progress->store(progress, std::memory_order_relaxed);
    }
}

void CallbackRegistry::onSegment(Token token, const SegmentEvent& event) {
    SegmentSink sink;
    int speaker = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = slots_.find(token);
        if (it == slots_.end() || !it->second.sink) return;

        if (event.speakerTurn) ++it->second.speaker;
        speaker = it->second.speaker;
        sink = it->second.sink;
    }

    Segment segment;
    segment.start = centisToSeconds(event.t0Centis);
    segment.end = centisToSeconds(event.t1Centis);
    segment.text = sanitizeUtf8(event.text);
    segment.speaker = speaker;
    sink(segment);
}

std::size_t CallbackRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return slots_.size();
}

bool CallbackRegistry::contains(Token token) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return slots_.count(token) != 0;
}

// Constructor
CallbackRegistration::CallbackRegistration(CallbackRegistry& registry, std::atomic<int>* progressCell, SegmentSink sink)
    : registry_(registry), token_(registry.registerSlot(progressCell, std::move(sink))) {}

// Destructor
CallbackRegistration::~CallbackRegistration() { registry_.unregisterSlot(token_); }
