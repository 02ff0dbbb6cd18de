#ifndef CALLBACK_REGISTRY_HPP
#define CALLBACK_REGISTRY_HPP

#include "stt/segment.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>

// Fields of one freshly decoded segment, copied out of the native context
// before the registry is touched.
struct SegmentEvent {
    long long t0Centis = 0;
    long long t1Centis = 0;
    std::string text;
    bool speakerTurn = false;  // a speaker turn precedes this segment
};

// Side table between the native engine's callbacks and the application.
// The native call only ever sees an opaque token; the slot behind it lives
// here for exactly the duration of one inference call.
class CallbackRegistry {
public:
    using Token = std::uint64_t;

    CallbackRegistry() = default;

    CallbackRegistry(const CallbackRegistry&) = delete;
    CallbackRegistry& operator=(const CallbackRegistry&) = delete;

    // progressCell must outlive the registration. Either argument may be empty.
    Token registerSlot(std::atomic<int>* progressCell, SegmentSink sink);
    void unregisterSlot(Token token);

    // Called from inside the native call. Does a lookup and one atomic store,
    // nothing else: no allocation, no logging, no indirect calls.
    void onProgress(Token token, int progress);

    // Called from inside the native call once the event fields are copied out.
    // The sink runs after the registry lock is released.
    void onSegment(Token token, const SegmentEvent& event);

    std::size_t size() const;
    bool contains(Token token) const;

private:
    struct Slot {
        std::atomic<int>* progress = nullptr;
        SegmentSink sink;
        int speaker = 0;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<Token, Slot> slots_;
    Token nextToken_ = 1;
};

// Holds a slot for the lifetime of one inference call and removes it on
// every exit path.
class CallbackRegistration {
public:
    CallbackRegistration(CallbackRegistry& registry, std::atomic<int>* progressCell, SegmentSink sink);
    ~CallbackRegistration();

    CallbackRegistration(const CallbackRegistration&) = delete;
    CallbackRegistration& operator=(const CallbackRegistration&) = delete;

    CallbackRegistry::Token token() const { return token_; }

private:
    CallbackRegistry& registry_;
    CallbackRegistry::Token token_;
};

#endif
