#ifndef MODEL_CACHE_HPP
#define MODEL_CACHE_HPP

#include "stt/speech_engine.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

// A loaded native context plus the lock that serializes inference on it.
// The lock is independent of the cache map's lock, so a running model never
// blocks lookups of other models.
class ModelHandle {
public:
    ModelHandle(std::string path, NativeContext* ctx);

    ModelHandle(const ModelHandle&) = delete;
    ModelHandle& operator=(const ModelHandle&) = delete;

    const std::string& path() const { return path_; }

    // Hold the returned lock for the whole native call
    std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(mutex_); }

    // Only meaningful while lock() is held. Null once the cache is torn down.
    NativeContext* context() const { return ctx_; }

private:
    friend class ModelCache;

    std::string path_;
    NativeContext* ctx_;
    std::mutex mutex_;
};

// Model path -> shared handle. Loads lazily and never evicts.
//
// Two callers missing on the same path at once will both load it; the
// second insert finds the first handle and frees its own context. Loads are
// not serialized and run without the map lock.
class ModelCache {
public:
    explicit ModelCache(SpeechEngine& engine);
    ~ModelCache();

    ModelCache(const ModelCache&) = delete;
    ModelCache& operator=(const ModelCache&) = delete;

    // Throws SttError NotFound (no such file) or LoadFailure (engine rejected it)
    std::shared_ptr<ModelHandle> acquire(const std::string& modelPath);

    // Frees every context, waiting out any call in flight, then empties the map.
    // Called once at shutdown; safe to call again.
    void teardown();

    std::size_t size() const;

private:
    SpeechEngine& engine_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<ModelHandle>> models_;
};

#endif
