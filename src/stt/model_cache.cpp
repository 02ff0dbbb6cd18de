#include "stt/model_cache.hpp"
#include "stt/stt_error.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

// Constructor
ModelHandle::ModelHandle(std::string path, NativeContext* ctx)
    : path_(std::move(path)), ctx_(ctx) {}

// Constructor
ModelCache::ModelCache(SpeechEngine& engine) : engine_(engine) {}

// Destructor
ModelCache::~ModelCache() { teardown(); }

std::shared_ptr<ModelHandle> ModelCache::acquire(const std::string& modelPath) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = models_.find(modelPath);
        if (it != models_.end()) return it->second;
    }

    std::error_code ec;
    if (modelPath.empty() || !std::filesystem::exists(modelPath, ec)) {
        throw SttError(SttErrorKind::NotFound, "model file not found: " + modelPath);
    }

    // No lock held while the engine reads the file
    NativeContext* ctx = engine_.load(modelPath);
    if (!ctx) {
        throw SttError(SttErrorKind::LoadFailure, "failed to load model from " + modelPath);
    }

    std::shared_ptr<ModelHandle> existing;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = models_.find(modelPath);
        if (it == models_.end()) {
            auto handle = std::make_shared<ModelHandle>(modelPath, ctx);
            models_.emplace(modelPath, handle);
            std::cout << "[Model Cache] Loaded model: " << modelPath << std::endl;
            return handle;
        }
        existing = it->second;
    }

    // Lost the race against a concurrent load of the same path
    std::cerr << "[Model Cache] [WARN] Duplicate load of " << modelPath << " discarded" << std::endl;
    engine_.release(ctx);
    return existing;
}

void ModelCache::teardown() {
    std::map<std::string, std::shared_ptr<ModelHandle>> models;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        models.swap(models_);
    }

    // Map lock released first so the two locks are never held together
    for (auto& entry : models) {
        ModelHandle& handle = *entry.second;
        auto inference = handle.lock();
        if (handle.ctx_) {
            engine_.release(handle.ctx_);
            handle.ctx_ = nullptr;
        }
    }
}

std::size_t ModelCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return models_.size();
}
