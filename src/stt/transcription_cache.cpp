#include "stt/transcription_cache.hpp"

#include <mutex>
#include <utility>

std::optional<SegmentList> TranscriptionCache::get(const CacheKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void TranscriptionCache::put(const CacheKey& key, SegmentList segments) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[key] = std::move(segments);
}

bool TranscriptionCache::contains(const CacheKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.count(key) != 0;
}

std::size_t TranscriptionCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

void TranscriptionCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}
