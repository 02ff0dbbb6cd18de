#ifndef TRANSCRIPTION_CACHE_HPP
#define TRANSCRIPTION_CACHE_HPP

#include "stt/segment.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <tuple>

// Literal (input path, model id) pair; no path normalization
struct CacheKey {
    std::string inputPath;
    std::string modelId;
};

inline bool operator<(const CacheKey& a, const CacheKey& b) {
    return std::tie(a.inputPath, a.modelId) < std::tie(b.inputPath, b.modelId);
}

inline bool operator==(const CacheKey& a, const CacheKey& b) {
    return a.inputPath == b.inputPath && a.modelId == b.modelId;
}

// Finished, untranslated transcriptions. Entries are never evicted or
// expired, so the cache grows with every distinct key for the life of the
// process.
class TranscriptionCache {
public:
    TranscriptionCache() = default;

    TranscriptionCache(const TranscriptionCache&) = delete;
    TranscriptionCache& operator=(const TranscriptionCache&) = delete;

    std::optional<SegmentList> get(const CacheKey& key) const;

    // Overwrites any previous entry
    void put(const CacheKey& key, SegmentList segments);

    bool contains(const CacheKey& key) const;
    std::size_t size() const;
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::map<CacheKey, SegmentList> entries_;
};

#endif
