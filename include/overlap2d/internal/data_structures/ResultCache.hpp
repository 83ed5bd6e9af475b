#pragma once

#include <overlap2d/CollisionResult.hpp>
#include <overlap2d/Config.hpp>
#include <overlap2d/internal/geometry/AABB.hpp>

#include <tsl/robin_map.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace o2d
{

struct CacheCounters
{
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;

    double hitRate() const
    {
        const auto lookups = hits + misses;
        return lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
    }
};

// Fingerprint keyed store of collision results with LRU eviction and optional expiry.
// Entries keep a copy of their input boxes, so a fingerprint collision reads as a miss.
class ResultCache
{
  public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit ResultCache(CacheConfig config = {}, TimeSource now = &Clock::now);

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    // Returns a copy of the stored result and marks the entry as most recently used
    std::optional<CollisionResult> get(const std::string& fingerprint, std::span<const AABB> inputs);
    void put(const std::string& fingerprint, std::span<const AABB> inputs, const CollisionResult& result);

    // Removes every expired entry, returns how many were removed
    std::size_t purgeExpired();
    void clear();

    std::size_t size() const;
    CacheCounters counters() const;

    const CacheConfig& config() const
    {
        return mConfig;
    }

  private:
    struct CacheEntry
    {
        std::string fingerprint;
        std::vector<AABB> inputs;
        CollisionResult result;
        Clock::time_point timestamp;
    };
    using EntryList = std::list<CacheEntry>; // front is the most recently used

    mutable std::mutex mMutex;
    CacheConfig mConfig;
    TimeSource mNow;
    EntryList mEntries;
    tsl::robin_map<std::string, EntryList::iterator> mIndex;
    CacheCounters mCounters;

    bool isExpired(const CacheEntry& entry, Clock::time_point now) const;
    void erase(EntryList::iterator entry);
    std::size_t purgeExpiredLocked(Clock::time_point now);
};

} // namespace o2d
