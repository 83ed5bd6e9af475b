#include <overlap2d/internal/data_structures/ResultCache.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace o2d
{

ResultCache::ResultCache(CacheConfig config, TimeSource now) : mConfig(config), mNow(std::move(now))
{
    mConfig.validate();
}

bool ResultCache::isExpired(const CacheEntry& entry, Clock::time_point now) const
{
    return mConfig.ttl.count() > 0 && now - entry.timestamp >= mConfig.ttl;
}

void ResultCache::erase(EntryList::iterator entry)
{
    mIndex.erase(entry->fingerprint);
    mEntries.erase(entry);
}

std::optional<CollisionResult> ResultCache::get(const std::string& fingerprint, std::span<const AABB> inputs)
{
    const auto now = mNow();
    std::lock_guard lock(mMutex);

    const auto found = mIndex.find(fingerprint);
    if (found == mIndex.end())
    {
        ++mCounters.misses;
        return std::nullopt;
    }

    const auto entry = found->second;
    if (isExpired(*entry, now))
    {
        erase(entry);
        ++mCounters.expirations;
        ++mCounters.misses;
        return std::nullopt;
    }

    if (!std::ranges::equal(entry->inputs, inputs))
    {
        ++mCounters.misses;
        return std::nullopt;
    }

    mEntries.splice(mEntries.begin(), mEntries, entry);
    ++mCounters.hits;

    CollisionResult copy = entry->result;
    copy.fromCache = true;
    return copy;
}

void ResultCache::put(const std::string& fingerprint, std::span<const AABB> inputs, const CollisionResult& result)
{
    const auto now = mNow();
    std::lock_guard lock(mMutex);

    purgeExpiredLocked(now);

    const auto found = mIndex.find(fingerprint);
    if (found != mIndex.end())
        erase(found->second);

    CollisionResult stored = result;
    stored.fromCache = false;
    mEntries.push_front(CacheEntry{
        .fingerprint = fingerprint,
        .inputs = std::vector<AABB>(inputs.begin(), inputs.end()),
        .result = std::move(stored),
        .timestamp = now,
    });
    mIndex.emplace(fingerprint, mEntries.begin());

    if (mConfig.capacity == 0)
        return;

    while (mEntries.size() > mConfig.capacity)
    {
        spdlog::debug("Result cache evicting {} ({} entries, capacity {})",
                      mEntries.back().fingerprint,
                      mEntries.size(),
                      mConfig.capacity);
        erase(std::prev(mEntries.end()));
        ++mCounters.evictions;
    }
}

std::size_t ResultCache::purgeExpiredLocked(Clock::time_point now)
{
    if (mConfig.ttl.count() <= 0)
        return 0;

    std::size_t removed = 0;
    for (auto it = mEntries.begin(); it != mEntries.end();)
    {
        const auto current = it++;
        if (isExpired(*current, now))
        {
            erase(current);
            ++removed;
        }
    }

    mCounters.expirations += removed;
    return removed;
}

std::size_t ResultCache::purgeExpired()
{
    const auto now = mNow();
    std::lock_guard lock(mMutex);
    return purgeExpiredLocked(now);
}

void ResultCache::clear()
{
    std::lock_guard lock(mMutex);
    mIndex.clear();
    mEntries.clear();
}

std::size_t ResultCache::size() const
{
    std::lock_guard lock(mMutex);
    return mEntries.size();
}

CacheCounters ResultCache::counters() const
{
    std::lock_guard lock(mMutex);
    return mCounters;
}

} // namespace o2d
