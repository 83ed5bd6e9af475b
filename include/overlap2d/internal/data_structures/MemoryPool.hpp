#pragma once

#include <overlap2d/CollisionPair.hpp>
#include <overlap2d/internal/data_structures/SpatialHashGrid.hpp>
#include <overlap2d/internal/data_structures/UnionFind.hpp>
#include <overlap2d/internal/data_structures/VisitedSet.hpp>
#include <overlap2d/internal/utils/Methods.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <utility>
#include <vector>

namespace o2d
{

constexpr uint8_t resourceKindCount = 4;
enum class ResourceKind : uint8_t
{
    SpatialHash = 0,
    UnionFind,
    PairList,
    VisitedSet,
};

inline const char* toString(ResourceKind kind)
{
    switch (kind)
    {
    case ResourceKind::SpatialHash:
        return "SpatialHash";
    case ResourceKind::UnionFind:
        return "UnionFind";
    case ResourceKind::PairList:
        return "PairList";
    case ResourceKind::VisitedSet:
        return "VisitedSet";
    default:
        return "Unknown";
    }
}

// Describes how a pooled type is created, sized and wiped before reuse
template <typename T>
struct PoolTraits;

template <>
struct PoolTraits<SpatialHashGrid>
{
    static constexpr ResourceKind kind = ResourceKind::SpatialHash;

    static std::size_t sizeClass(std::size_t)
    {
        return 0;
    }

    static std::unique_ptr<SpatialHashGrid> create(std::size_t)
    {
        return std::make_unique<SpatialHashGrid>();
    }

    static void prepare(SpatialHashGrid& grid, std::size_t)
    {
        grid.clear();
    }
};

template <>
struct PoolTraits<UnionFind>
{
    static constexpr ResourceKind kind = ResourceKind::UnionFind;

    static std::size_t sizeClass(std::size_t count)
    {
        return nextPowerOfTwo(count);
    }

    static std::unique_ptr<UnionFind> create(std::size_t sizeClass)
    {
        return std::make_unique<UnionFind>(sizeClass);
    }

    static void prepare(UnionFind& unionFind, std::size_t count)
    {
        unionFind.reset(count);
    }
};

template <>
struct PoolTraits<PairList>
{
    static constexpr ResourceKind kind = ResourceKind::PairList;

    static std::size_t sizeClass(std::size_t)
    {
        return 0;
    }

    static std::unique_ptr<PairList> create(std::size_t)
    {
        return std::make_unique<PairList>();
    }

    static void prepare(PairList& pairs, std::size_t)
    {
        pairs.clear();
    }
};

template <>
struct PoolTraits<VisitedSet>
{
    static constexpr ResourceKind kind = ResourceKind::VisitedSet;

    static std::size_t sizeClass(std::size_t count)
    {
        return nextPowerOfTwo(count);
    }

    static std::unique_ptr<VisitedSet> create(std::size_t sizeClass)
    {
        return std::make_unique<VisitedSet>(sizeClass);
    }

    static void prepare(VisitedSet& visited, std::size_t count)
    {
        visited.reset(count);
    }
};

template <typename T>
concept Poolable = requires(T& value, std::size_t size) {
    { PoolTraits<T>::kind } -> std::convertible_to<ResourceKind>;
    { PoolTraits<T>::sizeClass(size) } -> std::convertible_to<std::size_t>;
    { PoolTraits<T>::create(size) } -> std::same_as<std::unique_ptr<T>>;
    PoolTraits<T>::prepare(value, size);
};

struct PoolCounters
{
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t drops = 0;
    std::size_t size = 0;     // free instances held right now
    std::size_t peakSize = 0; // highest number of free instances ever held

    double hitRate() const
    {
        const auto requests = hits + misses;
        return requests == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(requests);
    }

    PoolCounters& operator+=(const PoolCounters& other)
    {
        hits += other.hits;
        misses += other.misses;
        drops += other.drops;
        size += other.size;
        peakSize += other.peakSize;
        return *this;
    }
};

template <Poolable T>
class ObjectPool;

// Borrowed pooled instance, handed back to its pool when the handle dies
template <Poolable T>
class PoolHandle
{
  public:
    PoolHandle() = default;

    PoolHandle(std::unique_ptr<T> instance, ObjectPool<T>* pool, std::size_t sizeClass)
        : mInstance(std::move(instance)),
          mPool(pool),
          mSizeClass(sizeClass)
    {
    }

    PoolHandle(const PoolHandle&) = delete;
    PoolHandle& operator=(const PoolHandle&) = delete;

    PoolHandle(PoolHandle&& other) noexcept
        : mInstance(std::move(other.mInstance)),
          mPool(std::exchange(other.mPool, nullptr)),
          mSizeClass(other.mSizeClass)
    {
    }

    PoolHandle& operator=(PoolHandle&& other) noexcept
    {
        if (this != &other)
        {
            release();
            mInstance = std::move(other.mInstance);
            mPool = std::exchange(other.mPool, nullptr);
            mSizeClass = other.mSizeClass;
        }
        return *this;
    }

    ~PoolHandle()
    {
        release();
    }

    // Returns the instance to the pool before the handle goes out of scope
    void release() noexcept
    {
        if (mInstance && mPool)
            mPool->release(std::move(mInstance), mSizeClass);
        mInstance.reset();
        mPool = nullptr;
    }

    T* get() const
    {
        return mInstance.get();
    }

    T& operator*() const
    {
        return *mInstance;
    }

    T* operator->() const
    {
        return mInstance.get();
    }

    explicit operator bool() const
    {
        return mInstance != nullptr;
    }

  private:
    std::unique_ptr<T> mInstance;
    ObjectPool<T>* mPool = nullptr;
    std::size_t mSizeClass = 0;
};

// Mutex protected free list of T instances keyed by size class.
// A request is served by the smallest free instance whose class fits; an empty
// pool falls back to constructing a new instance. Releasing into a full pool
// destroys the instance.
template <Poolable T>
class ObjectPool
{
  public:
    static constexpr std::size_t defaultCapacity = 8;

    explicit ObjectPool(std::size_t capacity = defaultCapacity, bool enabled = true)
        : mCapacity(capacity),
          mEnabled(enabled)
    {
    }

    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;

    PoolHandle<T> acquire(std::size_t sizeHint = 0)
    {
        const std::size_t sizeClass = PoolTraits<T>::sizeClass(sizeHint);
        std::unique_ptr<T> instance;
        std::size_t instanceClass = sizeClass;

        if (mEnabled)
        {
            std::lock_guard lock(mMutex);
            for (auto it = mFree.lower_bound(sizeClass); it != mFree.end(); ++it)
            {
                if (it->second.empty())
                    continue;

                instance = std::move(it->second.back());
                it->second.pop_back();
                instanceClass = it->first;
                --mCounters.size;
                ++mCounters.hits;
                break;
            }

            if (!instance)
                ++mCounters.misses;
        }

        if (!instance)
            instance = PoolTraits<T>::create(sizeClass);

        PoolTraits<T>::prepare(*instance, sizeHint);
        return PoolHandle<T>(std::move(instance), this, instanceClass);
    }

    // The instance is not checked for having come from this pool
    void release(std::unique_ptr<T> instance, std::size_t sizeClass) noexcept
    {
        if (!instance || !mEnabled)
            return;

        std::lock_guard lock(mMutex);
        if (mCounters.size >= mCapacity)
        {
            ++mCounters.drops;
            spdlog::debug("{} pool at capacity ({}), dropping released instance",
                          toString(PoolTraits<T>::kind),
                          mCapacity);
            return;
        }

        try
        {
            mFree[sizeClass].push_back(std::move(instance));
        }
        catch (const std::bad_alloc&)
        {
            ++mCounters.drops;
            return;
        }

        ++mCounters.size;
        mCounters.peakSize = std::max(mCounters.peakSize, mCounters.size);
    }

    // Destroys every free instance
    void shrink()
    {
        std::lock_guard lock(mMutex);
        mFree.clear();
        mCounters.size = 0;
    }

    PoolCounters counters() const
    {
        std::lock_guard lock(mMutex);
        return mCounters;
    }

    std::size_t freeCount() const
    {
        std::lock_guard lock(mMutex);
        return mCounters.size;
    }

    std::size_t capacity() const
    {
        return mCapacity;
    }

    bool isEnabled() const
    {
        return mEnabled;
    }

  private:
    mutable std::mutex mMutex;
    std::map<std::size_t, std::vector<std::unique_ptr<T>>> mFree;
    PoolCounters mCounters;
    std::size_t mCapacity;
    bool mEnabled;
};

struct PoolStatistics
{
    PoolCounters total;
    std::array<PoolCounters, resourceKindCount> perKind;

    const PoolCounters& operator[](ResourceKind kind) const
    {
        return perKind[static_cast<std::size_t>(kind)];
    }
};

// One pool per kind of working structure the collision algorithms borrow
class MemoryPool
{
  public:
    explicit MemoryPool(std::size_t capacityPerKind = ObjectPool<PairList>::defaultCapacity, bool enabled = true);

    MemoryPool(const MemoryPool&) = delete;
    MemoryPool& operator=(const MemoryPool&) = delete;

    template <Poolable T>
    PoolHandle<T> acquire(std::size_t sizeHint = 0)
    {
        return poolFor<T>().acquire(sizeHint);
    }

    PoolStatistics statistics() const;
    void shrink();

    bool isEnabled() const
    {
        return mEnabled;
    }

  private:
    bool mEnabled;
    ObjectPool<SpatialHashGrid> mSpatialHashes;
    ObjectPool<UnionFind> mUnionFinds;
    ObjectPool<PairList> mPairLists;
    ObjectPool<VisitedSet> mVisitedSets;

    template <Poolable T>
    ObjectPool<T>& poolFor()
    {
        if constexpr (PoolTraits<T>::kind == ResourceKind::SpatialHash)
            return mSpatialHashes;
        else if constexpr (PoolTraits<T>::kind == ResourceKind::UnionFind)
            return mUnionFinds;
        else if constexpr (PoolTraits<T>::kind == ResourceKind::PairList)
            return mPairLists;
        else
            return mVisitedSets;
    }
};

} // namespace o2d
