#include <overlap2d/internal/data_structures/MemoryPool.hpp>

namespace o2d
{

MemoryPool::MemoryPool(std::size_t capacityPerKind, bool enabled)
    : mEnabled(enabled),
      mSpatialHashes(capacityPerKind, enabled),
      mUnionFinds(capacityPerKind, enabled),
      mPairLists(capacityPerKind, enabled),
      mVisitedSets(capacityPerKind, enabled)
{
}

PoolStatistics MemoryPool::statistics() const
{
    PoolStatistics statistics;
    statistics.perKind[static_cast<std::size_t>(ResourceKind::SpatialHash)] = mSpatialHashes.counters();
    statistics.perKind[static_cast<std::size_t>(ResourceKind::UnionFind)] = mUnionFinds.counters();
    statistics.perKind[static_cast<std::size_t>(ResourceKind::PairList)] = mPairLists.counters();
    statistics.perKind[static_cast<std::size_t>(ResourceKind::VisitedSet)] = mVisitedSets.counters();

    for (const auto& counters : statistics.perKind)
        statistics.total += counters;

    return statistics;
}

void MemoryPool::shrink()
{
    mSpatialHashes.shrink();
    mUnionFinds.shrink();
    mPairLists.shrink();
    mVisitedSets.shrink();
}

} // namespace o2d
