#pragma once

#include <overlap2d/CollisionPair.hpp>
#include <overlap2d/CollisionResult.hpp>
#include <overlap2d/Config.hpp>
#include <overlap2d/Errors.hpp>
#include <overlap2d/Statistics.hpp>
#include <overlap2d/Strategy.hpp>
#include <overlap2d/internal/collision/AlgorithmSelector.hpp>
#include <overlap2d/internal/data_structures/MemoryPool.hpp>
#include <overlap2d/internal/data_structures/ResultCache.hpp>
#include <overlap2d/internal/geometry/AABB.hpp>
#include <overlap2d/internal/monitoring/PerformanceMonitor.hpp>

#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace o2d
{

// Finds every overlapping pair in a sequence of boxes, choosing the algorithm per call.
// The engine owns its pool, cache, selector and monitor; all of them are safe to share
// between threads calling detect concurrently.
class CollisionEngine
{
  public:
    // Throws ConfigurationError if the configuration is inconsistent
    explicit CollisionEngine(EngineConfig config = {});

    CollisionEngine(const CollisionEngine&) = delete;
    CollisionEngine& operator=(const CollisionEngine&) = delete;

    // Pairs ascending by a, then b. Throws InvalidInputError for negative or non finite boxes.
    PairList detectCollisions(std::span<const AABB> boxes);
    PairList detectCollisions(std::span<const AABB> boxes, Strategy strategy);

    // Full result: pairs, components when the union-find strategy ran, strategy used, cache origin
    CollisionResult detect(std::span<const AABB> boxes, std::optional<Strategy> strategy = std::nullopt);

    // Runs the union-find strategy and returns the partition of the input indices
    std::vector<Component> connectedComponents(std::span<const AABB> boxes);

    StatisticsSnapshot statistics() const;
    bool isPerformanceDegraded() const;
    void clearCache();

    const EngineConfig& config() const
    {
        return mConfig;
    }

    MemoryPool& memoryPool()
    {
        return mPool;
    }

    const MemoryPool& memoryPool() const
    {
        return mPool;
    }

    // nullptr when caching is disabled
    const ResultCache* cache() const
    {
        return mCache.get();
    }

    AlgorithmSelector& selector()
    {
        return mSelector;
    }

    const PerformanceMonitor& monitor() const
    {
        return mMonitor;
    }

  private:
    EngineConfig mConfig;
    MemoryPool mPool;
    std::unique_ptr<ResultCache> mCache;
    AlgorithmSelector mSelector;
    PerformanceMonitor mMonitor;

    static void validateInput(std::span<const AABB> boxes);

    CollisionResult run(std::span<const AABB> boxes,
                        Strategy strategy,
                        const WorkloadCharacteristics& characteristics);
    PoolHandle<SpatialHashGrid> acquireGrid(const WorkloadCharacteristics& characteristics);
};

} // namespace o2d
