#include <overlap2d/CollisionEngine.hpp>
#include <overlap2d/internal/collision/BroadPhase.hpp>
#include <overlap2d/internal/utils/Debug.hpp>
#include <overlap2d/internal/utils/Fingerprint.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <string>
#include <utility>

namespace o2d
{

namespace
{

using Clock = std::chrono::steady_clock;

const EngineConfig& validated(const EngineConfig& config)
{
    config.validate();
    return config;
}

} // namespace

CollisionEngine::CollisionEngine(EngineConfig config)
    : mConfig(validated(config)),
      mPool(mConfig.poolCapacity, mConfig.enableMemoryPooling),
      mCache(mConfig.enableCaching ? std::make_unique<ResultCache>(mConfig.cacheConfig()) : nullptr),
      mSelector(mConfig.thresholds, mConfig.selectorHistorySize),
      mMonitor(mConfig.monitor)
{
    spdlog::debug("CollisionEngine created (cellSize={}, caching={}, pooling={}, thresholds={}/{}/{})",
                  mConfig.cellSize,
                  mConfig.enableCaching,
                  mConfig.enableMemoryPooling,
                  mConfig.thresholds.naive,
                  mConfig.thresholds.spatial,
                  mConfig.thresholds.overlapRatio);
}

void CollisionEngine::validateInput(std::span<const AABB> boxes)
{
    for (std::size_t i = 0; i < boxes.size(); ++i)
    {
        const auto& box = boxes[i];
        if (box.isValid())
            continue;

        if (!std::isfinite(box.x) || !std::isfinite(box.y))
            throw InvalidInputError(i, "position is not finite");
        if (!std::isfinite(box.width) || !std::isfinite(box.height))
            throw InvalidInputError(i, "size is not finite");
        if (box.width < 0.0f || box.height < 0.0f)
            throw InvalidInputError(i, std::format("negative size ({} x {})", box.width, box.height));
    }
}

PairList CollisionEngine::detectCollisions(std::span<const AABB> boxes)
{
    return detect(boxes).pairs;
}

PairList CollisionEngine::detectCollisions(std::span<const AABB> boxes, Strategy strategy)
{
    return detect(boxes, strategy).pairs;
}

std::vector<Component> CollisionEngine::connectedComponents(std::span<const AABB> boxes)
{
    auto result = detect(boxes, Strategy::SpatialHashUnionFind);
    O2D_DEBUG_ASSERT(result.components.has_value(), "Union-find strategy must produce components");
    return std::move(*result.components);
}

CollisionResult CollisionEngine::detect(std::span<const AABB> boxes, std::optional<Strategy> strategy)
{
    validateInput(boxes);

    if (!strategy)
        strategy = mConfig.forcedStrategy;
    const bool forced = strategy.has_value();
    const bool wantsComponents = strategy == Strategy::SpatialHashUnionFind;

    if (boxes.size() < 2)
    {
        CollisionResult result;
        result.strategy = strategy.value_or(Strategy::Naive);
        if (wantsComponents)
            result.components = boxes.empty() ? std::vector<Component>{} : std::vector<Component>{Component{0}};
        return result;
    }

    const auto start = Clock::now();

    std::string key;
    if (mCache)
    {
        key = fingerprint(boxes);
        auto cached = mCache->get(key, boxes);

        // A forced strategy only accepts an entry that strategy produced, and an entry
        // stored without components cannot answer a request that needs them
        const bool usable = cached && (!forced || cached->strategy == *strategy) &&
                            (!wantsComponents || cached->components);
        if (usable)
        {
            mMonitor.record(CallRecord{
                .elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start),
                .strategy = cached->strategy,
                .objectCount = boxes.size(),
                .cacheHit = true,
            });
            return std::move(*cached);
        }
    }

    const auto characteristics = WorkloadCharacteristics::compute(boxes, mConfig.overlapSampleCount);
    const Strategy chosen = forced ? *strategy : mSelector.select(characteristics);

    const auto poolBefore = mPool.statistics().total;
    CollisionResult result = run(boxes, chosen, characteristics);
    const auto poolAfter = mPool.statistics().total;
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start);

    if (mCache)
        mCache->put(key, boxes, result);

    mMonitor.record(CallRecord{
        .elapsed = elapsed,
        .strategy = chosen,
        .objectCount = boxes.size(),
        .poolHits = poolAfter.hits - poolBefore.hits,
        .poolMisses = poolAfter.misses - poolBefore.misses,
        .cacheHit = false,
    });
    mSelector.record(SelectionRecord{
        .characteristics = characteristics,
        .strategy = chosen,
        .forced = forced,
        .elapsed = elapsed,
    });

    spdlog::trace("detect: {} boxes, {} pairs, strategy {}{}, {}ns",
                  boxes.size(),
                  result.pairs.size(),
                  toString(chosen),
                  forced ? " (forced)" : "",
                  elapsed.count());

    return result;
}

PoolHandle<SpatialHashGrid> CollisionEngine::acquireGrid(const WorkloadCharacteristics& characteristics)
{
    auto grid = mPool.acquire<SpatialHashGrid>();
    grid->setCellSize(mConfig.cellSize > 0.0f
                          ? mConfig.cellSize
                          : SpatialHashGrid::cellSizeFor(characteristics.medianDimension, characteristics.bounds));
    grid->setMaxCellsPerObject(mConfig.maxCellsPerObject);
    return grid;
}

CollisionResult CollisionEngine::run(std::span<const AABB> boxes,
                                     Strategy strategy,
                                     const WorkloadCharacteristics& characteristics)
{
    CollisionResult result;
    result.strategy = strategy;

    // Handles give everything back to the pool on every exit path
    auto pairs = mPool.acquire<PairList>();

    switch (strategy)
    {
    case Strategy::Naive:
        naiveCollisions(boxes, *pairs);
        break;
    case Strategy::SpatialHash:
    case Strategy::SpatialHashUnionFind:
    {
        auto grid = acquireGrid(characteristics);
        auto visited = mPool.acquire<VisitedSet>(boxes.size());

        if (strategy == Strategy::SpatialHash)
        {
            spatialHashCollisions(boxes, *grid, *visited, *pairs);
        }
        else
        {
            auto unionFind = mPool.acquire<UnionFind>(boxes.size());
            unionFind->setBatchSize(mConfig.unionFindBatchSize);
            spatialHashUnionFindCollisions(boxes, *grid, *visited, *unionFind, *pairs);
            result.components = unionFind->allComponents();
        }

        if (grid->maxBucketSize() > mConfig.maxObjectsPerCell)
            spdlog::debug("Grid cell holds {} objects (advisory limit {}), cell size {}",
                          grid->maxBucketSize(),
                          mConfig.maxObjectsPerCell,
                          grid->getCellSize());
        break;
    }
    }

    O2D_DEBUG_ASSERT(std::is_sorted(pairs->begin(), pairs->end()), "Pairs must be sorted");

    // Copy out: the pooled list is wiped when it is lent out again
    result.pairs.assign(pairs->begin(), pairs->end());
    return result;
}

StatisticsSnapshot CollisionEngine::statistics() const
{
    return mMonitor.snapshot();
}

bool CollisionEngine::isPerformanceDegraded() const
{
    return mMonitor.isDegraded();
}

void CollisionEngine::clearCache()
{
    if (mCache)
        mCache->clear();
}

} // namespace o2d
