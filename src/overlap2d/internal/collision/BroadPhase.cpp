#include <overlap2d/internal/collision/BroadPhase.hpp>
#include <overlap2d/internal/utils/Debug.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <memory_resource>
#include <vector>

namespace o2d
{

namespace
{

constexpr std::size_t candidateBufferBytes = 4096;

template <typename OnPair>
void scanGrid(std::span<const AABB> boxes, SpatialHashGrid& grid, VisitedSet& visited, PairList& pairs, OnPair&& onPair)
{
    O2D_DEBUG_ASSERT(grid.empty(), "Grid must be empty before the scan");

    const auto count = static_cast<ObjectIndex>(boxes.size());
    for (ObjectIndex i = 0; i < count; ++i)
        grid.insert(i, boxes[i]);

    std::array<std::byte, candidateBufferBytes> buffer;
    std::pmr::monotonic_buffer_resource resource(buffer.data(), buffer.size());
    std::pmr::vector<ObjectIndex> candidates{&resource};

    for (ObjectIndex i = 0; i < count; ++i)
    {
        candidates.clear();
        grid.query(boxes[i], candidates, visited);

        const auto firstPair = pairs.size();
        for (const auto j : candidates)
        {
            // Pairs with j < i were emitted while scanning j
            if (j <= i || !boxes[i].overlaps(boxes[j]))
                continue;

            pairs.push_back(CollisionPair{i, j});
            onPair(i, j);
        }

        std::sort(pairs.begin() + static_cast<std::ptrdiff_t>(firstPair), pairs.end());
    }
}

} // namespace

void naiveCollisions(std::span<const AABB> boxes, PairList& pairs)
{
    const auto count = static_cast<ObjectIndex>(boxes.size());
    for (ObjectIndex i = 0; i < count; ++i)
        for (ObjectIndex j = i + 1; j < count; ++j)
            if (boxes[i].overlaps(boxes[j]))
                pairs.push_back(CollisionPair{i, j});
}

void spatialHashCollisions(std::span<const AABB> boxes, SpatialHashGrid& grid, VisitedSet& visited, PairList& pairs)
{
    scanGrid(boxes, grid, visited, pairs, [](ObjectIndex, ObjectIndex) {});
}

void spatialHashUnionFindCollisions(std::span<const AABB> boxes,
                                    SpatialHashGrid& grid,
                                    VisitedSet& visited,
                                    UnionFind& unionFind,
                                    PairList& pairs)
{
    O2D_DEBUG_ASSERT(unionFind.size() == boxes.size(), "Union-find must be sized to the input");

    scanGrid(boxes, grid, visited, pairs, [&unionFind](ObjectIndex a, ObjectIndex b) { unionFind.queueUnion(a, b); });
    unionFind.flush();
}

} // namespace o2d
