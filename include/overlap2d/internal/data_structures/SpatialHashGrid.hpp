#pragma once

#include <overlap2d/CollisionPair.hpp>
#include <overlap2d/internal/data_structures/VisitedSet.hpp>
#include <overlap2d/internal/geometry/AABB.hpp>
#include <overlap2d/internal/utils/Debug.hpp>
#include <overlap2d/internal/utils/Methods.hpp>

#include <tsl/robin_map.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>

namespace o2d
{

struct GridCell
{
    int32_t x;
    int32_t y;

    bool operator==(GridCell other) const
    {
        return x == other.x && y == other.y;
    }

    bool operator!=(GridCell other) const
    {
        return !(*this == other);
    }
};

struct HashGridCell
{
    std::size_t operator()(GridCell cell) const noexcept
    {
        uint64_t h = static_cast<uint64_t>(static_cast<uint32_t>(cell.x)) * 0x9E3779B97F4A7C15ull;
        h ^= static_cast<uint64_t>(static_cast<uint32_t>(cell.y)) + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
        return static_cast<std::size_t>(h);
    }
};

// Inclusive range of cells covered by a box
struct CellRange
{
    int32_t minX;
    int32_t minY;
    int32_t maxX;
    int32_t maxY;

    // Saturates at the uint64_t maximum, a full int32 range on both axes would wrap to 0
    uint64_t cellCount() const
    {
        const auto columns = static_cast<uint64_t>(static_cast<int64_t>(maxX) - minX + 1);
        const auto rows = static_cast<uint64_t>(static_cast<int64_t>(maxY) - minY + 1);
        if (columns > std::numeric_limits<uint64_t>::max() / rows)
            return std::numeric_limits<uint64_t>::max();
        return columns * rows;
    }
};

// Uniform grid mapping cells to the indices of the boxes overlapping them.
// Buckets are created on first use and their storage is recycled by clear().
class SpatialHashGrid
{
  public:
    static constexpr float defaultCellSize = 64.0f;
    static constexpr std::size_t defaultMaxCellsPerObject = 4096;

    explicit SpatialHashGrid(float cellSize = defaultCellSize,
                             std::size_t maxCellsPerObject = defaultMaxCellsPerObject);

    // Only allowed on an empty grid
    void setCellSize(float cellSize);
    void setMaxCellsPerObject(std::size_t maxCellsPerObject);

    void insert(ObjectIndex index, AABB boundingBox);

    // Appends the indices sharing at least one cell with the box, without duplicates
    template <typename Allocator>
    void query(AABB boundingBox, std::vector<ObjectIndex, Allocator>& candidates, VisitedSet& visited) const;
    template <typename Allocator>
    void query(AABB boundingBox, std::vector<ObjectIndex, Allocator>& candidates) const;

    void clear();

    // Cell size close to the median object dimension, bounded so the grid stays under ~1024 cells per axis
    static float chooseCellSize(std::span<const AABB> boxes);
    static float cellSizeFor(float medianDimension, AABB bounds);

    CellRange cellRangeFor(AABB boundingBox) const;

    float getCellSize() const
    {
        return mCellSize;
    }

    std::size_t getMaxCellsPerObject() const
    {
        return mMaxCellsPerObject;
    }

    // Number of non empty cells
    std::size_t cellCount() const
    {
        return mCells.size();
    }

    // Number of inserted objects
    std::size_t size() const
    {
        return mObjects.size();
    }

    bool empty() const
    {
        return mObjects.empty();
    }

    std::size_t oversizedCount() const
    {
        return mOversized.size();
    }

    std::size_t maxBucketSize() const
    {
        return mMaxBucketSize;
    }

    std::size_t bucketCapacity() const
    {
        return mBuckets.size();
    }

  private:
    float mCellSize;
    std::size_t mMaxCellsPerObject;

    tsl::robin_map<GridCell, uint32_t, HashGridCell> mCells; // cell -> index in mBuckets
    std::vector<std::vector<ObjectIndex>> mBuckets;
    uint32_t mBucketsInUse = 0;

    std::vector<ObjectIndex> mObjects;
    std::vector<ObjectIndex> mOversized; // boxes spanning too many cells to rasterize
    std::size_t mMaxBucketSize = 0;

    std::vector<ObjectIndex>& bucketFor(GridCell cell);
};

template <typename Allocator>
void SpatialHashGrid::query(AABB boundingBox,
                            std::vector<ObjectIndex, Allocator>& candidates,
                            VisitedSet& visited) const
{
    visited.nextGeneration();

    const auto range = cellRangeFor(boundingBox);
    if (range.cellCount() > mMaxCellsPerObject)
    {
        for (const auto index : mObjects)
            if (visited.insert(index))
                candidates.push_back(index);
        return;
    }

    for (const auto index : mOversized)
        if (visited.insert(index))
            candidates.push_back(index);

    for (int32_t y = range.minY;; ++y)
    {
        for (int32_t x = range.minX;; ++x)
        {
            const auto it = mCells.find(GridCell{x, y});
            if (it != mCells.end())
            {
                for (const auto index : mBuckets[it->second])
                    if (visited.insert(index))
                        candidates.push_back(index);
            }

            if (x == range.maxX)
                break;
        }

        if (y == range.maxY)
            break;
    }
}

template <typename Allocator>
void SpatialHashGrid::query(AABB boundingBox, std::vector<ObjectIndex, Allocator>& candidates) const
{
    const auto firstNew = static_cast<std::ptrdiff_t>(candidates.size());
    const auto range = cellRangeFor(boundingBox);

    if (range.cellCount() > mMaxCellsPerObject)
    {
        candidates.insert(candidates.end(), mObjects.begin(), mObjects.end());
    }
    else
    {
        candidates.insert(candidates.end(), mOversized.begin(), mOversized.end());

        for (int32_t y = range.minY;; ++y)
        {
            for (int32_t x = range.minX;; ++x)
            {
                const auto it = mCells.find(GridCell{x, y});
                if (it != mCells.end())
                {
                    const auto& bucket = mBuckets[it->second];
                    candidates.insert(candidates.end(), bucket.begin(), bucket.end());
                }

                if (x == range.maxX)
                    break;
            }

            if (y == range.maxY)
                break;
        }
    }

    // Sort to detect duplicates -> duplicates will be adjacent in the sorted range
    std::sort(candidates.begin() + firstNew, candidates.end());
    candidates.erase(std::unique(candidates.begin() + firstNew, candidates.end()), candidates.end());
}

} // namespace o2d
