#include <overlap2d/Errors.hpp>
#include <overlap2d/internal/data_structures/SpatialHashGrid.hpp>

#include <cmath>
#include <string>

namespace o2d
{

namespace
{

constexpr float maxCellsPerAxis = 1024.0f;

void validateCellSize(float cellSize)
{
    if (!std::isfinite(cellSize) || cellSize <= 0.0f)
        throw ConfigurationError("cell size must be finite and positive, got " + std::to_string(cellSize));
}

} // namespace

SpatialHashGrid::SpatialHashGrid(float cellSize, std::size_t maxCellsPerObject)
    : mCellSize(cellSize),
      mMaxCellsPerObject(maxCellsPerObject)
{
    validateCellSize(cellSize);
    if (maxCellsPerObject == 0)
        throw ConfigurationError("maxCellsPerObject must be positive");
}

void SpatialHashGrid::setCellSize(float cellSize)
{
    O2D_DEBUG_ASSERT(empty(), "Cell size can only change on an empty grid");
    validateCellSize(cellSize);
    mCellSize = cellSize;
}

void SpatialHashGrid::setMaxCellsPerObject(std::size_t maxCellsPerObject)
{
    O2D_DEBUG_ASSERT(empty(), "Cell limit can only change on an empty grid");
    if (maxCellsPerObject == 0)
        throw ConfigurationError("maxCellsPerObject must be positive");
    mMaxCellsPerObject = maxCellsPerObject;
}

CellRange SpatialHashGrid::cellRangeFor(AABB boundingBox) const
{
    return CellRange{
        .minX = cellCoordinate(boundingBox.x, mCellSize),
        .minY = cellCoordinate(boundingBox.y, mCellSize),
        .maxX = cellCoordinate(boundingBox.x + boundingBox.width, mCellSize),
        .maxY = cellCoordinate(boundingBox.y + boundingBox.height, mCellSize),
    };
}

std::vector<ObjectIndex>& SpatialHashGrid::bucketFor(GridCell cell)
{
    const auto it = mCells.find(cell);
    if (it != mCells.end())
        return mBuckets[it->second];

    // Reuse a bucket left over from a previous clear() before allocating a new one
    if (mBucketsInUse == mBuckets.size())
        mBuckets.emplace_back();

    const auto bucketIndex = mBucketsInUse++;
    mCells.emplace(cell, bucketIndex);
    return mBuckets[bucketIndex];
}

void SpatialHashGrid::insert(ObjectIndex index, AABB boundingBox)
{
    mObjects.push_back(index);

    const auto range = cellRangeFor(boundingBox);
    if (range.cellCount() > mMaxCellsPerObject)
    {
        mOversized.push_back(index);
        return;
    }

    for (int32_t y = range.minY;; ++y)
    {
        for (int32_t x = range.minX;; ++x)
        {
            auto& bucket = bucketFor(GridCell{x, y});
            bucket.push_back(index);
            mMaxBucketSize = std::max(mMaxBucketSize, bucket.size());

            if (x == range.maxX)
                break;
        }

        if (y == range.maxY)
            break;
    }
}

void SpatialHashGrid::clear()
{
    for (uint32_t i = 0; i < mBucketsInUse; ++i)
        mBuckets[i].clear();

    mCells.clear();
    mBucketsInUse = 0;
    mObjects.clear();
    mOversized.clear();
    mMaxBucketSize = 0;
}

float SpatialHashGrid::chooseCellSize(std::span<const AABB> boxes)
{
    if (boxes.empty())
        return defaultCellSize;

    std::vector<float> dimensions;
    dimensions.reserve(boxes.size());

    AABB bounds = boxes.front();
    for (const auto& box : boxes)
    {
        dimensions.push_back(box.size().getBigger());
        bounds = AABB::combine(bounds, box);
    }

    const auto middle = dimensions.begin() + static_cast<std::ptrdiff_t>(dimensions.size() / 2);
    std::nth_element(dimensions.begin(), middle, dimensions.end());
    return cellSizeFor(*middle, bounds);
}

float SpatialHashGrid::cellSizeFor(float medianDimension, AABB bounds)
{
    const float minimumForExtent = bounds.size().getBigger() / maxCellsPerAxis;
    const float cellSize = std::max(medianDimension, minimumForExtent);

    if (!std::isfinite(cellSize) || cellSize <= 0.0f)
        return 1.0f;
    return cellSize;
}

} // namespace o2d
