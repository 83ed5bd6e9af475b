#include <overlap2d/Errors.hpp>
#include <overlap2d/internal/collision/AlgorithmSelector.hpp>

#include <algorithm>
#include <cstdint>
#include <utility>

namespace o2d
{

namespace
{

constexpr float minimumBoundsArea = 1e-6f;

float overlapRatioOf(std::span<const AABB> boxes, std::size_t sampleCount)
{
    const std::size_t count = boxes.size();
    if (count < 2)
        return 0.0f;

    std::size_t tested = 0;
    std::size_t overlapping = 0;

    if (count <= WorkloadCharacteristics::exactSampleLimit)
    {
        for (std::size_t i = 0; i < count; ++i)
            for (std::size_t j = i + 1; j < count; ++j)
            {
                ++tested;
                overlapping += boxes[i].overlaps(boxes[j]) ? 1 : 0;
            }
    }
    else
    {
        for (std::size_t sample = 0; sample < sampleCount; ++sample)
        {
            // Multiplicative hashing spreads the samples, the offset in [1, n - 1] keeps i != j
            const std::size_t i = static_cast<std::size_t>((sample * 2654435761ull) % count);
            const std::size_t offset = 1 + static_cast<std::size_t>((sample * 40503ull + 7) % (count - 1));
            const std::size_t j = (i + offset) % count;

            ++tested;
            overlapping += boxes[i].overlaps(boxes[j]) ? 1 : 0;
        }
    }

    return tested == 0 ? 0.0f : static_cast<float>(overlapping) / static_cast<float>(tested);
}

} // namespace

WorkloadCharacteristics WorkloadCharacteristics::compute(std::span<const AABB> boxes, std::size_t sampleCount)
{
    WorkloadCharacteristics characteristics;
    characteristics.objectCount = boxes.size();
    if (boxes.empty())
        return characteristics;

    std::vector<float> dimensions;
    dimensions.reserve(boxes.size());

    AABB bounds = boxes.front();
    double summedArea = 0.0;
    for (const auto& box : boxes)
    {
        bounds = AABB::combine(bounds, box);
        summedArea += static_cast<double>(box.area());
        dimensions.push_back(box.size().getBigger());
    }

    const auto middle = dimensions.begin() + static_cast<std::ptrdiff_t>(dimensions.size() / 2);
    std::nth_element(dimensions.begin(), middle, dimensions.end());

    const float boundsArea = std::max(bounds.area(), minimumBoundsArea);
    characteristics.bounds = bounds;
    characteristics.spatialDensity = static_cast<float>(boxes.size()) / boundsArea;
    characteristics.coverage = static_cast<float>(summedArea / static_cast<double>(boundsArea));
    characteristics.medianDimension = *middle;
    characteristics.overlapRatio = overlapRatioOf(boxes, sampleCount);

    return characteristics;
}

AlgorithmSelector::AlgorithmSelector(SelectionThresholds thresholds, std::size_t historySize)
    : mThresholds(thresholds),
      mHistorySize(historySize)
{
    mThresholds.validate();
    if (historySize == 0)
        throw ConfigurationError("selector history size must be positive");
}

Strategy AlgorithmSelector::selectByThresholds(const WorkloadCharacteristics& characteristics) const
{
    if (characteristics.objectCount < mThresholds.naive)
        return Strategy::Naive;

    if (characteristics.objectCount >= mThresholds.spatial && characteristics.overlapRatio >= mThresholds.overlapRatio)
        return Strategy::SpatialHashUnionFind;

    return Strategy::SpatialHash;
}

Strategy AlgorithmSelector::select(const WorkloadCharacteristics& characteristics) const
{
    {
        // The hook runs under the lock and must not call back into the selector
        std::lock_guard lock(mMutex);
        if (mHook)
        {
            if (const auto decided = mHook(characteristics, mHistory))
                return *decided;
        }
    }

    return selectByThresholds(characteristics);
}

void AlgorithmSelector::setDecisionHook(DecisionHook hook)
{
    std::lock_guard lock(mMutex);
    mHook = std::move(hook);
}

void AlgorithmSelector::record(SelectionRecord record)
{
    std::lock_guard lock(mMutex);
    mHistory.push_back(std::move(record));
    while (mHistory.size() > mHistorySize)
        mHistory.pop_front();
}

std::deque<SelectionRecord> AlgorithmSelector::history() const
{
    std::lock_guard lock(mMutex);
    return mHistory;
}

void AlgorithmSelector::clearHistory()
{
    std::lock_guard lock(mMutex);
    mHistory.clear();
}

} // namespace o2d
