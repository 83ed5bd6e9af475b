#pragma once

#include <overlap2d/Config.hpp>
#include <overlap2d/Strategy.hpp>
#include <overlap2d/internal/geometry/AABB.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace o2d
{

// Cheap per call description of the input, used to pick a strategy.
// The threshold policy reads objectCount and overlapRatio only. Density, coverage and bounds
// depend on the coordinate units and are there for decision hooks and the selection history.
struct WorkloadCharacteristics
{
    std::size_t objectCount = 0;
    AABB bounds;                 // smallest box containing every input
    float spatialDensity = 0.0f; // objects per unit of bounds area
    float coverage = 0.0f;       // summed box area over bounds area
    float medianDimension = 0.0f;
    float overlapRatio = 0.0f; // fraction of sampled pairs that overlap

    // Inputs up to exactSampleLimit objects test every pair for the overlap ratio,
    // larger ones test sampleCount deterministically spread pairs
    static WorkloadCharacteristics compute(std::span<const AABB> boxes, std::size_t sampleCount);

    static constexpr std::size_t exactSampleLimit = 16;
};

// Outcome of one call, kept so thresholds can be tuned offline
struct SelectionRecord
{
    WorkloadCharacteristics characteristics;
    Strategy strategy;
    bool forced;
    std::chrono::nanoseconds elapsed;
};

class AlgorithmSelector
{
  public:
    // Returns a strategy to override the threshold policy, or nullopt to keep it
    using DecisionHook =
        std::function<std::optional<Strategy>(const WorkloadCharacteristics&, const std::deque<SelectionRecord>&)>;

    static constexpr std::size_t defaultHistorySize = 256;

    explicit AlgorithmSelector(SelectionThresholds thresholds = {}, std::size_t historySize = defaultHistorySize);

    Strategy select(const WorkloadCharacteristics& characteristics) const;

    // Threshold policy alone, without the hook
    Strategy selectByThresholds(const WorkloadCharacteristics& characteristics) const;

    void setDecisionHook(DecisionHook hook);

    void record(SelectionRecord record);
    std::deque<SelectionRecord> history() const;
    void clearHistory();

    const SelectionThresholds& thresholds() const
    {
        return mThresholds;
    }

  private:
    SelectionThresholds mThresholds;
    std::size_t mHistorySize;

    mutable std::mutex mMutex;
    DecisionHook mHook;
    std::deque<SelectionRecord> mHistory;
};

} // namespace o2d
