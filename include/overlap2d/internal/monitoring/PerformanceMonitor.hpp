#pragma once

#include <overlap2d/Config.hpp>
#include <overlap2d/Statistics.hpp>
#include <overlap2d/Strategy.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace o2d
{

struct CallRecord
{
    std::chrono::nanoseconds elapsed{0};
    Strategy strategy = Strategy::Naive;
    std::size_t objectCount = 0;
    uint64_t poolHits = 0;   // pool hits during the call
    uint64_t poolMisses = 0; // pool misses during the call
    bool cacheHit = false;
};

// Latency percentiles over a rolling window plus cumulative counters
class PerformanceMonitor
{
  public:
    explicit PerformanceMonitor(MonitorConfig config = {});

    void record(const CallRecord& call);

    StatisticsSnapshot snapshot() const;

    // Recent p95 above degradationFactor times the p95 of the older calls in the window.
    // Re-evaluated every recentWindow calls.
    bool isDegraded() const;

    void reset();

    const MonitorConfig& config() const
    {
        return mConfig;
    }

  private:
    MonitorConfig mConfig;

    mutable std::mutex mMutex;
    std::deque<std::chrono::nanoseconds> mLatencies;
    uint64_t mCalls = 0;
    uint64_t mPoolHits = 0;
    uint64_t mPoolMisses = 0;
    uint64_t mCacheHits = 0;
    std::array<uint64_t, strategiesCount> mSelections{};
    std::size_t mSinceEvaluation = 0;
    bool mDegraded = false;
    std::vector<std::chrono::nanoseconds> mScratch;

    bool computeDegradedLocked();
};

} // namespace o2d
