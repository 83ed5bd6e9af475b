#include <overlap2d/internal/monitoring/PerformanceMonitor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <vector>

namespace o2d
{

namespace
{

using Latencies = std::vector<std::chrono::nanoseconds>;

// Nearest rank percentile of a sorted, non empty range
std::chrono::nanoseconds percentile(const Latencies& sorted, double fraction)
{
    const auto rank = static_cast<std::size_t>(std::ceil(fraction * static_cast<double>(sorted.size())));
    return sorted[std::clamp<std::size_t>(rank, 1, sorted.size()) - 1];
}

// Same rank as percentile(), selected in linear time. The scratch buffer keeps its capacity between calls.
template <typename Iterator>
std::chrono::nanoseconds p95Of(Iterator begin, Iterator end, Latencies& latencies)
{
    latencies.assign(begin, end);
    const auto rank = static_cast<std::size_t>(std::ceil(0.95 * static_cast<double>(latencies.size())));
    const auto index = std::clamp<std::size_t>(rank, 1, latencies.size()) - 1;
    const auto nth = latencies.begin() + static_cast<std::ptrdiff_t>(index);
    std::nth_element(latencies.begin(), nth, latencies.end());
    return *nth;
}

} // namespace

PerformanceMonitor::PerformanceMonitor(MonitorConfig config) : mConfig(config)
{
    mConfig.validate();
}

void PerformanceMonitor::record(const CallRecord& call)
{
    std::lock_guard lock(mMutex);

    ++mCalls;
    mPoolHits += call.poolHits;
    mPoolMisses += call.poolMisses;
    if (call.cacheHit)
        ++mCacheHits;
    else
        ++mSelections[static_cast<std::size_t>(call.strategy)];

    mLatencies.push_back(call.elapsed);
    while (mLatencies.size() > mConfig.historySize)
        mLatencies.pop_front();

    // Evaluated once per recent window
    if (++mSinceEvaluation < mConfig.recentWindow)
        return;
    mSinceEvaluation = 0;

    const bool degraded = computeDegradedLocked();
    if (degraded && !mDegraded)
        spdlog::warn("Collision detection latency degraded: recent p95 exceeds {}x the baseline p95",
                     mConfig.degradationFactor);
    else if (!degraded && mDegraded)
        spdlog::info("Collision detection latency back within baseline");
    mDegraded = degraded;
}

bool PerformanceMonitor::computeDegradedLocked()
{
    const auto recent = mConfig.recentWindow;
    if (mLatencies.size() < recent * 2)
        return false;

    const auto recentBegin = mLatencies.end() - static_cast<std::ptrdiff_t>(recent);
    const auto baseline = p95Of(mLatencies.begin(), recentBegin, mScratch);
    const auto current = p95Of(recentBegin, mLatencies.end(), mScratch);

    return static_cast<double>(current.count()) > static_cast<double>(baseline.count()) * mConfig.degradationFactor;
}

StatisticsSnapshot PerformanceMonitor::snapshot() const
{
    std::lock_guard lock(mMutex);

    StatisticsSnapshot snapshot;
    snapshot.calls = mCalls;
    snapshot.algorithmSelectionCounts = mSelections;
    snapshot.degraded = mDegraded;

    const auto poolRequests = mPoolHits + mPoolMisses;
    snapshot.poolHitRate =
        poolRequests == 0 ? 0.0 : static_cast<double>(mPoolHits) / static_cast<double>(poolRequests);
    snapshot.cacheHitRate = mCalls == 0 ? 0.0 : static_cast<double>(mCacheHits) / static_cast<double>(mCalls);

    if (mLatencies.empty())
        return snapshot;

    Latencies sorted(mLatencies.begin(), mLatencies.end());
    std::sort(sorted.begin(), sorted.end());

    const auto total = std::accumulate(sorted.begin(), sorted.end(), std::chrono::nanoseconds(0));
    snapshot.meanLatency = total / static_cast<int64_t>(sorted.size());
    snapshot.medianLatency = percentile(sorted, 0.5);
    snapshot.p95Latency = percentile(sorted, 0.95);
    snapshot.p99Latency = percentile(sorted, 0.99);

    return snapshot;
}

bool PerformanceMonitor::isDegraded() const
{
    std::lock_guard lock(mMutex);
    return mDegraded;
}

void PerformanceMonitor::reset()
{
    std::lock_guard lock(mMutex);
    mLatencies.clear();
    mCalls = 0;
    mPoolHits = 0;
    mPoolMisses = 0;
    mCacheHits = 0;
    mSelections.fill(0);
    mSinceEvaluation = 0;
    mDegraded = false;
}

} // namespace o2d
