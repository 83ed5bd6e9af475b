#pragma once

#include <overlap2d/Strategy.hpp>
#include <overlap2d/internal/utils/Serialization.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace o2d
{

// Read-only copy of the engine statistics for monitoring and reporting layers
struct StatisticsSnapshot
{
    uint64_t calls = 0;
    std::chrono::nanoseconds meanLatency{0};
    std::chrono::nanoseconds medianLatency{0};
    std::chrono::nanoseconds p95Latency{0};
    std::chrono::nanoseconds p99Latency{0};
    double poolHitRate = 0.0;
    double cacheHitRate = 0.0;
    std::array<uint64_t, strategiesCount> algorithmSelectionCounts{};
    bool degraded = false;

    uint64_t selections(Strategy strategy) const
    {
        return algorithmSelectionCounts[static_cast<std::size_t>(strategy)];
    }

    std::string toString() const;

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void serialize(Archive& archive)
    {
        archive(calls,
                meanLatency,
                medianLatency,
                p95Latency,
                p99Latency,
                poolHitRate,
                cacheHitRate,
                algorithmSelectionCounts,
                degraded);
    }
#endif
};

inline std::string StatisticsSnapshot::toString() const
{
    return std::format("Statistics(calls={}, mean={}, median={}, p95={}, p99={}, poolHitRate={:.3f}, "
                       "cacheHitRate={:.3f}, selections=[{}={}, {}={}, {}={}], degraded={})",
                       calls,
                       meanLatency,
                       medianLatency,
                       p95Latency,
                       p99Latency,
                       poolHitRate,
                       cacheHitRate,
                       Strategy::Naive,
                       selections(Strategy::Naive),
                       Strategy::SpatialHash,
                       selections(Strategy::SpatialHash),
                       Strategy::SpatialHashUnionFind,
                       selections(Strategy::SpatialHashUnionFind),
                       degraded);
}

} // namespace o2d

template <>
struct std::formatter<o2d::StatisticsSnapshot> : std::formatter<std::string>
{
    template <typename FormatContext>
    auto format(const o2d::StatisticsSnapshot& snapshot, FormatContext& ctx) const
    {
        return std::formatter<std::string>::format(snapshot.toString(), ctx);
    }
};
