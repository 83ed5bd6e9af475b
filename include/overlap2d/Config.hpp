#pragma once

#include <overlap2d/Strategy.hpp>
#include <overlap2d/internal/utils/Serialization.hpp>

#include <chrono>
#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>

namespace o2d
{

// Object counts and overlap ratio driving the algorithm choice
struct SelectionThresholds
{
    std::size_t naive = 25;    // below this count: all pairs scan
    std::size_t spatial = 100; // from this count on, overlap heavy inputs also build components
    float overlapRatio = 0.05f;

    void validate() const;

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void serialize(Archive& archive)
    {
        archive(naive, spatial, overlapRatio);
    }
#endif

    bool operator==(const SelectionThresholds&) const = default;
};

// Capacity 0 disables the LRU bound, a zero ttl disables expiry
struct CacheConfig
{
    std::size_t capacity = 128;
    std::chrono::milliseconds ttl{0};

    void validate() const;

    bool operator==(const CacheConfig&) const = default;
};

struct MonitorConfig
{
    std::size_t historySize = 1024; // calls kept for latency percentiles
    std::size_t recentWindow = 32;  // calls compared against the older part of the history
    double degradationFactor = 2.0;

    void validate() const;

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void serialize(Archive& archive)
    {
        archive(historySize, recentWindow, degradationFactor);
    }
#endif

    bool operator==(const MonitorConfig&) const = default;
};

struct EngineConfig
{
    float cellSize = 0.0f;             // 0 picks the median object dimension for every call
    std::size_t maxObjectsPerCell = 16; // advisory, fuller buckets are reported in the debug log
    std::size_t maxCellsPerObject = 4096;

    bool enableCaching = true;
    std::size_t cacheCapacity = 128;
    std::chrono::milliseconds cacheTTL{0};

    SelectionThresholds thresholds;
    std::size_t overlapSampleCount = 64;
    std::size_t selectorHistorySize = 256;
    std::optional<Strategy> forcedStrategy;

    bool enableMemoryPooling = true;
    std::size_t poolCapacity = 8;
    std::size_t unionFindBatchSize = 64;

    MonitorConfig monitor;

    // Throws ConfigurationError on the first inconsistent setting
    void validate() const;

    CacheConfig cacheConfig() const
    {
        return CacheConfig{.capacity = cacheCapacity, .ttl = cacheTTL};
    }

    void serialize(std::ostream& out) const;
    static EngineConfig deserialize(std::istream& in);

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void serialize(Archive& archive)
    {
        archive(cellSize,
                maxObjectsPerCell,
                maxCellsPerObject,
                enableCaching,
                cacheCapacity,
                cacheTTL,
                thresholds,
                overlapSampleCount,
                selectorHistorySize,
                forcedStrategy,
                enableMemoryPooling,
                poolCapacity,
                unionFindBatchSize,
                monitor);
    }
#endif

    bool operator==(const EngineConfig&) const = default;
};

} // namespace o2d
