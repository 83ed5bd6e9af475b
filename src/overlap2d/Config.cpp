#include <overlap2d/Config.hpp>
#include <overlap2d/Errors.hpp>

#include <cmath>
#include <cstdint>
#include <format>

namespace o2d
{

namespace
{

constexpr uint32_t configMagic = 0x4F324443; // "O2DC"
constexpr uint32_t configVersion = 1;

} // namespace

void SelectionThresholds::validate() const
{
    if (naive > spatial)
        throw ConfigurationError(std::format("naive threshold ({}) exceeds spatial threshold ({})", naive, spatial));
    if (!std::isfinite(overlapRatio) || overlapRatio < 0.0f || overlapRatio > 1.0f)
        throw ConfigurationError(std::format("overlap ratio threshold must lie in [0, 1], got {}", overlapRatio));
}

void CacheConfig::validate() const
{
    if (ttl.count() < 0)
        throw ConfigurationError("cache ttl must not be negative");
    if (capacity == 0 && ttl.count() == 0)
        throw ConfigurationError("cache needs a capacity bound or a ttl");
}

void MonitorConfig::validate() const
{
    if (historySize == 0 || recentWindow == 0)
        throw ConfigurationError("monitor windows must be positive");
    if (recentWindow * 2 > historySize)
        throw ConfigurationError(
            std::format("monitor history ({}) must hold at least twice the recent window ({})", historySize, recentWindow));
    if (!std::isfinite(degradationFactor) || degradationFactor <= 1.0)
        throw ConfigurationError(std::format("degradation factor must be greater than 1, got {}", degradationFactor));
}

void EngineConfig::validate() const
{
    if (!std::isfinite(cellSize) || cellSize < 0.0f)
        throw ConfigurationError(std::format("cell size must be finite and non negative, got {}", cellSize));
    if (maxObjectsPerCell == 0)
        throw ConfigurationError("maxObjectsPerCell must be positive");
    if (maxCellsPerObject == 0)
        throw ConfigurationError("maxCellsPerObject must be positive");
    if (enableCaching)
        cacheConfig().validate();
    else if (cacheTTL.count() < 0)
        throw ConfigurationError("cache ttl must not be negative");

    thresholds.validate();

    if (overlapSampleCount == 0)
        throw ConfigurationError("overlapSampleCount must be positive");
    if (selectorHistorySize == 0)
        throw ConfigurationError("selectorHistorySize must be positive");
    if (unionFindBatchSize == 0)
        throw ConfigurationError("unionFindBatchSize must be positive");

    monitor.validate();
}

void EngineConfig::serialize(std::ostream& out) const
{
    Writer writer(out);
    writer(configMagic)(configVersion);
    writer(cellSize)(static_cast<uint64_t>(maxObjectsPerCell))(static_cast<uint64_t>(maxCellsPerObject));
    writer(static_cast<uint8_t>(enableCaching))(static_cast<uint64_t>(cacheCapacity))(
        static_cast<int64_t>(cacheTTL.count()));
    writer(static_cast<uint64_t>(thresholds.naive))(static_cast<uint64_t>(thresholds.spatial))(
        thresholds.overlapRatio);
    writer(static_cast<uint64_t>(overlapSampleCount))(static_cast<uint64_t>(selectorHistorySize));
    writer(static_cast<uint8_t>(forcedStrategy.has_value()))(
        static_cast<uint8_t>(forcedStrategy.value_or(Strategy::Naive)));
    writer(static_cast<uint8_t>(enableMemoryPooling))(static_cast<uint64_t>(poolCapacity))(
        static_cast<uint64_t>(unionFindBatchSize));
    writer(static_cast<uint64_t>(monitor.historySize))(static_cast<uint64_t>(monitor.recentWindow))(
        monitor.degradationFactor);
}

EngineConfig EngineConfig::deserialize(std::istream& in)
{
    Reader reader(in);

    uint32_t magic = 0;
    uint32_t version = 0;
    reader(magic)(version);
    if (magic != configMagic)
        throw ConfigurationError("stream does not hold a serialized EngineConfig");
    if (version != configVersion)
        throw ConfigurationError(std::format("unsupported EngineConfig version {}", version));

    const auto readSize = [&reader]()
    {
        uint64_t value = 0;
        reader(value);
        return static_cast<std::size_t>(value);
    };
    const auto readFlag = [&reader]()
    {
        uint8_t value = 0;
        reader(value);
        return value != 0;
    };

    EngineConfig config;
    reader(config.cellSize);
    config.maxObjectsPerCell = readSize();
    config.maxCellsPerObject = readSize();

    config.enableCaching = readFlag();
    config.cacheCapacity = readSize();
    int64_t ttl = 0;
    reader(ttl);
    config.cacheTTL = std::chrono::milliseconds(ttl);

    config.thresholds.naive = readSize();
    config.thresholds.spatial = readSize();
    reader(config.thresholds.overlapRatio);

    config.overlapSampleCount = readSize();
    config.selectorHistorySize = readSize();

    const bool hasForcedStrategy = readFlag();
    uint8_t strategy = 0;
    reader(strategy);
    if (strategy >= strategiesCount)
        throw ConfigurationError(std::format("unknown strategy id {}", strategy));
    if (hasForcedStrategy)
        config.forcedStrategy = static_cast<Strategy>(strategy);

    config.enableMemoryPooling = readFlag();
    config.poolCapacity = readSize();
    config.unionFindBatchSize = readSize();

    config.monitor.historySize = readSize();
    config.monitor.recentWindow = readSize();
    reader(config.monitor.degradationFactor);

    config.validate();
    return config;
}

} // namespace o2d
