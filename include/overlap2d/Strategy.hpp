#pragma once

#include <cstdint>
#include <format>
#include <string>

namespace o2d
{

constexpr uint8_t strategiesCount = 3;
enum class Strategy : uint8_t
{
    Naive = 0,            // all pairs, O(n^2)
    SpatialHash,          // uniform grid candidates
    SpatialHashUnionFind, // uniform grid candidates plus connected components
};

inline const char* toString(Strategy strategy)
{
    switch (strategy)
    {
    case Strategy::Naive:
        return "Naive";
    case Strategy::SpatialHash:
        return "SpatialHash";
    case Strategy::SpatialHashUnionFind:
        return "SpatialHashUnionFind";
    default:
        return "Unknown";
    }
}

} // namespace o2d

template <>
struct std::formatter<o2d::Strategy> : std::formatter<std::string>
{
    template <typename FormatContext>
    auto format(o2d::Strategy strategy, FormatContext& ctx) const
    {
        return std::formatter<std::string>::format(o2d::toString(strategy), ctx);
    }
};
