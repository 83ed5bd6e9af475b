#pragma once

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace o2d
{

// Smallest power of two >= value (1 for 0)
inline constexpr std::size_t nextPowerOfTwo(std::size_t value)
{
    return value <= 1 ? 1 : std::bit_ceil(value);
}

// floor(value / cellSize) saturated to the int32 range
inline int32_t cellCoordinate(float value, float cellSize)
{
    const double cell = std::floor(static_cast<double>(value) / static_cast<double>(cellSize));

    if (cell <= static_cast<double>(std::numeric_limits<int32_t>::min()))
        return std::numeric_limits<int32_t>::min();
    if (cell >= static_cast<double>(std::numeric_limits<int32_t>::max()))
        return std::numeric_limits<int32_t>::max();
    return static_cast<int32_t>(cell);
}

} // namespace o2d
