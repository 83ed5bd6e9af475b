#pragma once

#include <algorithm>
#include <format>
#include <ostream>
#include <string>
#include <type_traits>

namespace o2d
{

class Vec2
{
  public:
    float x;
    float y;

    constexpr Vec2() : Vec2(0, 0) {}

    constexpr Vec2(float x, float y) : x(x), y(y) {}

    std::string toString() const;

    constexpr float getBigger() const
    {
        return std::max(x, y);
    }

    constexpr bool operator==(Vec2 other) const
    {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(Vec2 other) const
    {
        return !(*this == other);
    }

    friend std::ostream& operator<<(std::ostream& os, const Vec2& vec)
    {
        return os << vec.toString();
    }
};

inline std::string Vec2::toString() const
{
    return std::format("Vec2({}, {})", x, y);
}

static_assert(std::is_trivially_copyable_v<Vec2>, "Vec2 must be trivially copyable");

} // namespace o2d

// Specialization for std::formatter to allow formatted output of Vec2
template <>
struct std::formatter<o2d::Vec2> : std::formatter<std::string>
{
    template <typename FormatContext>
    auto format(o2d::Vec2 vec, FormatContext& ctx) const
    {
        return std::formatter<std::string>::format(vec.toString(), ctx);
    }
};
