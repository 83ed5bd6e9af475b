#pragma once

#include <overlap2d/Vec2.hpp>
#include <overlap2d/internal/utils/Serialization.hpp>

#include <format>
#include <string>
#include <type_traits>

namespace o2d
{

// Axis aligned box stored as position (lower corner) and size
struct AABB
{
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    static AABB fromMinMax(Vec2 min, Vec2 max);

    // Returns the smallest AABB that contains both a and b
    static AABB combine(AABB a, AABB b);

    Vec2 min() const
    {
        return Vec2{x, y};
    }

    Vec2 max() const
    {
        return Vec2{x + width, y + height};
    }

    Vec2 center() const;
    Vec2 size() const;
    float area() const;
    float perimeter() const;

    // Finite position and finite, non negative size
    bool isValid() const;

    bool contains(Vec2 point) const;
    bool contains(AABB other) const;

    // Touching edges are not an overlap
    bool overlaps(AABB other) const
    {
        return !(x + width <= other.x || other.x + other.width <= x || y + height <= other.y ||
                 other.y + other.height <= y);
    }

    std::string toString() const;

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void serialize(Archive& archive)
    {
        archive(x, y, width, height);
    }
#endif

    bool operator==(const AABB& other) const
    {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }

    bool operator!=(const AABB& other) const
    {
        return !(*this == other);
    }
};

static_assert(std::is_trivially_copyable_v<AABB>, "AABB must be trivially copyable");

inline bool overlaps(AABB a, AABB b)
{
    return a.overlaps(b);
}

} // namespace o2d

// Specialization for std::formatter to allow formatted output of AABB
template <>
struct std::formatter<o2d::AABB> : std::formatter<std::string>
{
    template <typename FormatContext>
    auto format(o2d::AABB aabb, FormatContext& ctx) const
    {
        return std::formatter<std::string>::format(aabb.toString(), ctx);
    }
};
