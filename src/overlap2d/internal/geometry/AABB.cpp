#include <overlap2d/internal/geometry/AABB.hpp>

#include <algorithm>
#include <cmath>

namespace o2d
{

AABB AABB::fromMinMax(Vec2 min, Vec2 max)
{
    return AABB{.x = min.x, .y = min.y, .width = max.x - min.x, .height = max.y - min.y};
}

AABB AABB::combine(AABB a, AABB b)
{
    const auto minX = std::min(a.x, b.x);
    const auto minY = std::min(a.y, b.y);
    const auto maxX = std::max(a.x + a.width, b.x + b.width);
    const auto maxY = std::max(a.y + a.height, b.y + b.height);

    return fromMinMax(Vec2{minX, minY}, Vec2{maxX, maxY});
}

Vec2 AABB::center() const
{
    return Vec2{x + width * 0.5f, y + height * 0.5f};
}

Vec2 AABB::size() const
{
    return Vec2{width, height};
}

float AABB::area() const
{
    return width * height;
}

float AABB::perimeter() const
{
    return 2.0f * (width + height);
}

bool AABB::isValid() const
{
    return std::isfinite(x) && std::isfinite(y) && std::isfinite(width) && std::isfinite(height) &&
           width >= 0.0f && height >= 0.0f;
}

bool AABB::contains(Vec2 point) const
{
    return point.x >= x && point.x <= x + width &&
           point.y >= y && point.y <= y + height;
}

bool AABB::contains(AABB other) const
{
    return x <= other.x && y <= other.y &&
           x + width >= other.x + other.width && y + height >= other.y + other.height;
}

std::string AABB::toString() const
{
    return std::format("AABB(x={}, y={}, width={}, height={})", x, y, width, height);
}

} // namespace o2d
