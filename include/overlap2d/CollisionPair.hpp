#pragma once

#include <overlap2d/internal/utils/Serialization.hpp>

#include <compare>
#include <cstdint>
#include <format>
#include <string>
#include <type_traits>
#include <vector>

namespace o2d
{

using ObjectIndex = uint32_t;

// Indices of two overlapping boxes, always a < b
struct CollisionPair
{
    ObjectIndex a;
    ObjectIndex b;

    static CollisionPair ordered(ObjectIndex first, ObjectIndex second)
    {
        return first < second ? CollisionPair{first, second} : CollisionPair{second, first};
    }

    std::string toString() const
    {
        return std::format("({}, {})", a, b);
    }

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void serialize(Archive& archive)
    {
        archive(a, b);
    }
#endif

    auto operator<=>(const CollisionPair& other) const = default;
};

static_assert(std::is_trivially_copyable_v<CollisionPair>, "CollisionPair must be trivially copyable");

using PairList = std::vector<CollisionPair>;

// Indices transitively linked by collisions, ascending
using Component = std::vector<ObjectIndex>;

} // namespace o2d

template <>
struct std::formatter<o2d::CollisionPair> : std::formatter<std::string>
{
    template <typename FormatContext>
    auto format(o2d::CollisionPair pair, FormatContext& ctx) const
    {
        return std::formatter<std::string>::format(pair.toString(), ctx);
    }
};
