#pragma once

#include <overlap2d/CollisionPair.hpp>
#include <overlap2d/Strategy.hpp>

#include <optional>
#include <vector>

namespace o2d
{

struct CollisionResult
{
    PairList pairs; // ascending by a, then b
    std::optional<std::vector<Component>> components; // only filled by Strategy::SpatialHashUnionFind
    Strategy strategy = Strategy::Naive;
    bool fromCache = false;
};

} // namespace o2d
