#pragma once

#include <overlap2d/CollisionPair.hpp>
#include <overlap2d/internal/data_structures/SpatialHashGrid.hpp>
#include <overlap2d/internal/data_structures/UnionFind.hpp>
#include <overlap2d/internal/data_structures/VisitedSet.hpp>
#include <overlap2d/internal/geometry/AABB.hpp>

#include <span>

namespace o2d
{

// Every function appends pairs with a < b, sorted by a then b, to `pairs`.

// All pairs scan
void naiveCollisions(std::span<const AABB> boxes, PairList& pairs);

// Inserts every box into `grid` (expected empty) and tests each box only against the boxes sharing a cell
void spatialHashCollisions(std::span<const AABB> boxes, SpatialHashGrid& grid, VisitedSet& visited, PairList& pairs);

// Same scan, every confirmed pair is also united in `unionFind` (expected sized to boxes.size())
void spatialHashUnionFindCollisions(std::span<const AABB> boxes,
                                    SpatialHashGrid& grid,
                                    VisitedSet& visited,
                                    UnionFind& unionFind,
                                    PairList& pairs);

} // namespace o2d
