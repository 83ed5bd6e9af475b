#pragma once

#include <overlap2d/internal/geometry/AABB.hpp>

#include <cstdint>
#include <span>
#include <string>

namespace o2d
{

// FNV-1a over the ordered box values. Equal sequences hash equally wherever they live.
uint64_t hashBoxes(std::span<const AABB> boxes);

// Cache key of a box sequence: "<hash as hex>:<count>"
std::string fingerprint(std::span<const AABB> boxes);

} // namespace o2d
