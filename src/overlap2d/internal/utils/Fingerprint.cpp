#include <overlap2d/internal/utils/Fingerprint.hpp>

#include <array>
#include <bit>
#include <format>

namespace o2d
{

namespace
{

constexpr uint64_t fnvOffsetBasis = 0xcbf29ce484222325ull;
constexpr uint64_t fnvPrime = 0x100000001b3ull;

template <typename T>
void hashValue(uint64_t& hash, T value)
{
    const auto bytes = std::bit_cast<std::array<unsigned char, sizeof(T)>>(value);
    for (const auto byte : bytes)
    {
        hash ^= byte;
        hash *= fnvPrime;
    }
}

void hashFloat(uint64_t& hash, float value)
{
    // -0.0f and 0.0f compare equal, they must hash equal too
    hashValue(hash, value == 0.0f ? 0.0f : value);
}

} // namespace

uint64_t hashBoxes(std::span<const AABB> boxes)
{
    uint64_t hash = fnvOffsetBasis;
    hashValue(hash, static_cast<uint64_t>(boxes.size()));

    for (const auto& box : boxes)
    {
        hashFloat(hash, box.x);
        hashFloat(hash, box.y);
        hashFloat(hash, box.width);
        hashFloat(hash, box.height);
    }

    return hash;
}

std::string fingerprint(std::span<const AABB> boxes)
{
    return std::format("{:016x}:{}", hashBoxes(boxes), boxes.size());
}

} // namespace o2d
