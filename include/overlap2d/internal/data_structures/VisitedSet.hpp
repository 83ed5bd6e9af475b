#pragma once

#include <overlap2d/CollisionPair.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace o2d
{

// Set of object indices cleared in O(1) by bumping a generation stamp
class VisitedSet
{
  public:
    explicit VisitedSet(std::size_t size = 0)
    {
        reset(size);
    }

    // Forget every index and size the set for [0, size), keeping the allocation
    void reset(std::size_t size)
    {
        mStamps.assign(size, 0);
        mGeneration = 1;
    }

    void nextGeneration()
    {
        if (mGeneration == std::numeric_limits<uint32_t>::max())
        {
            std::fill(mStamps.begin(), mStamps.end(), 0);
            mGeneration = 1;
            return;
        }
        ++mGeneration;
    }

    // Returns true if the index was not visited in the current generation
    bool insert(ObjectIndex index)
    {
        if (index >= mStamps.size())
            mStamps.resize(static_cast<std::size_t>(index) + 1, 0);

        if (mStamps[index] == mGeneration)
            return false;
        mStamps[index] = mGeneration;
        return true;
    }

    bool contains(ObjectIndex index) const
    {
        return index < mStamps.size() && mStamps[index] == mGeneration;
    }

    std::size_t size() const
    {
        return mStamps.size();
    }

    std::size_t capacity() const
    {
        return mStamps.capacity();
    }

  private:
    std::vector<uint32_t> mStamps;
    uint32_t mGeneration = 1;
};

} // namespace o2d
