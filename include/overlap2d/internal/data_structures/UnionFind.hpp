#pragma once

#include <overlap2d/CollisionPair.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace o2d
{

// Disjoint sets over [0, n) stored as flat parent / rank arrays.
// Path compression and union by rank keep operations at amortized O(alpha(n)).
class UnionFind
{
  public:
    static constexpr std::size_t defaultBatchSize = 64;

    explicit UnionFind(std::size_t size = 0, std::size_t batchSize = defaultBatchSize);

    // Every element back to its own set, keeping the allocations
    void reset(std::size_t size);

    void setBatchSize(std::size_t batchSize);

    ObjectIndex find(ObjectIndex element);

    // Returns false if both elements already share a root
    bool unite(ObjectIndex first, ObjectIndex second);

    bool connected(ObjectIndex first, ObjectIndex second);

    // Buffered unions, applied once the batch is full or on flush()
    void queueUnion(ObjectIndex first, ObjectIndex second);
    void batchUnion(std::span<const CollisionPair> pairs);
    void flush();

    // Groups of elements sharing a root, ordered by their smallest member
    std::vector<Component> allComponents();
    std::size_t componentCount();

    std::size_t size() const
    {
        return mParent.size();
    }

    std::size_t pendingUnions() const
    {
        return mPending.size();
    }

    std::size_t getBatchSize() const
    {
        return mBatchSize;
    }

  private:
    std::vector<ObjectIndex> mParent;
    std::vector<uint8_t> mRank;
    std::vector<CollisionPair> mPending;
    std::size_t mBatchSize;
};

} // namespace o2d
