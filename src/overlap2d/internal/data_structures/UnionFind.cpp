#include <overlap2d/Errors.hpp>
#include <overlap2d/internal/data_structures/UnionFind.hpp>
#include <overlap2d/internal/utils/Debug.hpp>

#include <limits>
#include <numeric>
#include <utility>

namespace o2d
{

UnionFind::UnionFind(std::size_t size, std::size_t batchSize) : mBatchSize(batchSize)
{
    if (batchSize == 0)
        throw ConfigurationError("union-find batch size must be positive");
    reset(size);
}

void UnionFind::reset(std::size_t size)
{
    O2D_DEBUG_ASSERT(size <= std::numeric_limits<ObjectIndex>::max(), "Too many elements for ObjectIndex");

    mParent.resize(size);
    std::iota(mParent.begin(), mParent.end(), ObjectIndex{0});
    mRank.assign(size, 0);
    mPending.clear();
}

void UnionFind::setBatchSize(std::size_t batchSize)
{
    if (batchSize == 0)
        throw ConfigurationError("union-find batch size must be positive");

    mBatchSize = batchSize;
    if (mPending.size() >= mBatchSize)
        flush();
}

ObjectIndex UnionFind::find(ObjectIndex element)
{
    O2D_DEBUG_ASSERT(element < mParent.size(), "Element out of range");

    if (!mPending.empty())
        flush();

    ObjectIndex root = element;
    while (mParent[root] != root)
        root = mParent[root];

    // Second pass: point every node on the path straight to the root
    while (mParent[element] != root)
    {
        const ObjectIndex next = mParent[element];
        mParent[element] = root;
        element = next;
    }

    return root;
}

bool UnionFind::unite(ObjectIndex first, ObjectIndex second)
{
    ObjectIndex rootFirst = find(first);
    ObjectIndex rootSecond = find(second);
    if (rootFirst == rootSecond)
        return false;

    if (mRank[rootFirst] < mRank[rootSecond])
        std::swap(rootFirst, rootSecond);

    mParent[rootSecond] = rootFirst;
    if (mRank[rootFirst] == mRank[rootSecond])
        ++mRank[rootFirst];

    return true;
}

bool UnionFind::connected(ObjectIndex first, ObjectIndex second)
{
    return find(first) == find(second);
}

void UnionFind::queueUnion(ObjectIndex first, ObjectIndex second)
{
    O2D_DEBUG_ASSERT(first < mParent.size() && second < mParent.size(), "Element out of range");

    mPending.push_back(CollisionPair::ordered(first, second));
    if (mPending.size() >= mBatchSize)
        flush();
}

void UnionFind::batchUnion(std::span<const CollisionPair> pairs)
{
    for (const auto pair : pairs)
        queueUnion(pair.a, pair.b);
}

void UnionFind::flush()
{
    // Swap out first: unite() -> find() flushes whatever is still pending
    std::vector<CollisionPair> pending;
    pending.swap(mPending);

    for (const auto pair : pending)
        unite(pair.a, pair.b);

    // Hand the storage back so the next batch does not allocate
    pending.clear();
    if (mPending.empty())
        mPending.swap(pending);
}

std::vector<Component> UnionFind::allComponents()
{
    flush();

    constexpr auto noComponent = std::numeric_limits<ObjectIndex>::max();
    std::vector<ObjectIndex> componentOfRoot(mParent.size(), noComponent);
    std::vector<Component> components;

    for (ObjectIndex element = 0; element < mParent.size(); ++element)
    {
        const auto root = find(element);
        if (componentOfRoot[root] == noComponent)
        {
            componentOfRoot[root] = static_cast<ObjectIndex>(components.size());
            components.emplace_back();
        }
        components[componentOfRoot[root]].push_back(element);
    }

    return components;
}

std::size_t UnionFind::componentCount()
{
    flush();

    std::size_t count = 0;
    for (ObjectIndex element = 0; element < mParent.size(); ++element)
        if (mParent[element] == element)
            ++count;
    return count;
}

} // namespace o2d
