#include <overlap2d/Errors.hpp>
#include <overlap2d/internal/data_structures/UnionFind.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/interfaces/catch_interfaces_config.hpp>
#include <catch2/internal/catch_context.hpp>

#include <algorithm>
#include <vector>

#include "utils/Random.hpp"

using namespace o2d;
using namespace Catch;

TEST_CASE("UnionFind | Singletons after construction", "[UnionFind]")
{
    UnionFind uf(5);

    CHECK(uf.size() == 5);
    CHECK(uf.componentCount() == 5);
    for (ObjectIndex i = 0; i < 5; ++i)
        CHECK(uf.find(i) == i);

    const auto components = uf.allComponents();
    REQUIRE(components.size() == 5);
    for (ObjectIndex i = 0; i < 5; ++i)
        CHECK(components[i] == Component{i});
}

TEST_CASE("UnionFind | Unite merges sets", "[UnionFind][Unite]")
{
    UnionFind uf(6);

    CHECK(uf.unite(0, 1));
    CHECK(uf.unite(2, 3));
    CHECK(uf.unite(1, 3));

    CHECK(uf.connected(0, 3));
    CHECK(uf.connected(2, 1));
    CHECK_FALSE(uf.connected(0, 4));
    CHECK_FALSE(uf.connected(4, 5));
    CHECK(uf.componentCount() == 3);

    const auto components = uf.allComponents();
    REQUIRE(components.size() == 3);
    CHECK(components[0] == Component{0, 1, 2, 3});
    CHECK(components[1] == Component{4});
    CHECK(components[2] == Component{5});
}

TEST_CASE("UnionFind | Unite is idempotent", "[UnionFind][Unite]")
{
    UnionFind uf(4);

    CHECK(uf.unite(1, 2));
    const auto before = uf.allComponents();

    CHECK_FALSE(uf.unite(1, 2));
    CHECK_FALSE(uf.unite(2, 1));
    CHECK_FALSE(uf.unite(3, 3));

    CHECK(uf.allComponents() == before);
    CHECK(uf.componentCount() == 3);
}

TEST_CASE("UnionFind | Components are ordered by their smallest member", "[UnionFind][Components]")
{
    UnionFind uf(7);
    uf.unite(6, 2);
    uf.unite(5, 0);
    uf.unite(4, 6);

    const auto components = uf.allComponents();
    REQUIRE(components.size() == 4);
    CHECK(components[0] == Component{0, 5});
    CHECK(components[1] == Component{1});
    CHECK(components[2] == Component{2, 4, 6});
    CHECK(components[3] == Component{3});
}

TEST_CASE("UnionFind | Queued unions apply on flush or find", "[UnionFind][Batch]")
{
    UnionFind uf(10, 4);
    CHECK(uf.getBatchSize() == 4);

    uf.queueUnion(0, 1);
    uf.queueUnion(2, 3);
    CHECK(uf.pendingUnions() == 2);

    // A query sees the pending unions
    CHECK(uf.connected(0, 1));
    CHECK(uf.pendingUnions() == 0);

    uf.queueUnion(4, 5);
    uf.queueUnion(5, 6);
    uf.queueUnion(6, 7);
    CHECK(uf.pendingUnions() == 3);

    // Reaching the batch size applies the batch
    uf.queueUnion(7, 8);
    CHECK(uf.pendingUnions() == 0);
    CHECK(uf.connected(4, 8));

    uf.queueUnion(8, 9);
    uf.flush();
    CHECK(uf.pendingUnions() == 0);
    CHECK(uf.connected(4, 9));
    CHECK(uf.componentCount() == 3);
}

TEST_CASE("UnionFind | Batched and immediate unions agree", "[UnionFind][Batch][Random]")
{
    constexpr uint32_t count = 2'000;
    const auto seed = Catch::getCurrentContext().getConfig()->rngSeed();
    DeterministicRNG rng(seed);

    std::vector<CollisionPair> pairs;
    for (uint32_t i = 0; i < count; ++i)
    {
        const auto a = static_cast<ObjectIndex>(rng.nextFloat(0.0f, static_cast<float>(count)));
        const auto b = static_cast<ObjectIndex>(rng.nextFloat(0.0f, static_cast<float>(count)));
        pairs.push_back(CollisionPair::ordered(a, b));
    }

    UnionFind immediate(count);
    for (const auto pair : pairs)
        immediate.unite(pair.a, pair.b);

    UnionFind batched(count, 64);
    batched.batchUnion(pairs);

    UnionFind singleBatch(count, pairs.size() + 1);
    singleBatch.batchUnion(pairs);
    CHECK(singleBatch.pendingUnions() == pairs.size());

    const auto expected = immediate.allComponents();
    CHECK(batched.allComponents() == expected);
    CHECK(singleBatch.allComponents() == expected);
}

TEST_CASE("UnionFind | Components partition every element", "[UnionFind][Components][Random]")
{
    constexpr uint32_t count = 1'000;
    DeterministicRNG rng(7);

    UnionFind uf(count);
    for (uint32_t i = 0; i < count / 2; ++i)
        uf.queueUnion(static_cast<ObjectIndex>(rng.nextFloat(0.0f, count)),
                      static_cast<ObjectIndex>(rng.nextFloat(0.0f, count)));

    const auto components = uf.allComponents();
    CHECK(components.size() == uf.componentCount());

    std::vector<int> seen(count, 0);
    ObjectIndex previousFirst = 0;
    for (size_t c = 0; c < components.size(); ++c)
    {
        const auto& component = components[c];
        REQUIRE_FALSE(component.empty());
        REQUIRE(std::is_sorted(component.begin(), component.end()));
        if (c > 0)
            REQUIRE(component.front() > previousFirst);
        previousFirst = component.front();

        const auto root = uf.find(component.front());
        for (const auto element : component)
        {
            ++seen[element];
            REQUIRE(uf.find(element) == root);
        }
    }

    for (const auto hits : seen)
        REQUIRE(hits == 1);
}

TEST_CASE("UnionFind | Reset restores singletons", "[UnionFind]")
{
    UnionFind uf(4);
    uf.unite(0, 1);
    uf.unite(2, 3);
    uf.queueUnion(1, 2);

    uf.reset(3);
    CHECK(uf.size() == 3);
    CHECK(uf.pendingUnions() == 0);
    CHECK(uf.componentCount() == 3);
    CHECK_FALSE(uf.connected(0, 1));

    uf.reset(8);
    CHECK(uf.size() == 8);
    CHECK(uf.componentCount() == 8);
}

TEST_CASE("UnionFind | Batch size must be positive", "[UnionFind][Config]")
{
    CHECK_THROWS_AS(UnionFind(4, 0), ConfigurationError);

    UnionFind uf(4, 8);
    CHECK_THROWS_AS(uf.setBatchSize(0), ConfigurationError);

    uf.queueUnion(0, 1);
    uf.queueUnion(2, 3);
    uf.setBatchSize(2);
    CHECK(uf.pendingUnions() == 0);
    CHECK(uf.getBatchSize() == 2);
}
