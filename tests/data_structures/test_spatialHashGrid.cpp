#include <overlap2d/Errors.hpp>
#include <overlap2d/internal/data_structures/SpatialHashGrid.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/interfaces/catch_interfaces_config.hpp>
#include <catch2/internal/catch_context.hpp>

#include <algorithm>
#include <limits>
#include <vector>

#include "utils/Random.hpp"

using namespace o2d;
using namespace Catch;

namespace
{

bool containsIndex(const std::vector<ObjectIndex>& values, ObjectIndex index)
{
    return std::find(values.begin(), values.end(), index) != values.end();
}

} // namespace

TEST_CASE("SpatialHashGrid | Construction validates parameters", "[SpatialHashGrid][Config]")
{
    CHECK_NOTHROW(SpatialHashGrid{});
    CHECK_NOTHROW(SpatialHashGrid{0.5f, 1});

    CHECK_THROWS_AS(SpatialHashGrid{0.0f}, ConfigurationError);
    CHECK_THROWS_AS(SpatialHashGrid{-4.0f}, ConfigurationError);
    CHECK_THROWS_AS(SpatialHashGrid{std::numeric_limits<float>::quiet_NaN()}, ConfigurationError);
    CHECK_THROWS_AS(SpatialHashGrid{std::numeric_limits<float>::infinity()}, ConfigurationError);
    CHECK_THROWS_AS((SpatialHashGrid{10.0f, 0}), ConfigurationError);

    SpatialHashGrid grid;
    CHECK_THROWS_AS(grid.setCellSize(0.0f), ConfigurationError);
    CHECK_THROWS_AS(grid.setMaxCellsPerObject(0), ConfigurationError);
}

TEST_CASE("SpatialHashGrid | Cell range of a box", "[SpatialHashGrid]")
{
    const SpatialHashGrid grid{10.0f};

    auto range = grid.cellRangeFor(AABB{0, 0, 5, 5});
    CHECK(range.minX == 0);
    CHECK(range.minY == 0);
    CHECK(range.maxX == 0);
    CHECK(range.maxY == 0);
    CHECK(range.cellCount() == 1);

    // The max edge lands in the next cell
    range = grid.cellRangeFor(AABB{5, 5, 10, 10});
    CHECK(range.maxX == 1);
    CHECK(range.maxY == 1);
    CHECK(range.cellCount() == 4);

    // Negative coordinates round toward negative infinity
    range = grid.cellRangeFor(AABB{-0.5f, -15, 1, 1});
    CHECK(range.minX == -1);
    CHECK(range.minY == -2);
    CHECK(range.maxX == 0);
    CHECK(range.maxY == -2);
}

TEST_CASE("SpatialHashGrid | Query returns boxes sharing cells", "[SpatialHashGrid][Query]")
{
    SpatialHashGrid grid{10.0f};
    grid.insert(0, AABB{1, 1, 2, 2});
    grid.insert(1, AABB{4, 4, 2, 2});
    grid.insert(2, AABB{55, 55, 2, 2});

    CHECK(grid.size() == 3);
    CHECK(grid.cellCount() == 2);
    CHECK(grid.maxBucketSize() == 2);

    VisitedSet visited;
    std::vector<ObjectIndex> candidates;
    grid.query(AABB{0, 0, 5, 5}, candidates, visited);

    CHECK(candidates.size() == 2);
    CHECK(containsIndex(candidates, 0));
    CHECK(containsIndex(candidates, 1));
    CHECK_FALSE(containsIndex(candidates, 2));

    candidates.clear();
    grid.query(AABB{50, 50, 2, 2}, candidates, visited);
    REQUIRE(candidates.size() == 1);
    CHECK(candidates[0] == 2);

    candidates.clear();
    grid.query(AABB{200, 200, 2, 2}, candidates, visited);
    CHECK(candidates.empty());
}

TEST_CASE("SpatialHashGrid | Boxes spanning several cells are reported once", "[SpatialHashGrid][Query]")
{
    SpatialHashGrid grid{1.0f};
    grid.insert(7, AABB{0, 0, 5.5f, 5.5f});
    grid.insert(3, AABB{2, 2, 3, 3});

    SECTION("With visited set")
    {
        VisitedSet visited;
        std::vector<ObjectIndex> candidates;
        grid.query(AABB{0, 0, 10, 10}, candidates, visited);

        std::sort(candidates.begin(), candidates.end());
        CHECK(candidates == std::vector<ObjectIndex>{3, 7});
    }

    SECTION("Without visited set")
    {
        std::vector<ObjectIndex> candidates{42};
        grid.query(AABB{0, 0, 10, 10}, candidates);

        // Previous content is left untouched
        CHECK(candidates == std::vector<ObjectIndex>{42, 3, 7});
    }
}

TEST_CASE("SpatialHashGrid | Boxes touching a cell boundary share a cell", "[SpatialHashGrid][Boundary]")
{
    SpatialHashGrid grid{10.0f};
    // Touches the right edge of cell 0 and overlaps the left box in cell 1
    grid.insert(0, AABB{0, 0, 10, 10});
    grid.insert(1, AABB{9.5f, 0, 5, 5});

    VisitedSet visited;
    std::vector<ObjectIndex> candidates;
    grid.query(AABB{9.5f, 0, 5, 5}, candidates, visited);
    std::sort(candidates.begin(), candidates.end());

    CHECK(candidates == std::vector<ObjectIndex>{0, 1});
}

TEST_CASE("SpatialHashGrid | Oversized boxes are always candidates", "[SpatialHashGrid][Oversized]")
{
    SpatialHashGrid grid{1.0f, 16};
    grid.insert(0, AABB{0, 0, 1000, 1000});
    grid.insert(1, AABB{500, 500, 1, 1});

    CHECK(grid.oversizedCount() == 1);
    CHECK(grid.size() == 2);

    VisitedSet visited;
    std::vector<ObjectIndex> candidates;
    grid.query(AABB{500.2f, 500.2f, 0.5f, 0.5f}, candidates, visited);
    std::sort(candidates.begin(), candidates.end());
    CHECK(candidates == std::vector<ObjectIndex>{0, 1});

    // An oversized query sees every object
    candidates.clear();
    grid.query(AABB{-100, -100, 2000, 2000}, candidates, visited);
    std::sort(candidates.begin(), candidates.end());
    CHECK(candidates == std::vector<ObjectIndex>{0, 1});
}

TEST_CASE("SpatialHashGrid | Huge coordinates do not overflow", "[SpatialHashGrid][Oversized]")
{
    SpatialHashGrid grid{1.0f};
    grid.insert(0, AABB{-3.0e38f, -3.0e38f, 3.0e38f, 3.0e38f});
    grid.insert(1, AABB{0, 0, 1, 1});

    VisitedSet visited;
    std::vector<ObjectIndex> candidates;
    grid.query(AABB{0, 0, 1, 1}, candidates, visited);
    std::sort(candidates.begin(), candidates.end());
    CHECK(candidates == std::vector<ObjectIndex>{0, 1});
}

TEST_CASE("SpatialHashGrid | A box spanning the full cell range on both axes is oversized",
          "[SpatialHashGrid][Oversized]")
{
    SpatialHashGrid grid{1.0f};
    const AABB everywhere{-1.0e10f, -1.0e10f, 2.0e10f, 2.0e10f};

    const auto range = grid.cellRangeFor(everywhere);
    CHECK(range.minX == std::numeric_limits<int32_t>::min());
    CHECK(range.maxX == std::numeric_limits<int32_t>::max());
    CHECK(range.minY == std::numeric_limits<int32_t>::min());
    CHECK(range.maxY == std::numeric_limits<int32_t>::max());
    CHECK(range.cellCount() == std::numeric_limits<uint64_t>::max());

    grid.insert(0, everywhere);
    grid.insert(1, AABB{3, 3, 1, 1});
    CHECK(grid.oversizedCount() == 1);
    CHECK(grid.cellCount() == 1);

    VisitedSet visited;
    std::vector<ObjectIndex> candidates;
    grid.query(everywhere, candidates, visited);
    std::sort(candidates.begin(), candidates.end());
    CHECK(candidates == std::vector<ObjectIndex>{0, 1});

    candidates.clear();
    grid.query(everywhere, candidates);
    CHECK(candidates == std::vector<ObjectIndex>{0, 1});
}

TEST_CASE("SpatialHashGrid | Clear empties every cell and keeps the buckets", "[SpatialHashGrid][Clear]")
{
    SpatialHashGrid grid{5.0f};
    const auto boxes = generateRandomAABBs(200, 0.0f, 100.0f, 3.0f);
    for (uint32_t i = 0; i < boxes.size(); ++i)
        grid.insert(i, boxes[i]);

    REQUIRE(grid.cellCount() > 0);
    const auto buckets = grid.bucketCapacity();

    grid.clear();
    CHECK(grid.empty());
    CHECK(grid.cellCount() == 0);
    CHECK(grid.oversizedCount() == 0);
    CHECK(grid.maxBucketSize() == 0);
    CHECK(grid.bucketCapacity() == buckets);

    // No stale entries after reuse
    VisitedSet visited;
    std::vector<ObjectIndex> candidates;
    grid.query(AABB{0, 0, 100, 100}, candidates, visited);
    CHECK(candidates.empty());

    grid.insert(0, AABB{10, 10, 1, 1});
    grid.query(AABB{0, 0, 100, 100}, candidates, visited);
    CHECK(candidates == std::vector<ObjectIndex>{0});
    CHECK(grid.bucketCapacity() == buckets);
}

TEST_CASE("SpatialHashGrid | Cell size follows the median object size", "[SpatialHashGrid][CellSize]")
{
    CHECK(SpatialHashGrid::chooseCellSize({}) == Approx(SpatialHashGrid::defaultCellSize));

    std::vector<AABB> boxes{AABB{0, 0, 2, 1}, AABB{10, 10, 4, 4}, AABB{20, 20, 8, 1}};
    CHECK(SpatialHashGrid::chooseCellSize(boxes) == Approx(4.0f));

    // Tiny boxes spread over a large area are bounded by the extent
    std::vector<AABB> sparse{AABB{0, 0, 0.001f, 0.001f}, AABB{10240, 10240, 0.001f, 0.001f}};
    CHECK(SpatialHashGrid::chooseCellSize(sparse) >= Approx(10.0f));

    // Points at one position fall back to a unit cell
    std::vector<AABB> points{AABB{3, 3, 0, 0}, AABB{3, 3, 0, 0}};
    CHECK(SpatialHashGrid::chooseCellSize(points) == Approx(1.0f));
}

TEST_CASE("SpatialHashGrid | Candidates include every overlapping box", "[SpatialHashGrid][Query][Random]")
{
    const auto seed = Catch::getCurrentContext().getConfig()->rngSeed();
    const auto boxes = generateRandomSizedAABBs(500, -200.0f, 200.0f, 0.5f, 25.0f, seed);

    SpatialHashGrid grid{SpatialHashGrid::chooseCellSize(boxes)};
    for (uint32_t i = 0; i < boxes.size(); ++i)
        grid.insert(i, boxes[i]);

    VisitedSet visited(boxes.size());
    std::vector<ObjectIndex> candidates;
    for (uint32_t i = 0; i < boxes.size(); ++i)
    {
        candidates.clear();
        grid.query(boxes[i], candidates, visited);

        for (uint32_t j = 0; j < boxes.size(); ++j)
            if (boxes[i].overlaps(boxes[j]))
                REQUIRE(containsIndex(candidates, j));
    }
}
