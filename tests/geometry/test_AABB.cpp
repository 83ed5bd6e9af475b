#include <overlap2d/internal/geometry/AABB.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace o2d;
using namespace Catch;

TEST_CASE("AABB | Overlapping boxes", "[AABB][Overlap]")
{
    const AABB a{0, 0, 10, 10};
    const AABB b{5, 5, 10, 10};

    CHECK(a.overlaps(b));
    CHECK(b.overlaps(a));
    CHECK(overlaps(a, b));

    // Containment counts as overlap
    const AABB inner{2, 2, 1, 1};
    CHECK(a.overlaps(inner));
    CHECK(inner.overlaps(a));
}

TEST_CASE("AABB | Touching edges do not overlap", "[AABB][Overlap][Boundary]")
{
    const AABB a{0, 0, 10, 10};

    SECTION("Shared vertical edge")
    {
        const AABB b{10, 0, 10, 10};
        CHECK_FALSE(a.overlaps(b));
        CHECK_FALSE(b.overlaps(a));
    }

    SECTION("Shared horizontal edge")
    {
        const AABB b{0, 10, 10, 10};
        CHECK_FALSE(a.overlaps(b));
        CHECK_FALSE(b.overlaps(a));
    }

    SECTION("Shared corner")
    {
        const AABB b{10, 10, 5, 5};
        CHECK_FALSE(a.overlaps(b));
        CHECK_FALSE(b.overlaps(a));
    }

    SECTION("Just past the edge")
    {
        const AABB b{9.999f, 0, 10, 10};
        CHECK(a.overlaps(b));
    }
}

TEST_CASE("AABB | Separated boxes", "[AABB][Overlap]")
{
    const AABB a{0, 0, 1, 1};
    CHECK_FALSE(a.overlaps(AABB{2, 0, 1, 1}));
    CHECK_FALSE(a.overlaps(AABB{0, 2, 1, 1}));
    CHECK_FALSE(a.overlaps(AABB{-3, -3, 1, 1}));
    // Overlapping on one axis only
    CHECK_FALSE(a.overlaps(AABB{0.5f, 5, 1, 1}));
}

TEST_CASE("AABB | Degenerate boxes", "[AABB][Overlap][Degenerate]")
{
    const AABB box{0, 0, 10, 10};

    // A zero sized box strictly inside another still overlaps it
    const AABB point{5, 5, 0, 0};
    CHECK(box.overlaps(point));
    CHECK(point.overlaps(box));

    // On the boundary it does not
    const AABB pointOnEdge{10, 5, 0, 0};
    CHECK_FALSE(box.overlaps(pointOnEdge));

    // Two zero sized boxes never overlap, even at the same position
    CHECK_FALSE(point.overlaps(point));

    // A zero width box inside the interior on x
    const AABB line{5, -5, 0, 20};
    CHECK(box.overlaps(line));
}

TEST_CASE("AABB | Validity", "[AABB][Validity]")
{
    constexpr auto nan = std::numeric_limits<float>::quiet_NaN();
    constexpr auto inf = std::numeric_limits<float>::infinity();

    CHECK(AABB{0, 0, 1, 1}.isValid());
    CHECK(AABB{-5, -5, 0, 0}.isValid());

    CHECK_FALSE(AABB{nan, 0, 1, 1}.isValid());
    CHECK_FALSE(AABB{0, inf, 1, 1}.isValid());
    CHECK_FALSE(AABB{0, 0, nan, 1}.isValid());
    CHECK_FALSE(AABB{0, 0, 1, inf}.isValid());
    CHECK_FALSE(AABB{0, 0, -1, 1}.isValid());
    CHECK_FALSE(AABB{0, 0, 1, -0.5f}.isValid());
}

TEST_CASE("AABB | Combine", "[AABB][Combine]")
{
    // Overlapping
    auto combined = AABB::combine(AABB{0, 0, 1, 1}, AABB{0.5f, 0.5f, 1, 1});
    CHECK(combined.min() == Vec2{0, 0});
    CHECK(combined.max() == Vec2{1.5f, 1.5f});

    // Sharing an edge
    combined = AABB::combine(AABB{-1, -1, 1, 1}, AABB{0, 0, 1, 1});
    CHECK(combined.min() == Vec2{-1, -1});
    CHECK(combined.max() == Vec2{1, 1});

    // Far apart
    combined = AABB::combine(AABB{2, 2, 1, 1}, AABB{6, 6, 1, 1});
    CHECK(combined == AABB{2, 2, 5, 5});
}

TEST_CASE("AABB | Measures", "[AABB]")
{
    const AABB box = AABB::fromMinMax(Vec2{-1, -1}, Vec2{1, 2});
    CHECK(box.width == Approx(2.0f));
    CHECK(box.height == Approx(3.0f));
    CHECK(box.area() == Approx(6.0f));
    CHECK(box.perimeter() == Approx(10.0f));
    CHECK(box.center() == Vec2{0.0f, 0.5f});
    CHECK(box.size() == Vec2{2, 3});
}

TEST_CASE("AABB | Contains", "[AABB][Contains]")
{
    const AABB outer{0, 0, 5, 5};
    const AABB inner{1, 1, 2, 2};

    CHECK(outer.contains(inner));
    CHECK_FALSE(inner.contains(outer));
    CHECK(outer.contains(outer));

    CHECK(outer.contains(Vec2{0, 0}));
    CHECK(outer.contains(Vec2{2.5f, 5}));
    CHECK_FALSE(outer.contains(Vec2{5.1f, 1}));
}

TEST_CASE("AABB | Formatting", "[AABB]")
{
    CHECK(AABB{1, 2, 3, 4}.toString() == "AABB(x=1, y=2, width=3, height=4)");
    CHECK(std::format("{}", AABB{0, 0, 0.5f, 1}) == "AABB(x=0, y=0, width=0.5, height=1)");
}
