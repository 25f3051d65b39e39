#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <cmath>

#include "settlegen/geom/Footprint.h"

using namespace settlegen::geom;

static constexpr float kHalfPi = 1.57079632679f;

TEST_SUITE("Footprint corners") {
    TEST_CASE("axis-aligned rectangle") {
        Quad q = getCorners(glm::vec2(10.0f, 20.0f), 4.0f, 2.0f, 0.0f);
        CHECK(q[0].x == doctest::Approx(8.0f));
        CHECK(q[0].y == doctest::Approx(19.0f));
        CHECK(q[1].x == doctest::Approx(12.0f));
        CHECK(q[1].y == doctest::Approx(19.0f));
        CHECK(q[2].x == doctest::Approx(12.0f));
        CHECK(q[2].y == doctest::Approx(21.0f));
        CHECK(q[3].x == doctest::Approx(8.0f));
        CHECK(q[3].y == doctest::Approx(21.0f));
    }

    TEST_CASE("quarter turn swaps the extents") {
        Quad q = getCorners(glm::vec2(0.0f), 4.0f, 2.0f, kHalfPi);
        Aabb box = getBounds(q);
        CHECK(box.min.x == doctest::Approx(-1.0f));
        CHECK(box.max.x == doctest::Approx(1.0f));
        CHECK(box.min.y == doctest::Approx(-2.0f));
        CHECK(box.max.y == doctest::Approx(2.0f));
    }

    TEST_CASE("inflated grows both extents and never collapses") {
        OrientedRect r{glm::vec2(0.0f), 4.0f, 2.0f, 0.0f};
        OrientedRect big = r.inflated(2.0f);
        CHECK(big.width == doctest::Approx(6.0f));
        CHECK(big.depth == doctest::Approx(4.0f));

        OrientedRect tiny = r.inflated(-10.0f);
        CHECK(tiny.width > 0.0f);
        CHECK(tiny.depth > 0.0f);
    }

    TEST_CASE("Aabb containment") {
        Aabb outer{{-10.0f, -10.0f}, {10.0f, 10.0f}};
        CHECK(outer.contains(Aabb{{-5.0f, -5.0f}, {5.0f, 5.0f}}));
        CHECK(outer.contains(outer));
        CHECK_FALSE(outer.contains(Aabb{{-5.0f, -5.0f}, {11.0f, 5.0f}}));
    }
}

TEST_SUITE("Separating axis test") {
    TEST_CASE("overlapping squares intersect") {
        Quad a = getCorners(glm::vec2(0.0f), 4.0f, 4.0f, 0.0f);
        Quad b = getCorners(glm::vec2(3.0f, 0.0f), 4.0f, 4.0f, 0.0f);
        CHECK(polygonsIntersect(a, b));
    }

    TEST_CASE("separated squares do not intersect") {
        Quad a = getCorners(glm::vec2(0.0f), 4.0f, 4.0f, 0.0f);
        Quad b = getCorners(glm::vec2(5.0f, 0.0f), 4.0f, 4.0f, 0.0f);
        CHECK_FALSE(polygonsIntersect(a, b));
    }

    TEST_CASE("touching edges count as separated") {
        Quad a = getCorners(glm::vec2(0.0f), 4.0f, 4.0f, 0.0f);
        Quad b = getCorners(glm::vec2(4.0f, 0.0f), 4.0f, 4.0f, 0.0f);
        CHECK_FALSE(polygonsIntersect(a, b));
    }

    TEST_CASE("rotated square clears an AABB that a naive box test would flag") {
        // Diamond whose bounding box overlaps the square's corner region
        Quad a = getCorners(glm::vec2(0.0f), 4.0f, 4.0f, 0.0f);
        Quad b = getCorners(glm::vec2(4.6f, 4.6f), 4.0f, 4.0f, kHalfPi * 0.5f);
        Aabb ba = getBounds(a);
        Aabb bb = getBounds(b);
        bool boxesOverlap = ba.max.x > bb.min.x && ba.max.y > bb.min.y;
        CHECK(boxesOverlap);
        CHECK_FALSE(polygonsIntersect(a, b));
    }

    TEST_CASE("contained polygon intersects") {
        Quad a = getCorners(glm::vec2(0.0f), 10.0f, 10.0f, 0.3f);
        Quad b = getCorners(glm::vec2(0.5f, 0.5f), 2.0f, 2.0f, 1.1f);
        CHECK(polygonsIntersect(a, b));
        CHECK(polygonsIntersect(b, a));
    }

    TEST_CASE("footprintsOverlap respects padding") {
        OrientedRect a{glm::vec2(0.0f), 4.0f, 4.0f, 0.0f};
        OrientedRect b{glm::vec2(5.0f, 0.0f), 4.0f, 4.0f, 0.0f};
        // 1 m gap between the walls
        CHECK_FALSE(footprintsOverlap(a, b, 0.0f));
        CHECK_FALSE(footprintsOverlap(a, b, 0.9f));
        CHECK(footprintsOverlap(a, b, 1.5f));
    }

    TEST_CASE("negative padding tolerates a sliver of overlap") {
        OrientedRect a{glm::vec2(0.0f), 4.0f, 4.0f, 0.0f};
        OrientedRect b{glm::vec2(3.8f, 0.0f), 4.0f, 4.0f, 0.0f};
        CHECK(footprintsOverlap(a, b, 0.0f));
        CHECK_FALSE(footprintsOverlap(a, b, -0.5f));
    }

    TEST_CASE("far apart footprints are rejected early") {
        OrientedRect a{glm::vec2(0.0f), 4.0f, 4.0f, 0.0f};
        OrientedRect b{glm::vec2(100.0f, -50.0f), 4.0f, 4.0f, 0.7f};
        CHECK_FALSE(footprintsOverlap(a, b, 3.0f));
    }
}

TEST_SUITE("Segment geometry") {
    TEST_CASE("distance to segment interior and endpoints") {
        glm::vec2 a(0.0f, 0.0f);
        glm::vec2 b(10.0f, 0.0f);
        CHECK(distanceToSegment(glm::vec2(5.0f, 3.0f), a, b) == doctest::Approx(3.0f));
        CHECK(distanceToSegment(glm::vec2(-3.0f, 4.0f), a, b) == doctest::Approx(5.0f));
        CHECK(distanceToSegment(glm::vec2(13.0f, 0.0f), a, b) == doctest::Approx(3.0f));
    }

    TEST_CASE("zero-length segment acts as a point") {
        glm::vec2 p(3.0f, 4.0f);
        glm::vec2 a(0.0f);
        float d = distanceToSegment(p, a, a);
        CHECK(d == doctest::Approx(5.0f));
        CHECK_FALSE(std::isnan(d));
        glm::vec2 c = closestPointOnSegment(p, a, a);
        CHECK(c.x == doctest::Approx(0.0f));
        CHECK(c.y == doctest::Approx(0.0f));
    }

    TEST_CASE("crossing segments intersect") {
        CHECK(segmentsIntersect({0.0f, 0.0f}, {10.0f, 10.0f}, {0.0f, 10.0f}, {10.0f, 0.0f}));
        CHECK(segmentDistance({0.0f, 0.0f}, {10.0f, 10.0f}, {0.0f, 10.0f}, {10.0f, 0.0f}) == doctest::Approx(0.0f));
    }

    TEST_CASE("parallel segments") {
        CHECK_FALSE(segmentsIntersect({0.0f, 0.0f}, {10.0f, 0.0f}, {0.0f, 2.0f}, {10.0f, 2.0f}));
        CHECK(segmentDistance({0.0f, 0.0f}, {10.0f, 0.0f}, {0.0f, 2.0f}, {10.0f, 2.0f}) == doctest::Approx(2.0f));
        // Collinear overlap
        CHECK(segmentsIntersect({0.0f, 0.0f}, {10.0f, 0.0f}, {5.0f, 0.0f}, {15.0f, 0.0f}));
        CHECK_FALSE(segmentsIntersect({0.0f, 0.0f}, {10.0f, 0.0f}, {11.0f, 0.0f}, {15.0f, 0.0f}));
    }

    TEST_CASE("degenerate segments never intersect") {
        CHECK_FALSE(segmentsIntersect({1.0f, 1.0f}, {1.0f, 1.0f}, {0.0f, 0.0f}, {2.0f, 2.0f}));
    }

    TEST_CASE("pointInQuad") {
        Quad q = getCorners(glm::vec2(0.0f), 4.0f, 2.0f, 0.5f);
        CHECK(pointInQuad(glm::vec2(0.0f), q));
        CHECK_FALSE(pointInQuad(glm::vec2(5.0f, 5.0f), q));
    }

    TEST_CASE("quad to segment distance") {
        Quad q = getCorners(glm::vec2(0.0f), 4.0f, 4.0f, 0.0f);
        CHECK(quadSegmentDistance(q, {-10.0f, 5.0f}, {10.0f, 5.0f}) == doctest::Approx(3.0f));
        CHECK(quadSegmentDistance(q, {-10.0f, 0.0f}, {10.0f, 0.0f}) == doctest::Approx(0.0f));
        // Segment fully inside
        CHECK(quadSegmentDistance(q, {-1.0f, 0.0f}, {1.0f, 0.0f}) == doctest::Approx(0.0f));
    }
}
