#pragma once

#include <glm/glm.hpp>
#include <array>

namespace settlegen {
namespace geom {

using Quad = std::array<glm::vec2, 4>;

// Rotated rectangle: width along the local x axis, depth along local y
struct OrientedRect {
    glm::vec2 center{0.0f};
    float width = 0.0f;
    float depth = 0.0f;
    float rotation = 0.0f;

    // Grows every side by pad/2 (negative shrinks, never below a sliver)
    OrientedRect inflated(float pad) const;
};

struct Aabb {
    glm::vec2 min{0.0f};
    glm::vec2 max{0.0f};

    bool contains(const Aabb& other) const {
        return other.min.x >= min.x && other.min.y >= min.y &&
               other.max.x <= max.x && other.max.y <= max.y;
    }
};

/**
 * Corners of a rotated rectangle, counter-clockwise from (-w/2, -d/2).
 * Rotation is the standard 2D transform x' = x cos - y sin, y' = x sin + y cos.
 */
Quad getCorners(const glm::vec2& center, float width, float depth, float rotation);
Quad getCorners(const OrientedRect& rect);

Aabb getBounds(const Quad& quad);

/**
 * Separating axis test for two convex quads. Edge normals of both
 * polygons are tried; a gap on any one of them means no intersection.
 * Touching edges count as separated.
 */
bool polygonsIntersect(const Quad& a, const Quad& b);

/**
 * Precise footprint overlap with padding: a cheap bounding-circle reject,
 * then SAT on the inflated rectangles.
 */
bool footprintsOverlap(const OrientedRect& a, const OrientedRect& b, float padding);

// Distance from p to segment [a, b]; a zero-length segment acts as a point
float distanceToSegment(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b);

glm::vec2 closestPointOnSegment(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b);

// Proper or touching intersection; degenerate segments never intersect
bool segmentsIntersect(const glm::vec2& a0, const glm::vec2& a1, const glm::vec2& b0, const glm::vec2& b1);

float segmentDistance(const glm::vec2& a0, const glm::vec2& a1, const glm::vec2& b0, const glm::vec2& b1);

bool pointInQuad(const glm::vec2& p, const Quad& quad);

// Zero when the segment touches or crosses the quad
float quadSegmentDistance(const Quad& quad, const glm::vec2& a, const glm::vec2& b);

} // namespace geom
} // namespace settlegen
