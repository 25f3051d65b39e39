#include "settlegen/geom/Footprint.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace settlegen {
namespace geom {

namespace {

constexpr float kEpsilon = 1e-6f;
constexpr float kMinExtent = 0.1f;

float cross(const glm::vec2& a, const glm::vec2& b) {
    return a.x * b.y - a.y * b.x;
}

void project(const Quad& quad, const glm::vec2& axis, float& outMin, float& outMax) {
    outMin = std::numeric_limits<float>::max();
    outMax = std::numeric_limits<float>::lowest();
    for (const auto& p : quad) {
        float d = glm::dot(p, axis);
        outMin = std::min(outMin, d);
        outMax = std::max(outMax, d);
    }
}

// True if some edge normal of `poly` separates the two quads
bool hasSeparatingAxis(const Quad& poly, const Quad& a, const Quad& b) {
    for (size_t i = 0; i < poly.size(); ++i) {
        glm::vec2 edge = poly[(i + 1) % poly.size()] - poly[i];
        glm::vec2 normal(-edge.y, edge.x);
        float len = glm::length(normal);
        if (len < kEpsilon) continue;
        normal /= len;

        float minA, maxA, minB, maxB;
        project(a, normal, minA, maxA);
        project(b, normal, minB, maxB);
        if (maxA <= minB || maxB <= minA) {
            return true;
        }
    }
    return false;
}

} // namespace

OrientedRect OrientedRect::inflated(float pad) const {
    OrientedRect r = *this;
    r.width = std::max(kMinExtent, width + pad);
    r.depth = std::max(kMinExtent, depth + pad);
    return r;
}

Quad getCorners(const glm::vec2& center, float width, float depth, float rotation) {
    float c = std::cos(rotation);
    float s = std::sin(rotation);
    float hw = width * 0.5f;
    float hd = depth * 0.5f;

    const glm::vec2 local[4] = {{-hw, -hd}, {hw, -hd}, {hw, hd}, {-hw, hd}};
    Quad corners;
    for (size_t i = 0; i < 4; ++i) {
        corners[i] = center + glm::vec2(local[i].x * c - local[i].y * s,
                                        local[i].x * s + local[i].y * c);
    }
    return corners;
}

Quad getCorners(const OrientedRect& rect) {
    return getCorners(rect.center, rect.width, rect.depth, rect.rotation);
}

Aabb getBounds(const Quad& quad) {
    Aabb box{quad[0], quad[0]};
    for (const auto& p : quad) {
        box.min = glm::min(box.min, p);
        box.max = glm::max(box.max, p);
    }
    return box;
}

bool polygonsIntersect(const Quad& a, const Quad& b) {
    if (hasSeparatingAxis(a, a, b)) return false;
    if (hasSeparatingAxis(b, a, b)) return false;
    return true;
}

bool footprintsOverlap(const OrientedRect& a, const OrientedRect& b, float padding) {
    // Padding is shared between the pair, half on each side
    OrientedRect pa = a.inflated(padding);
    OrientedRect pb = b.inflated(padding);

    // Bounding circles cannot touch: the common case across a settlement
    float ra = 0.5f * std::sqrt(pa.width * pa.width + pa.depth * pa.depth);
    float rb = 0.5f * std::sqrt(pb.width * pb.width + pb.depth * pb.depth);
    glm::vec2 d = pa.center - pb.center;
    if (std::abs(d.x) >= ra + rb || std::abs(d.y) >= ra + rb) {
        return false;
    }
    if (glm::dot(d, d) >= (ra + rb) * (ra + rb)) {
        return false;
    }

    return polygonsIntersect(getCorners(pa), getCorners(pb));
}

glm::vec2 closestPointOnSegment(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b) {
    glm::vec2 ab = b - a;
    float lengthSq = glm::dot(ab, ab);
    if (lengthSq < kEpsilon) {
        return a;
    }
    float t = glm::clamp(glm::dot(p - a, ab) / lengthSq, 0.0f, 1.0f);
    return a + t * ab;
}

float distanceToSegment(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b) {
    return glm::length(p - closestPointOnSegment(p, a, b));
}

bool segmentsIntersect(const glm::vec2& a0, const glm::vec2& a1, const glm::vec2& b0, const glm::vec2& b1) {
    glm::vec2 r = a1 - a0;
    glm::vec2 s = b1 - b0;
    if (glm::dot(r, r) < kEpsilon || glm::dot(s, s) < kEpsilon) {
        return false;
    }

    float denom = cross(r, s);
    glm::vec2 qp = b0 - a0;
    if (std::abs(denom) < kEpsilon) {
        // Parallel: only collinear overlap counts
        if (std::abs(cross(qp, r)) > kEpsilon) return false;
        float rr = glm::dot(r, r);
        float t0 = glm::dot(qp, r) / rr;
        float t1 = t0 + glm::dot(s, r) / rr;
        if (t0 > t1) std::swap(t0, t1);
        return t1 >= 0.0f && t0 <= 1.0f;
    }

    float t = cross(qp, s) / denom;
    float u = cross(qp, r) / denom;
    return t >= 0.0f && t <= 1.0f && u >= 0.0f && u <= 1.0f;
}

float segmentDistance(const glm::vec2& a0, const glm::vec2& a1, const glm::vec2& b0, const glm::vec2& b1) {
    if (segmentsIntersect(a0, a1, b0, b1)) {
        return 0.0f;
    }
    return std::min({
        distanceToSegment(a0, b0, b1),
        distanceToSegment(a1, b0, b1),
        distanceToSegment(b0, a0, a1),
        distanceToSegment(b1, a0, a1),
    });
}

bool pointInQuad(const glm::vec2& p, const Quad& quad) {
    // Convex: p must sit on the same side of every edge
    bool hasPos = false;
    bool hasNeg = false;
    for (size_t i = 0; i < quad.size(); ++i) {
        float c = cross(quad[(i + 1) % quad.size()] - quad[i], p - quad[i]);
        if (c > 0.0f) hasPos = true;
        if (c < 0.0f) hasNeg = true;
    }
    return !(hasPos && hasNeg);
}

float quadSegmentDistance(const Quad& quad, const glm::vec2& a, const glm::vec2& b) {
    if (pointInQuad(a, quad) || pointInQuad(b, quad)) {
        return 0.0f;
    }
    float best = std::numeric_limits<float>::max();
    for (size_t i = 0; i < quad.size(); ++i) {
        best = std::min(best, segmentDistance(quad[i], quad[(i + 1) % quad.size()], a, b));
    }
    return best;
}

} // namespace geom
} // namespace settlegen
