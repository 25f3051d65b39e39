#include "settlegen/layout/StreetTopology.h"
#include <algorithm>
#include <cmath>

namespace settlegen {
namespace layout {

namespace {

constexpr float kTwoPi = 6.28318530718f;
constexpr float kMinSegmentLength = 1e-3f;

glm::vec2 direction(float angle) {
    return glm::vec2(std::cos(angle), std::sin(angle));
}

} // namespace

LayoutType pickLayoutType(const LayoutWeights& weights, utils::SeededRandom& rng) {
    float total = weights.organic + weights.grid + weights.mixed;
    if (!(total > 0.0f)) {
        return LayoutType::Mixed;
    }

    float roll = rng.nextFloat() * total;
    if (roll < weights.organic) return LayoutType::Organic;
    if (roll < weights.organic + weights.grid) return LayoutType::Grid;
    return LayoutType::Mixed;
}

StreetTopologyBuilder::StreetTopologyBuilder(const BuildingCatalog& catalog,
                                             const GeneratorConfig& config,
                                             utils::SeededRandom& rng,
                                             const terrain::TerrainGrid* terrain)
    : catalog_(catalog), config_(config), rng_(rng), terrain_(terrain) {}

int StreetTopologyBuilder::build(Settlement& settlement) {
    clipped_ = 0;

    // Hamlets only get entry points, whatever layout was chosen
    if (settlement.size == SettlementSize::Hamlet) {
        return 0;
    }

    switch (settlement.layoutType) {
        case LayoutType::Organic:
            buildOrganic(settlement, settlement.radius);
            break;
        case LayoutType::Grid:
            buildGrid(settlement);
            break;
        case LayoutType::Mixed:
        default:
            buildMixed(settlement);
            break;
    }
    return clipped_;
}

bool StreetTopologyBuilder::isBlocked(const glm::vec2& p) const {
    return terrain_ && terrain_->isBlocked(p, config_.steepHillElevation);
}

void StreetTopologyBuilder::addStreet(Settlement& settlement, const std::string& id,
                                      std::vector<glm::vec2> points, RoadClass roadClass,
                                      float widthScale) {
    // Drop zero-length steps so every segment has a direction
    std::vector<glm::vec2> cleaned;
    cleaned.reserve(points.size());
    for (const auto& p : points) {
        if (cleaned.empty() || glm::length(p - cleaned.back()) > kMinSegmentLength) {
            cleaned.push_back(p);
        }
    }
    if (cleaned.size() < 2) return;

    Street street;
    street.id = id;
    street.points = std::move(cleaned);
    street.roadClass = roadClass;
    street.width = catalog_.roadWidth(roadClass) * widthScale;
    settlement.streets.push_back(std::move(street));
}

void StreetTopologyBuilder::addSegmentRuns(Settlement& settlement, const std::string& idBase,
                                           const std::vector<glm::vec2>& points,
                                           const std::vector<bool>& segmentOk,
                                           RoadClass roadClass) {
    std::vector<glm::vec2> run;
    int runIndex = 0;

    auto flush = [&]() {
        if (run.size() >= 2) {
            std::string id = runIndex == 0 ? idBase : idBase + "_" + std::to_string(runIndex);
            addStreet(settlement, id, run, roadClass);
            ++runIndex;
        }
        run.clear();
    };

    for (size_t j = 0; j < segmentOk.size() && j + 1 < points.size(); ++j) {
        if (segmentOk[j]) {
            if (run.empty()) run.push_back(points[j]);
            run.push_back(points[j + 1]);
        } else {
            flush();
        }
    }
    flush();
}

void StreetTopologyBuilder::addPointRuns(Settlement& settlement, const std::string& idBase,
                                         const std::vector<glm::vec2>& points,
                                         const std::vector<bool>& pointOk,
                                         RoadClass roadClass) {
    std::vector<glm::vec2> run;
    int runIndex = 0;

    auto flush = [&]() {
        if (run.size() >= 2) {
            std::string id = runIndex == 0 ? idBase : idBase + "_" + std::to_string(runIndex);
            addStreet(settlement, id, run, roadClass);
            ++runIndex;
        }
        run.clear();
    };

    for (size_t j = 0; j < points.size() && j < pointOk.size(); ++j) {
        if (pointOk[j]) {
            run.push_back(points[j]);
        } else {
            flush();
        }
    }
    flush();
}

float StreetTopologyBuilder::chordHalfLength(float radius, float offset, float limit) const {
    float r = radius * 0.95f;
    if (std::abs(offset) >= r) return 0.0f;
    return std::min(limit, std::sqrt(r * r - offset * offset));
}

void StreetTopologyBuilder::buildOrganic(Settlement& settlement, float reachRadius) {
    const glm::vec2 center = settlement.position;
    const float reach = reachRadius * 0.9f;

    int radialCount = rng_.rangeInt(config_.minRadials, config_.maxRadials);
    int steps = rng_.rangeInt(6, 9);
    float stepLength = reach / static_cast<float>(steps);

    std::vector<std::vector<glm::vec2>> radials;
    radials.reserve(radialCount);

    for (int i = 0; i < radialCount; ++i) {
        float baseAngle = static_cast<float>(i) / radialCount * kTwoPi + (rng_.nextFloat() - 0.5f) * 0.4f;
        float angle = baseAngle;

        std::vector<glm::vec2> points{center};
        glm::vec2 p = center;
        for (int s = 1; s <= steps; ++s) {
            // Random walk in angle, pulled back toward the base heading
            angle += (rng_.nextFloat() - 0.5f) * config_.radialTurn + (baseAngle - angle) * config_.radialPull;
            glm::vec2 next = p + direction(angle) * stepLength;
            if (isBlocked(next)) {
                ++clipped_;
                break;
            }
            points.push_back(next);
            p = next;
        }

        addStreet(settlement, settlement.id + "_radial_" + std::to_string(i), points, RoadClass::Town);
        radials.push_back(std::move(points));
    }

    buildWebStreets(settlement, radials, reachRadius, stepLength);
}

void StreetTopologyBuilder::buildWebStreets(Settlement& settlement,
                                            const std::vector<std::vector<glm::vec2>>& radials,
                                            float reachRadius, float stepLength) {
    const size_t count = radials.size();
    if (count < 2 || stepLength <= 0.0f) return;

    const glm::vec2 center = settlement.position;
    const float reach = reachRadius * 0.9f;
    int bands = std::max(1, static_cast<int>(reach / config_.webBandSpacing));
    int webIndex = 0;

    for (int band = 1; band <= bands; ++band) {
        float dist = static_cast<float>(band) * reach / static_cast<float>(bands + 1);
        int baseIndex = std::max(1, static_cast<int>(std::round(dist / stepLength)));

        for (size_t i = 0; i < count; ++i) {
            if (rng_.chance(config_.webSkipChance)) continue;

            const auto& a = radials[i];
            const auto& b = radials[(i + 1) % count];
            size_t ia = static_cast<size_t>(std::max(1, baseIndex + rng_.rangeInt(-1, 1)));
            size_t ib = static_cast<size_t>(std::max(1, baseIndex + rng_.rangeInt(-1, 1)));
            if (ia >= a.size() || ib >= b.size()) continue;  // Radial was cut short

            glm::vec2 pa = a[ia];
            glm::vec2 pb = b[ib];
            glm::vec2 chord = pb - pa;
            float chordLength = glm::length(chord);
            if (chordLength < kMinSegmentLength) continue;

            // Bow the midpoint outward so the web is not a perfect circle
            glm::vec2 mid = (pa + pb) * 0.5f;
            glm::vec2 outward = mid - center;
            float outwardLength = glm::length(outward);
            if (outwardLength < kMinSegmentLength) {
                outward = glm::vec2(-chord.y, chord.x) / chordLength;
            } else {
                outward /= outwardLength;
            }
            mid += outward * chordLength * (0.08f + rng_.nextFloat() * 0.12f);

            if (isBlocked(mid)) {
                ++clipped_;
                continue;
            }

            addStreet(settlement, settlement.id + "_web_" + std::to_string(webIndex++),
                      {pa, mid, pb}, RoadClass::Town, 0.8f);
        }
    }
}

void StreetTopologyBuilder::buildGrid(Settlement& settlement) {
    const float radius = settlement.radius;
    Frame frame{settlement.position, direction(settlement.mainAxis),
                direction(settlement.mainAxis + kTwoPi * 0.25f)};

    float blockSize = rng_.range(config_.minBlockSize, config_.maxBlockSize);
    settlement.blockSize = blockSize;

    float extent = radius * config_.gridExtent;
    int halfCount = std::max(1, static_cast<int>(extent / blockSize));

    for (int family = 0; family < 2; ++family) {
        for (int i = -halfCount; i <= halfCount; ++i) {
            float offset = static_cast<float>(i) * blockSize;
            bool isMain = (i == 0);

            // Main streets run out to the perimeter to meet the entry points
            float half = isMain ? radius : chordHalfLength(radius, offset, extent);
            if (half < blockSize * 0.5f) continue;

            std::vector<float> stations{-half};
            for (int k = -halfCount; k <= halfCount; ++k) {
                float s = static_cast<float>(k) * blockSize;
                if (s > -half + 0.5f && s < half - 0.5f) stations.push_back(s);
            }
            stations.push_back(half);

            std::vector<glm::vec2> points;
            points.reserve(stations.size());
            for (float s : stations) {
                points.push_back(family == 0 ? frame.toWorld(s, offset) : frame.toWorld(offset, s));
            }

            // Coarse clipping: a segment with a blocked midpoint goes entirely
            std::vector<bool> segmentOk(points.size() - 1, true);
            for (size_t j = 0; j + 1 < points.size(); ++j) {
                if (isBlocked((points[j] + points[j + 1]) * 0.5f)) {
                    segmentOk[j] = false;
                    ++clipped_;
                }
            }

            std::string idBase = settlement.id + (family == 0 ? "_grid_a_" : "_grid_b_") + std::to_string(i);
            addSegmentRuns(settlement, idBase, points, segmentOk, isMain ? RoadClass::Highway : RoadClass::Town);
        }
    }

    buildBlockPool(settlement, frame, halfCount, 0.0f);
}

void StreetTopologyBuilder::buildMixed(Settlement& settlement) {
    const glm::vec2 center = settlement.position;
    const float radius = settlement.radius;
    const float core = radius * config_.coreFraction;

    buildOrganic(settlement, core);

    // Ring road separating the organic core from the grid
    std::vector<glm::vec2> ring;
    std::vector<bool> ringOk;
    for (int j = 0; j <= config_.ringSegments; ++j) {
        float angle = settlement.mainAxis + static_cast<float>(j) / config_.ringSegments * kTwoPi;
        glm::vec2 p = center + direction(angle) * core;
        bool blocked = isBlocked(p);
        if (blocked) ++clipped_;
        ring.push_back(p);
        ringOk.push_back(!blocked);
    }
    addPointRuns(settlement, settlement.id + "_ring", ring, ringOk, RoadClass::Town);

    Frame frame{center, direction(settlement.mainAxis), direction(settlement.mainAxis + kTwoPi * 0.25f)};

    float blockSize = rng_.range(config_.minBlockSize, config_.maxBlockSize);
    settlement.blockSize = blockSize;

    float extent = radius * config_.gridExtent;
    int halfCount = std::max(1, static_cast<int>(extent / blockSize));
    float step = blockSize * 0.25f;

    for (int family = 0; family < 2; ++family) {
        for (int i = -halfCount; i <= halfCount; ++i) {
            float offset = static_cast<float>(i) * blockSize;
            float half = chordHalfLength(radius, offset, extent);
            if (half < blockSize * 0.5f) continue;

            int samples = std::max(1, static_cast<int>(std::ceil(2.0f * half / step)));
            std::vector<glm::vec2> points;
            std::vector<bool> pointOk;
            points.reserve(samples + 1);
            pointOk.reserve(samples + 1);

            for (int k = 0; k <= samples; ++k) {
                float s = -half + 2.0f * half * static_cast<float>(k) / static_cast<float>(samples);
                glm::vec2 p = family == 0 ? frame.toWorld(s, offset) : frame.toWorld(offset, s);
                bool blocked = isBlocked(p);
                if (blocked) ++clipped_;
                points.push_back(p);
                pointOk.push_back(!blocked && glm::length(p - center) > core);
            }

            std::string idBase = settlement.id + (family == 0 ? "_grid_a_" : "_grid_b_") + std::to_string(i);
            addPointRuns(settlement, idBase, points, pointOk, RoadClass::Town);
        }
    }

    buildBlockPool(settlement, frame, halfCount, core + blockSize * 0.25f);
}

void StreetTopologyBuilder::buildBlockPool(Settlement& settlement, const Frame& frame,
                                           int halfCount, float minCenterDist) {
    const float blockSize = settlement.blockSize;
    settlement.blockPool.clear();

    for (int column = -halfCount; column < halfCount; ++column) {
        for (int row = -halfCount; row < halfCount; ++row) {
            glm::vec2 local((column + 0.5f) * blockSize, (row + 0.5f) * blockSize);
            float dist = glm::length(local);
            if (dist + blockSize * 0.5f > settlement.radius * 0.95f) continue;
            if (dist < minCenterDist) continue;
            if (isBlocked(frame.toWorld(local.x, local.y))) continue;

            settlement.blockPool.push_back(BlockCell{column, row, 0});
        }
    }

    rng_.shuffle(settlement.blockPool);
}

} // namespace layout
} // namespace settlegen
