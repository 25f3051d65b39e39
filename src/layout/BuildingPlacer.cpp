#include "settlegen/layout/BuildingPlacer.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace settlegen {

float buildingPadding(float density) {
    return std::clamp(2.0f - 1.25f * (density - 1.0f), -0.5f, 3.0f);
}

float streetBuffer(float density) {
    return std::clamp(1.5f - 0.5f * (density - 1.0f), 0.5f, 2.0f);
}

namespace layout {

namespace {

constexpr float kPi = 3.14159265359f;
constexpr float kTwoPi = 6.28318530718f;
constexpr float kMinSegmentLength = 1e-3f;
constexpr float kFocalRingStep = 3.0f;
constexpr int kFocalRingDirections = 8;
constexpr int kMaxFocalRings = 64;
constexpr float kFacingJitter = 0.3f;

} // namespace

FloatRange getZoneBand(BuildingCategory category) {
    switch (category) {
        case BuildingCategory::Civic:          return {0.0f, 0.3f};
        case BuildingCategory::Commercial:     return {0.1f, 0.5f};
        case BuildingCategory::Residential:    return {0.2f, 0.8f};
        case BuildingCategory::Industrial:     return {0.5f, 0.9f};
        case BuildingCategory::Agricultural:   return {0.7f, 1.0f};
        case BuildingCategory::Infrastructure: return {0.3f, 0.7f};
        default:                               return {0.2f, 0.8f};
    }
}

BuildingSubtype getFocalSubtype(SettlementSize size, LayoutType layout) {
    switch (size) {
        case SettlementSize::City:
            return BuildingSubtype::Cathedral;
        case SettlementSize::Town:
            return layout == LayoutType::Grid ? BuildingSubtype::TownHall : BuildingSubtype::Church;
        case SettlementSize::Village:
            return BuildingSubtype::Church;
        case SettlementSize::Hamlet:
        default:
            return BuildingSubtype::Chapel;
    }
}

BuildingPlacer::BuildingPlacer(const BuildingCatalog& catalog,
                               const GeneratorConfig& config,
                               utils::SeededRandom& rng,
                               const terrain::TerrainGrid* terrain,
                               std::optional<MapBounds> mapBounds,
                               EventCallback events)
    : catalog_(catalog)
    , config_(config)
    , rng_(rng)
    , terrain_(terrain)
    , mapBounds_(mapBounds)
    , events_(std::move(events)) {}

void BuildingPlacer::emit(GenerationEventType type, const Settlement& settlement,
                          BuildingCategory category, int count, int target) const {
    if (!events_) return;

    GenerationEvent event;
    event.type = type;
    event.settlementId = settlement.id;
    event.size = settlement.size;
    event.category = category;
    event.count = count;
    event.target = target;
    events_(event);
}

void BuildingPlacer::place(Settlement& settlement, int targetCount) {
    padding_ = buildingPadding(settlement.density);
    buffer_ = streetBuffer(settlement.density);

    const int target = std::max(0, targetCount);
    settlement.buildings.clear();
    settlement.buildings.reserve(target);
    settlement.targetBuildingCount = target;
    settlement.focalPoint = settlement.position;

    CategoryQuotas quotas = allocateQuotas(settlement.size, target);
    settlement.quotas = quotas;

    int failures = 0;

    if (target > 0) {
        BuildingSubtype focalSubtype = getFocalSubtype(settlement.size, settlement.layoutType);
        const BuildingSpec* focal = catalog_.findSpec(focalSubtype);
        if (!focal) {
            emit(GenerationEventType::MissingFocalSpec, settlement, BuildingCategory::Civic, 1);
        } else {
            // The focal building takes a civic slot, or any slot if civic is empty
            if (quotas[BuildingCategory::Civic] > 0) {
                quotas[BuildingCategory::Civic]--;
            } else if (quotas[BuildingCategory::Residential] > 0) {
                quotas[BuildingCategory::Residential]--;
            } else {
                for (BuildingCategory category : kCategoryOrder) {
                    if (quotas[category] > 0) {
                        quotas[category]--;
                        break;
                    }
                }
            }

            if (!placeFocal(settlement, *focal)) {
                ++failures;
                emit(GenerationEventType::FocalBlocked, settlement, focal->category, 1);
            }
        }
    }

    for (const BuildingSpec* spec : buildQueue(settlement, quotas)) {
        if (placeBuilding(settlement, *spec) == PlacementTier::None) {
            ++failures;
        }
    }

    settlement.placementFailures = failures;

    int dropped = target - static_cast<int>(settlement.buildings.size());
    if (dropped > 0) {
        emit(GenerationEventType::PlacementShortfall, settlement, BuildingCategory::Residential, dropped, target);
    }
}

PlacementTier BuildingPlacer::placeBuilding(Settlement& settlement, const BuildingSpec& spec) {
    if (tryRandomSampling(settlement, spec)) return PlacementTier::Sampling;
    if (tryStreetWalk(settlement, spec)) return PlacementTier::StreetWalk;
    if (isSmallFiller(spec) && tryInfill(settlement, spec)) return PlacementTier::Infill;
    return PlacementTier::None;
}

CategoryQuotas BuildingPlacer::allocateQuotas(SettlementSize size, int targetCount) {
    const Composition& composition = catalog_.composition(size);

    CategoryQuotas quotas;
    int remaining = targetCount;
    for (BuildingCategory category : kCategoryOrder) {
        const FloatRange& share = composition[category];
        float percentage = rng_.range(share.min, share.max);
        quotas[category] = static_cast<int>(std::floor(static_cast<float>(targetCount) * percentage));
        remaining -= quotas[category];
    }

    quotas[BuildingCategory::Residential] += remaining;
    return quotas;
}

std::vector<const BuildingSpec*> BuildingPlacer::buildQueue(const Settlement& settlement,
                                                            const CategoryQuotas& quotas) {
    std::vector<const BuildingSpec*> queue;

    for (BuildingCategory category : kCategoryOrder) {
        int count = quotas[category];
        if (count <= 0) continue;

        auto eligible = catalog_.eligibleSpecs(category, settlement.size);
        if (eligible.empty()) {
            emit(GenerationEventType::MissingSpec, settlement, category, count);
            continue;
        }

        for (int i = 0; i < count; ++i) {
            queue.push_back(eligible[rng_.index(eligible.size())]);
        }
    }

    // Anchors and large footprints claim space while the settlement is empty
    std::stable_sort(queue.begin(), queue.end(), [](const BuildingSpec* a, const BuildingSpec* b) {
        int pa = getPlacementPriority(a->subtype);
        int pb = getPlacementPriority(b->subtype);
        if (pa != pb) return pa > pb;
        return a->area() > b->area();
    });

    return queue;
}

BuildingPlacer::Frame BuildingPlacer::frameFor(const Settlement& settlement) const {
    float a = settlement.mainAxis;
    return Frame{settlement.position, glm::vec2(std::cos(a), std::sin(a)), glm::vec2(-std::sin(a), std::cos(a))};
}

bool BuildingPlacer::placeFocal(Settlement& settlement, const BuildingSpec& spec) {
    std::vector<glm::vec2> candidates{settlement.position};

    // Grid centers sit on the highway crossing; try the four surrounding blocks
    if (settlement.layoutType == LayoutType::Grid && settlement.blockSize > 0.0f) {
        Frame frame = frameFor(settlement);
        float h = settlement.blockSize * 0.5f;
        candidates.push_back(frame.toWorld(h, h));
        candidates.push_back(frame.toWorld(-h, h));
        candidates.push_back(frame.toWorld(-h, -h));
        candidates.push_back(frame.toWorld(h, -h));
    }

    const float ringLimit = std::isfinite(settlement.radius) ? settlement.radius * 0.5f : 0.0f;
    const int rings = static_cast<int>(std::min(ringLimit / kFocalRingStep, static_cast<float>(kMaxFocalRings)));
    for (int ring = 1; ring <= rings; ++ring) {
        float r = static_cast<float>(ring) * kFocalRingStep;
        for (int j = 0; j < kFocalRingDirections; ++j) {
            float angle = settlement.mainAxis + static_cast<float>(j) / kFocalRingDirections * kTwoPi;
            candidates.push_back(settlement.position + glm::vec2(std::cos(angle), std::sin(angle)) * r);
        }
    }

    for (const auto& candidate : candidates) {
        if (tryPlace(settlement, spec, candidate, settlement.mainAxis)) {
            settlement.focalPoint = candidate;
            return true;
        }
    }
    return false;
}

bool BuildingPlacer::tryRandomSampling(Settlement& settlement, const BuildingSpec& spec) {
    for (int attempt = 0; attempt < config_.tierAAttempts; ++attempt) {
        bool useBlocks = false;
        if (!settlement.blockPool.empty()) {
            if (settlement.layoutType == LayoutType::Grid) {
                useBlocks = true;
            } else if (settlement.layoutType == LayoutType::Mixed) {
                useBlocks = rng_.chance(0.5);
            }
        }

        bool placed = useBlocks ? tryBlockSample(settlement, spec) : tryZoneSample(settlement, spec);
        if (placed) return true;
    }
    return false;
}

float BuildingPlacer::gridStreetWidth(const Settlement& settlement, int lineIndex) const {
    if (settlement.layoutType == LayoutType::Grid && lineIndex == 0) {
        return catalog_.roadWidth(RoadClass::Highway);
    }
    return catalog_.roadWidth(RoadClass::Town);
}

bool BuildingPlacer::tryBlockSample(Settlement& settlement, const BuildingSpec& spec) {
    auto& pool = settlement.blockPool;
    size_t window = std::min(pool.size(), config_.blockSampleWindow);
    size_t slot = rng_.index(window);
    const BlockCell cell = pool[slot];

    const float bs = settlement.blockSize;
    const float x0 = static_cast<float>(cell.column) * bs;
    const float x1 = x0 + bs;
    const float y0 = static_cast<float>(cell.row) * bs;
    const float y1 = y0 + bs;
    const float clear = buffer_ + config_.streetMargin;

    // Edges 0/1 front the streets along the main axis, 2/3 the cross streets
    int edge = rng_.rangeInt(0, 3);
    bool valid = false;
    glm::vec2 local(0.0f);
    float rotation = settlement.mainAxis;

    if (edge < 2) {
        int line = edge == 0 ? cell.row : cell.row + 1;
        float setback = gridStreetWidth(settlement, line) * 0.5f + clear + spec.depth * 0.5f;
        float lo = x0 + gridStreetWidth(settlement, cell.column) * 0.5f + clear + spec.width * 0.5f;
        float hi = x1 - gridStreetWidth(settlement, cell.column + 1) * 0.5f - clear - spec.width * 0.5f;
        if (hi >= lo) {
            local = glm::vec2(rng_.range(lo, hi), edge == 0 ? y0 + setback : y1 - setback);
            valid = true;
        }
    } else {
        int line = edge == 2 ? cell.column : cell.column + 1;
        float setback = gridStreetWidth(settlement, line) * 0.5f + clear + spec.depth * 0.5f;
        float lo = y0 + gridStreetWidth(settlement, cell.row) * 0.5f + clear + spec.width * 0.5f;
        float hi = y1 - gridStreetWidth(settlement, cell.row + 1) * 0.5f - clear - spec.width * 0.5f;
        if (hi >= lo) {
            local = glm::vec2(edge == 2 ? x0 + setback : x1 - setback, rng_.range(lo, hi));
            rotation = settlement.mainAxis + kPi * 0.5f;
            valid = true;
        }
    }

    if (valid) {
        Frame frame = frameFor(settlement);
        if (tryPlace(settlement, spec, frame.toWorld(local.x, local.y), rotation)) {
            return true;
        }
    }

    // Failed blocks go to the back of the pool; saturated ones are evicted
    BlockCell failed = cell;
    failed.failures++;
    pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(slot));
    if (failed.failures <= config_.blockFailureLimit) {
        pool.push_back(failed);
    }
    return false;
}

bool BuildingPlacer::tryZoneSample(Settlement& settlement, const BuildingSpec& spec) {
    FloatRange band = getZoneBand(spec.category);
    float angle = rng_.nextFloat() * kTwoPi;
    float distance = settlement.radius * (band.min + rng_.nextFloat() * (band.max - band.min));

    glm::vec2 position = settlement.position + glm::vec2(std::cos(angle), std::sin(angle)) * distance;
    glm::vec2 toCenter = settlement.position - position;
    float rotation = std::atan2(toCenter.y, toCenter.x) + (rng_.nextFloat() - 0.5f) * kFacingJitter;

    return tryPlace(settlement, spec, position, rotation);
}

bool BuildingPlacer::tryStreetWalk(Settlement& settlement, const BuildingSpec& spec) {
    const size_t streetCount = settlement.streets.size();
    if (streetCount == 0) return false;

    std::vector<size_t> order(streetCount);
    std::iota(order.begin(), order.end(), size_t{0});
    rng_.shuffle(order);

    const bool secondRow = isSmallFiller(spec);
    const float rowGap = spec.depth + std::max(padding_, 0.0f);
    int steps = 0;

    for (size_t index : order) {
        const std::vector<glm::vec2>& points = settlement.streets[index].points;
        const float halfStreet = settlement.streets[index].width * 0.5f;
        const float offset = halfStreet + spec.depth * 0.5f + config_.streetMargin + buffer_;

        for (size_t j = 0; j + 1 < points.size(); ++j) {
            glm::vec2 segment = points[j + 1] - points[j];
            float length = glm::length(segment);
            if (length < kMinSegmentLength) continue;

            glm::vec2 dir = segment / length;
            glm::vec2 normal(-dir.y, dir.x);
            float rotation = std::atan2(dir.y, dir.x);

            for (float s = config_.streetWalkStep * 0.5f; s < length; s += config_.streetWalkStep) {
                if (++steps > config_.tierBMaxSteps) return false;

                glm::vec2 base = points[j] + dir * s;
                float side = rng_.chance(0.5) ? 1.0f : -1.0f;
                for (int pass = 0; pass < 2; ++pass, side = -side) {
                    if (tryPlace(settlement, spec, base + normal * (side * offset), rotation)) {
                        return true;
                    }
                    if (secondRow &&
                        tryPlace(settlement, spec, base + normal * (side * (offset + rowGap)), rotation)) {
                        return true;
                    }
                }
            }
        }
    }
    return false;
}

bool BuildingPlacer::tryInfill(Settlement& settlement, const BuildingSpec& spec) {
    for (int attempt = 0; attempt < config_.tierCAttempts; ++attempt) {
        // sqrt keeps the samples uniform over the disk's area
        float r = settlement.radius * std::sqrt(rng_.nextFloat());
        float angle = rng_.nextFloat() * kTwoPi;
        glm::vec2 position = settlement.position + glm::vec2(std::cos(angle), std::sin(angle)) * r;

        if (terrain_ && terrain_->isWater(position)) continue;

        float bestDistance = std::numeric_limits<float>::max();
        glm::vec2 bestDir(0.0f);
        for (const auto& street : settlement.streets) {
            for (size_t j = 0; j + 1 < street.points.size(); ++j) {
                glm::vec2 segment = street.points[j + 1] - street.points[j];
                float length = glm::length(segment);
                if (length < kMinSegmentLength) continue;

                glm::vec2 mid = (street.points[j] + street.points[j + 1]) * 0.5f;
                float d = glm::length(position - mid);
                if (d < bestDistance) {
                    bestDistance = d;
                    bestDir = segment / length;
                }
            }
        }

        float rotation = bestDistance <= config_.infillAlignDistance
            ? std::atan2(bestDir.y, bestDir.x)
            : rng_.nextFloat() * kTwoPi;

        if (tryPlace(settlement, spec, position, rotation)) {
            return true;
        }
    }
    return false;
}

bool BuildingPlacer::tryPlace(Settlement& settlement, const BuildingSpec& spec,
                              const glm::vec2& position, float rotation) {
    geom::OrientedRect rect{position, spec.width, spec.depth, rotation};
    if (!isClear(settlement, rect)) {
        return false;
    }
    settlement.buildings.push_back(createBuilding(spec, position, rotation, settlement.id));
    return true;
}

bool BuildingPlacer::isSmallFiller(const BuildingSpec& spec) const {
    return (spec.category == BuildingCategory::Residential || spec.category == BuildingCategory::Commercial) &&
           spec.area() <= config_.smallBuildingArea;
}

bool BuildingPlacer::isClear(const Settlement& settlement, const geom::OrientedRect& rect) const {
    if (mapBounds_) {
        geom::Aabb map{{mapBounds_->minX, mapBounds_->minZ}, {mapBounds_->maxX, mapBounds_->maxZ}};
        geom::Aabb box = geom::getBounds(geom::getCorners(rect.inflated(std::max(padding_, 0.0f))));
        if (!map.contains(box)) return false;
    }

    if (terrain_ && terrain_->isWater(rect.center)) {
        return false;
    }

    const geom::Quad corners = geom::getCorners(rect);
    const float minorHalf = 0.5f * std::min(rect.width, rect.depth);

    for (const auto& street : settlement.streets) {
        const float clearance = street.width * 0.5f + buffer_;
        for (size_t j = 0; j + 1 < street.points.size(); ++j) {
            const glm::vec2& a = street.points[j];
            const glm::vec2& b = street.points[j + 1];
            if (geom::distanceToSegment(rect.center, a, b) < minorHalf + clearance) return false;
            if (geom::quadSegmentDistance(corners, a, b) < clearance) return false;
        }
    }

    for (const auto& other : settlement.buildings) {
        if (geom::footprintsOverlap(rect, other.footprint(), padding_)) {
            return false;
        }
    }
    return true;
}

Building BuildingPlacer::createBuilding(const BuildingSpec& spec, const glm::vec2& position, float rotation,
                                        const std::string& settlementId) {
    Building building;
    building.position = position;
    building.width = spec.width;
    building.depth = spec.depth;
    building.rotation = rotation;
    building.category = spec.category;
    building.subtype = spec.subtype;
    building.legacyType = getLegacyBuildingType(spec.category, spec.subtype);
    building.floors = rng_.rangeInt(spec.floors.min, spec.floors.max);
    building.settlementId = settlementId;

    float height = static_cast<float>(building.floors) * config_.metresPerFloor;
    switch (spec.subtype) {
        case BuildingSubtype::ClockTower:  height += 15.0f; break;  // Spire
        case BuildingSubtype::Church:
        case BuildingSubtype::Cathedral:   height += 10.0f; break;
        case BuildingSubtype::Skyscraper:  height += 5.0f; break;   // Plant room
        case BuildingSubtype::SiloCluster: height = 15.0f; break;
        default: break;
    }
    building.height = height;

    int garrison = static_cast<int>(std::floor(std::sqrt(spec.width * spec.depth) / 5.0f));
    building.garrisonCapacity = std::clamp(garrison, 2, 5);
    building.defenseBonus = 0.5f;
    building.stealthBonus = 0.5f;
    return building;
}

} // namespace layout
} // namespace settlegen
