#include "settlegen/layout/SettlementGenerator.h"
#include "settlegen/layout/BuildingPlacer.h"
#include "settlegen/layout/EntryPoints.h"
#include "settlegen/layout/StreetTopology.h"
#include "settlegen/naming/SettlementNames.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace settlegen {

namespace {

constexpr float kPi = 3.14159265359f;

} // namespace

SettlementGenerator::SettlementGenerator(uint32_t seed, BuildingCatalog catalog, GeneratorConfig config)
    : rng_(seed)
    , catalog_(std::move(catalog))
    , config_(config) {}

void SettlementGenerator::reseed(uint32_t seed) {
    rng_.reseed(seed);
    nextId_ = 0;
}

Settlement SettlementGenerator::generate(const SettlementRequest& request) {
    const SettlementParams& params = catalog_.params(request.size);

    Settlement settlement;
    settlement.id = "settlement_" + std::to_string(nextId_++);
    settlement.size = request.size;
    settlement.position = request.position;
    settlement.density = (std::isfinite(request.density) && request.density > 0.0f)
        ? std::min(request.density, config_.maxDensity)
        : 1.0f;

    settlement.layoutType = request.layout ? *request.layout
                                           : layout::pickLayoutType(params.layoutWeights, rng_);

    // Radius grows sub-linearly with density, building count linearly
    float baseRadius = rng_.range(params.radius.min, params.radius.max);
    settlement.radius = baseRadius * std::pow(settlement.density, config_.radiusExponent);

    int baseCount = rng_.rangeInt(params.buildingCount.min, params.buildingCount.max);
    int buildingCount = static_cast<int>(std::floor(static_cast<float>(baseCount) * settlement.density));

    settlement.mainAxis = request.mainAxis ? *request.mainAxis : rng_.nextFloat() * kPi;
    settlement.name = naming::generateSettlementName(rng_, request.size);

    settlement.focalPoint = settlement.position;
    settlement.bounds.minX = settlement.position.x - settlement.radius;
    settlement.bounds.maxX = settlement.position.x + settlement.radius;
    settlement.bounds.minZ = settlement.position.y - settlement.radius;
    settlement.bounds.maxZ = settlement.position.y + settlement.radius;

    const terrain::TerrainGrid* terrain =
        (request.terrain && !request.terrain->empty()) ? request.terrain : nullptr;

    layout::StreetTopologyBuilder streets(catalog_, config_, rng_, terrain);
    int clipped = streets.build(settlement);
    if (clipped > 0 && events_) {
        GenerationEvent event;
        event.type = GenerationEventType::StreetClipped;
        event.settlementId = settlement.id;
        event.size = settlement.size;
        event.count = clipped;
        events_(event);
    }

    settlement.entryPoints = layout::deriveEntryPoints(settlement, params.roadConnections, rng_);

    layout::BuildingPlacer placer(catalog_, config_, rng_, terrain, request.mapBounds, events_);
    placer.place(settlement, buildingCount);

    return settlement;
}

std::vector<Building> SettlementGenerator::flattenBuildings(const std::vector<Settlement>& settlements) {
    std::vector<Building> buildings;
    size_t total = 0;
    for (const auto& s : settlements) total += s.buildings.size();
    buildings.reserve(total);

    for (const auto& s : settlements) {
        buildings.insert(buildings.end(), s.buildings.begin(), s.buildings.end());
    }
    return buildings;
}

std::vector<Street> SettlementGenerator::flattenStreets(const std::vector<Settlement>& settlements) {
    std::vector<Street> streets;
    for (const auto& s : settlements) {
        streets.insert(streets.end(), s.streets.begin(), s.streets.end());
    }
    return streets;
}

} // namespace settlegen
