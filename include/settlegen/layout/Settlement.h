#pragma once

#include "settlegen/catalog/CatalogTypes.h"
#include "settlegen/geom/Footprint.h"
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace settlegen {

// Road segment or polyline local to a settlement; always >= 2 points
struct Street {
    std::string id;
    std::vector<glm::vec2> points;
    float width = 6.0f;
    RoadClass roadClass = RoadClass::Town;
};

// Perimeter handoff point for the external road network
struct EntryPoint {
    glm::vec2 position{0.0f};
    float direction = 0.0f;     // Outward angle in radians
    RoadClass roadClass = RoadClass::Town;
};

struct Building {
    glm::vec2 position{0.0f};   // World XZ center
    float width = 0.0f;
    float depth = 0.0f;
    float height = 0.0f;
    float rotation = 0.0f;
    BuildingCategory category = BuildingCategory::Residential;
    BuildingSubtype subtype = BuildingSubtype::House;
    LegacyBuildingType legacyType = LegacyBuildingType::House;
    int floors = 1;
    int garrisonCapacity = 2;
    float defenseBonus = 0.5f;
    float stealthBonus = 0.5f;
    std::string settlementId;   // Owning settlement, lookup only

    geom::OrientedRect footprint() const { return {position, width, depth, rotation}; }
};

// Grid cell used to bias placement in grid and mixed layouts
struct BlockCell {
    int column = 0;             // Along the main axis
    int row = 0;                // Across the main axis
    int failures = 0;
};

struct SettlementBounds {
    float minX = 0.0f;
    float maxX = 0.0f;
    float minZ = 0.0f;
    float maxZ = 0.0f;
};

struct Settlement {
    std::string id;
    std::string name;
    SettlementSize size = SettlementSize::Hamlet;
    LayoutType layoutType = LayoutType::Organic;
    glm::vec2 position{0.0f};
    glm::vec2 focalPoint{0.0f};
    float radius = 0.0f;
    SettlementBounds bounds;
    float mainAxis = 0.0f;
    float density = 1.0f;

    std::vector<EntryPoint> entryPoints;
    std::vector<Street> streets;
    std::vector<Building> buildings;

    // Grid and mixed layouts only
    std::vector<BlockCell> blockPool;
    float blockSize = 0.0f;

    // Placement bookkeeping
    int targetBuildingCount = 0;
    EnumTable<BuildingCategory, int> quotas;
    int placementFailures = 0;
};

} // namespace settlegen
