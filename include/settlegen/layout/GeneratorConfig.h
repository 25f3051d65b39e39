#pragma once

#include "settlegen/catalog/CatalogTypes.h"
#include "settlegen/terrain/TerrainGrid.h"
#include <glm/glm.hpp>
#include <optional>
#include <vector>

namespace settlegen {

// Playable map extent; buildings must stay inside it
struct MapBounds {
    float minX = 0.0f;
    float maxX = 0.0f;
    float minZ = 0.0f;
    float maxZ = 0.0f;
};

// Reserved for geography checks; placement does not read it yet
struct WaterBody {
    std::vector<glm::vec2> points;
    float width = 0.0f;
    bool isRiver = false;
};

struct SettlementRequest {
    glm::vec2 position{0.0f};
    SettlementSize size = SettlementSize::Village;
    std::optional<LayoutType> layout;
    std::optional<float> mainAxis;
    float density = 1.0f;
    std::optional<MapBounds> mapBounds;
    const terrain::TerrainGrid* terrain = nullptr;     // Not owned
    const std::vector<WaterBody>* waterBodies = nullptr; // Not owned
};

struct GeneratorConfig {
    // Terrain
    float steepHillElevation = 8.0f;

    // Density scaling: radius grows with density^radiusExponent
    float radiusExponent = 0.5f;
    float maxDensity = 8.0f;            // Larger requests are clamped; non-finite or <= 0 means 1

    // Organic streets
    int minRadials = 5;
    int maxRadials = 9;
    float radialTurn = 0.35f;           // Max per-step angle change
    float radialPull = 0.2f;            // Bias back toward the radial's base angle
    float webSkipChance = 0.15f;
    float webBandSpacing = 25.0f;       // Metres between cross-street bands

    // Grid streets
    float minBlockSize = 35.0f;
    float maxBlockSize = 50.0f;
    float gridExtent = 0.85f;           // Fraction of radius covered by side streets

    // Mixed layouts
    float coreFraction = 0.35f;
    int ringSegments = 24;

    // Placement search
    int tierAAttempts = 15;
    int tierBMaxSteps = 400;
    int tierCAttempts = 40;
    size_t blockSampleWindow = 10;
    int blockFailureLimit = 6;
    float streetWalkStep = 6.0f;
    float streetMargin = 1.0f;
    float infillAlignDistance = 30.0f;
    float smallBuildingArea = 150.0f;

    // Buildings
    float metresPerFloor = 3.0f;
};

// Gap kept between buildings; goes slightly negative at extreme density
float buildingPadding(float density);

// Extra clearance between a building and the edge of a street
float streetBuffer(float density);

} // namespace settlegen
