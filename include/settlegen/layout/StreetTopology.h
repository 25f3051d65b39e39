#pragma once

#include "settlegen/catalog/BuildingCatalog.h"
#include "settlegen/layout/GeneratorConfig.h"
#include "settlegen/layout/Settlement.h"
#include "settlegen/terrain/TerrainGrid.h"
#include "settlegen/utils/SeededRandom.h"
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace settlegen {
namespace layout {

// Weighted draw over {organic, grid, mixed}; all-zero weights give Mixed
LayoutType pickLayoutType(const LayoutWeights& weights, utils::SeededRandom& rng);

/**
 * StreetTopologyBuilder - Lays the internal street network of a settlement
 *
 * Organic: radial random walks from the center plus curved web streets
 * between neighbouring radials. Grid: two perpendicular street families
 * along the main axis, the zero-offset street of each being a highway that
 * reaches the perimeter. Mixed: organic core, ring road, grid outside.
 *
 * Terrain feeds back into the geometry: radials stop at water or steep
 * hills, grid segments whose midpoint is blocked are dropped whole.
 */
class StreetTopologyBuilder {
public:
    StreetTopologyBuilder(const BuildingCatalog& catalog,
                          const GeneratorConfig& config,
                          utils::SeededRandom& rng,
                          const terrain::TerrainGrid* terrain);

    // Fills settlement.streets (and the block pool for grid/mixed).
    // Returns the number of segments clipped by terrain. Hamlets get nothing.
    int build(Settlement& settlement);

    void buildOrganic(Settlement& settlement, float reachRadius);
    void buildGrid(Settlement& settlement);
    void buildMixed(Settlement& settlement);

    int clippedSegments() const { return clipped_; }

private:
    struct Frame {
        glm::vec2 center;
        glm::vec2 u;    // Along the main axis
        glm::vec2 v;    // Across the main axis

        glm::vec2 toWorld(float along, float across) const { return center + u * along + v * across; }
    };

    bool isBlocked(const glm::vec2& p) const;

    void addStreet(Settlement& settlement, const std::string& id, std::vector<glm::vec2> points,
                   RoadClass roadClass, float widthScale = 1.0f);

    // Emits every run of consecutive accepted segments as its own street
    void addSegmentRuns(Settlement& settlement, const std::string& idBase,
                        const std::vector<glm::vec2>& points, const std::vector<bool>& segmentOk,
                        RoadClass roadClass);

    // Emits every run of consecutive accepted points (>= 2) as its own street
    void addPointRuns(Settlement& settlement, const std::string& idBase,
                      const std::vector<glm::vec2>& points, const std::vector<bool>& pointOk,
                      RoadClass roadClass);

    void buildWebStreets(Settlement& settlement, const std::vector<std::vector<glm::vec2>>& radials,
                         float reachRadius, float stepLength);

    // Half-length of a street line at `offset` that stays inside the circle
    float chordHalfLength(float radius, float offset, float limit) const;

    void buildBlockPool(Settlement& settlement, const Frame& frame, int halfCount, float minCenterDist);

    const BuildingCatalog& catalog_;
    const GeneratorConfig& config_;
    utils::SeededRandom& rng_;
    const terrain::TerrainGrid* terrain_;
    int clipped_ = 0;
};

} // namespace layout
} // namespace settlegen
