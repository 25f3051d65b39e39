#pragma once

#include "settlegen/catalog/BuildingCatalog.h"
#include "settlegen/geom/Footprint.h"
#include "settlegen/layout/GenerationEvents.h"
#include "settlegen/layout/GeneratorConfig.h"
#include "settlegen/layout/Settlement.h"
#include "settlegen/terrain/TerrainGrid.h"
#include "settlegen/utils/SeededRandom.h"
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace settlegen {
namespace layout {

using CategoryQuotas = EnumTable<BuildingCategory, int>;

// Strategy that placed a building
enum class PlacementTier : uint8_t {
    Sampling = 0,   // A
    StreetWalk,     // B
    Infill,         // C
    None
};

// Normalized [min, max] distance band (fraction of radius) per category
FloatRange getZoneBand(BuildingCategory category);

// Focal subtype for a settlement: cathedral, town hall (grid towns), church, chapel
BuildingSubtype getFocalSubtype(SettlementSize size, LayoutType layout);

/**
 * BuildingPlacer - Fills a settlement with non-overlapping buildings
 *
 * Quotas are drawn per category from the size's composition table, the
 * focal building goes in first near the center, then the rest are queued
 * by (priority, area) and each one tries three strategies in turn:
 *
 *   A. random sampling (block edges for grid layouts, zone bands otherwise)
 *   B. walking every street and trying both frontages
 *   C. infill anywhere in the disk, small residential/commercial only
 *
 * Every candidate must stay inside the map bounds, off water, clear of
 * street widths plus a buffer, and clear of earlier buildings plus padding.
 * Every loop has a fixed ceiling, so placement always terminates.
 */
class BuildingPlacer {
public:
    BuildingPlacer(const BuildingCatalog& catalog,
                   const GeneratorConfig& config,
                   utils::SeededRandom& rng,
                   const terrain::TerrainGrid* terrain,
                   std::optional<MapBounds> mapBounds,
                   EventCallback events);

    // Places up to targetCount buildings into settlement.buildings and
    // records quotas, target and failure count on the settlement.
    void place(Settlement& settlement, int targetCount);

    // Runs tiers A, B and C in order for one building; None when all fail
    PlacementTier placeBuilding(Settlement& settlement, const BuildingSpec& spec);

    // Sums to targetCount exactly; the rounding remainder goes to residential
    CategoryQuotas allocateQuotas(SettlementSize size, int targetCount);

    // One drawn spec per quota unit, sorted by priority then area (both descending)
    std::vector<const BuildingSpec*> buildQueue(const Settlement& settlement, const CategoryQuotas& quotas);

    // Bounds, water, street clearance and building overlap for a candidate
    bool isClear(const Settlement& settlement, const geom::OrientedRect& rect) const;

    Building createBuilding(const BuildingSpec& spec, const glm::vec2& position, float rotation,
                            const std::string& settlementId);

    float padding() const { return padding_; }
    float streetClearance() const { return buffer_; }

private:
    struct Frame {
        glm::vec2 center;
        glm::vec2 u;
        glm::vec2 v;

        glm::vec2 toWorld(float along, float across) const { return center + u * along + v * across; }
    };

    void emit(GenerationEventType type, const Settlement& settlement,
              BuildingCategory category, int count, int target = 0) const;

    bool placeFocal(Settlement& settlement, const BuildingSpec& spec);

    bool tryRandomSampling(Settlement& settlement, const BuildingSpec& spec);
    bool tryBlockSample(Settlement& settlement, const BuildingSpec& spec);
    bool tryZoneSample(Settlement& settlement, const BuildingSpec& spec);
    bool tryStreetWalk(Settlement& settlement, const BuildingSpec& spec);
    bool tryInfill(Settlement& settlement, const BuildingSpec& spec);

    // Builds the candidate and appends it if clear
    bool tryPlace(Settlement& settlement, const BuildingSpec& spec, const glm::vec2& position, float rotation);

    bool isSmallFiller(const BuildingSpec& spec) const;

    // Width of the grid street bounding a block edge; the zero line is a highway in grid layouts
    float gridStreetWidth(const Settlement& settlement, int lineIndex) const;

    Frame frameFor(const Settlement& settlement) const;

    const BuildingCatalog& catalog_;
    const GeneratorConfig& config_;
    utils::SeededRandom& rng_;
    const terrain::TerrainGrid* terrain_;
    std::optional<MapBounds> mapBounds_;
    EventCallback events_;

    float padding_ = 2.0f;
    float buffer_ = 1.5f;
};

} // namespace layout
} // namespace settlegen
