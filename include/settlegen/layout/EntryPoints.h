#pragma once

#include "settlegen/catalog/BuildingCatalog.h"
#include "settlegen/layout/Settlement.h"
#include "settlegen/utils/SeededRandom.h"
#include <vector>

namespace settlegen {
namespace layout {

// City/town -> highway, village -> town road, hamlet -> dirt track
RoadClass getEntryRoadClass(SettlementSize size);

/**
 * Perimeter connection points for the external road network.
 *
 * Grid layouts put them on the main axis and its perpendicular (at most
 * four, in the order +axis, +90, +180, +270). Organic and mixed layouts
 * spread them evenly around the circle with a small angular jitter.
 */
std::vector<EntryPoint> deriveEntryPoints(const Settlement& settlement,
                                          const IntRange& connections,
                                          utils::SeededRandom& rng);

} // namespace layout
} // namespace settlegen
