#pragma once

#include "settlegen/catalog/CatalogTypes.h"
#include <functional>
#include <string>

namespace settlegen {

enum class GenerationEventType : uint8_t {
    PlacementShortfall = 0,
    MissingSpec,
    MissingFocalSpec,
    FocalBlocked,
    StreetClipped
};

struct GenerationEvent {
    GenerationEventType type = GenerationEventType::PlacementShortfall;
    std::string settlementId;
    SettlementSize size = SettlementSize::Hamlet;
    BuildingCategory category = BuildingCategory::Residential;
    int count = 0;              // Dropped buildings, skipped slots, clipped segments
    int target = 0;             // Requested building count (shortfall only)
};

using EventCallback = std::function<void(const GenerationEvent&)>;

const char* getGenerationEventName(GenerationEventType type);

// Callback that forwards events to SDL logging
EventCallback logEventSink();

} // namespace settlegen
