#include "settlegen/layout/GenerationEvents.h"
#include <SDL3/SDL_log.h>

namespace settlegen {

const char* getGenerationEventName(GenerationEventType type) {
    switch (type) {
        case GenerationEventType::PlacementShortfall: return "placement_shortfall";
        case GenerationEventType::MissingSpec:        return "missing_spec";
        case GenerationEventType::MissingFocalSpec:   return "missing_focal_spec";
        case GenerationEventType::FocalBlocked:       return "focal_blocked";
        case GenerationEventType::StreetClipped:      return "street_clipped";
        default:                                      return "unknown";
    }
}

EventCallback logEventSink() {
    return [](const GenerationEvent& event) {
        const char* id = event.settlementId.c_str();
        const char* kind = getGenerationEventName(event.type);
        switch (event.type) {
            case GenerationEventType::PlacementShortfall:
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Settlement %s [%s] (%s): placed %d of %d buildings, %d dropped",
                    id, kind, getSettlementSizeName(event.size),
                    event.target - event.count, event.target, event.count);
                break;
            case GenerationEventType::MissingSpec:
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Settlement %s [%s]: no %s spec allowed in a %s, skipped %d slots",
                    id, kind, getBuildingCategoryName(event.category),
                    getSettlementSizeName(event.size), event.count);
                break;
            case GenerationEventType::MissingFocalSpec:
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Settlement %s [%s]: no focal building spec for a %s",
                    id, kind, getSettlementSizeName(event.size));
                break;
            case GenerationEventType::FocalBlocked:
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Settlement %s [%s]: no clear spot for the focal building near the center", id, kind);
                break;
            case GenerationEventType::StreetClipped:
                SDL_Log("Settlement %s [%s]: %d street segments clipped by terrain", id, kind, event.count);
                break;
        }
    };
}

} // namespace settlegen
