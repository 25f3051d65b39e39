#include "settlegen/layout/EntryPoints.h"
#include <algorithm>
#include <cmath>

namespace settlegen {
namespace layout {

namespace {

constexpr float kTwoPi = 6.28318530718f;
constexpr float kEntryJitter = 0.5f;

EntryPoint makeEntry(const Settlement& settlement, float angle, RoadClass roadClass) {
    EntryPoint entry;
    entry.position = settlement.position + glm::vec2(std::cos(angle), std::sin(angle)) * settlement.radius;
    entry.direction = angle;
    entry.roadClass = roadClass;
    return entry;
}

} // namespace

RoadClass getEntryRoadClass(SettlementSize size) {
    switch (size) {
        case SettlementSize::City:
        case SettlementSize::Town:    return RoadClass::Highway;
        case SettlementSize::Village: return RoadClass::Town;
        case SettlementSize::Hamlet:
        default:                      return RoadClass::Dirt;
    }
}

std::vector<EntryPoint> deriveEntryPoints(const Settlement& settlement,
                                          const IntRange& connections,
                                          utils::SeededRandom& rng) {
    int count = rng.rangeInt(connections.min, connections.max);
    RoadClass roadClass = getEntryRoadClass(settlement.size);

    std::vector<EntryPoint> entries;

    if (settlement.layoutType == LayoutType::Grid) {
        int cardinal = std::min(count, 4);
        for (int i = 0; i < cardinal; ++i) {
            float angle = settlement.mainAxis + static_cast<float>(i) * kTwoPi * 0.25f;
            entries.push_back(makeEntry(settlement, angle, roadClass));
        }
        return entries;
    }

    entries.reserve(count > 0 ? count : 0);
    for (int i = 0; i < count; ++i) {
        float baseAngle = static_cast<float>(i) / static_cast<float>(count) * kTwoPi;
        float angle = baseAngle + (rng.nextFloat() - 0.5f) * kEntryJitter;
        entries.push_back(makeEntry(settlement, angle, roadClass));
    }
    return entries;
}

} // namespace layout
} // namespace settlegen
