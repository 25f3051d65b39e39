#include "settlegen/naming/SettlementNames.h"
#include <array>
#include <vector>

namespace settlegen {
namespace naming {

namespace {

const std::array<const char*, 30> kPrefixes = {
    "Oak", "Maple", "Pine", "River", "Hill", "Stone", "Green", "White", "Black", "Red",
    "North", "South", "East", "West", "Old", "New", "High", "Low", "Fair", "Bright",
    "Clear", "Dark", "Silver", "Golden", "Iron", "Copper", "Mill", "Bridge", "Cross", "Spring",
};

const std::vector<const char*>& suffixesFor(SettlementSize size) {
    static const std::vector<const char*> hamlet = {"stead", "farm", "hollow", "grove", "creek"};
    static const std::vector<const char*> village = {"ville", "ton", "bury", "ford", "dale", "field", "wood"};
    static const std::vector<const char*> town = {"town", "wich", "ham", "port", "borough", "bridge"};
    static const std::vector<const char*> city = {"city", "polis", "burg", "haven", "gate", "worth"};

    switch (size) {
        case SettlementSize::Hamlet:  return hamlet;
        case SettlementSize::Village: return village;
        case SettlementSize::City:    return city;
        case SettlementSize::Town:
        default:                      return town;
    }
}

} // namespace

std::string generateSettlementName(utils::SeededRandom& rng, SettlementSize size) {
    std::string name = kPrefixes[rng.index(kPrefixes.size())];
    const auto& suffixes = suffixesFor(size);
    name += suffixes[rng.index(suffixes.size())];
    return name;
}

} // namespace naming
} // namespace settlegen
