#include "settlegen/catalog/CatalogTypes.h"

namespace settlegen {

namespace {

// Linear scan over every enum value; the tables are small
template <typename Enum>
std::optional<Enum> parseByName(std::string_view name, const char* (*getName)(Enum)) {
    for (size_t i = 0; i < static_cast<size_t>(Enum::Count); ++i) {
        Enum value = static_cast<Enum>(i);
        if (name == getName(value)) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

const char* getSettlementSizeName(SettlementSize size) {
    switch (size) {
        case SettlementSize::Hamlet:  return "hamlet";
        case SettlementSize::Village: return "village";
        case SettlementSize::Town:    return "town";
        case SettlementSize::City:    return "city";
        default:                      return "unknown";
    }
}

const char* getLayoutTypeName(LayoutType layout) {
    switch (layout) {
        case LayoutType::Organic: return "organic";
        case LayoutType::Grid:    return "grid";
        case LayoutType::Mixed:   return "mixed";
        default:                  return "unknown";
    }
}

const char* getRoadClassName(RoadClass road) {
    switch (road) {
        case RoadClass::Town:    return "town";
        case RoadClass::Highway: return "highway";
        case RoadClass::Dirt:    return "dirt";
        default:                 return "unknown";
    }
}

const char* getBuildingCategoryName(BuildingCategory category) {
    switch (category) {
        case BuildingCategory::Residential:    return "residential";
        case BuildingCategory::Commercial:     return "commercial";
        case BuildingCategory::Industrial:     return "industrial";
        case BuildingCategory::Civic:          return "civic";
        case BuildingCategory::Agricultural:   return "agricultural";
        case BuildingCategory::Infrastructure: return "infrastructure";
        default:                               return "unknown";
    }
}

const char* getBuildingSubtypeName(BuildingSubtype subtype) {
    switch (subtype) {
        case BuildingSubtype::House:           return "house";
        case BuildingSubtype::Cottage:         return "cottage";
        case BuildingSubtype::RowHouse:        return "row_house";
        case BuildingSubtype::Apartment:       return "apartment";
        case BuildingSubtype::Villa:           return "villa";
        case BuildingSubtype::Tenement:        return "tenement";
        case BuildingSubtype::Shop:            return "shop";
        case BuildingSubtype::Inn:             return "inn";
        case BuildingSubtype::MarketHall:      return "market_hall";
        case BuildingSubtype::Bank:            return "bank";
        case BuildingSubtype::OfficeBuilding:  return "office_building";
        case BuildingSubtype::DepartmentStore: return "department_store";
        case BuildingSubtype::Skyscraper:      return "skyscraper";
        case BuildingSubtype::Workshop:        return "workshop";
        case BuildingSubtype::Warehouse:       return "warehouse";
        case BuildingSubtype::Mill:            return "mill";
        case BuildingSubtype::Factory:         return "factory";
        case BuildingSubtype::PowerPlant:      return "power_plant";
        case BuildingSubtype::Chapel:          return "chapel";
        case BuildingSubtype::Church:          return "church";
        case BuildingSubtype::Cathedral:       return "cathedral";
        case BuildingSubtype::TownHall:        return "town_hall";
        case BuildingSubtype::School:          return "school";
        case BuildingSubtype::Hospital:        return "hospital";
        case BuildingSubtype::PoliceStation:   return "police_station";
        case BuildingSubtype::ClockTower:      return "clock_tower";
        case BuildingSubtype::Farmhouse:       return "farmhouse";
        case BuildingSubtype::Barn:            return "barn";
        case BuildingSubtype::Stable:          return "stable";
        case BuildingSubtype::Greenhouse:      return "greenhouse";
        case BuildingSubtype::SiloCluster:     return "silo_cluster";
        case BuildingSubtype::WaterTower:      return "water_tower";
        case BuildingSubtype::PostOffice:      return "post_office";
        case BuildingSubtype::FireStation:     return "fire_station";
        case BuildingSubtype::GasStation:      return "gas_station";
        case BuildingSubtype::TrainStation:    return "train_station";
        case BuildingSubtype::RadioTower:      return "radio_tower";
        default:                               return "unknown";
    }
}

const char* getLegacyBuildingTypeName(LegacyBuildingType type) {
    switch (type) {
        case LegacyBuildingType::House:   return "house";
        case LegacyBuildingType::Church:  return "church";
        case LegacyBuildingType::Factory: return "factory";
        case LegacyBuildingType::Shop:    return "shop";
        default:                          return "house";
    }
}

std::optional<SettlementSize> parseSettlementSize(std::string_view name) {
    return parseByName<SettlementSize>(name, getSettlementSizeName);
}

std::optional<LayoutType> parseLayoutType(std::string_view name) {
    return parseByName<LayoutType>(name, getLayoutTypeName);
}

std::optional<RoadClass> parseRoadClass(std::string_view name) {
    return parseByName<RoadClass>(name, getRoadClassName);
}

std::optional<BuildingCategory> parseBuildingCategory(std::string_view name) {
    return parseByName<BuildingCategory>(name, getBuildingCategoryName);
}

std::optional<BuildingSubtype> parseBuildingSubtype(std::string_view name) {
    return parseByName<BuildingSubtype>(name, getBuildingSubtypeName);
}

BuildingCategory getSubtypeCategory(BuildingSubtype subtype) {
    if (subtype <= BuildingSubtype::Tenement)   return BuildingCategory::Residential;
    if (subtype <= BuildingSubtype::Skyscraper) return BuildingCategory::Commercial;
    if (subtype <= BuildingSubtype::PowerPlant) return BuildingCategory::Industrial;
    if (subtype <= BuildingSubtype::ClockTower) return BuildingCategory::Civic;
    if (subtype <= BuildingSubtype::SiloCluster) return BuildingCategory::Agricultural;
    return BuildingCategory::Infrastructure;
}

int getPlacementPriority(BuildingSubtype subtype) {
    switch (subtype) {
        // Anchors: claim space while the settlement is still empty
        case BuildingSubtype::Cathedral:
        case BuildingSubtype::Church:
        case BuildingSubtype::TownHall:
        case BuildingSubtype::Hospital:
        case BuildingSubtype::ClockTower:
        case BuildingSubtype::Factory:
        case BuildingSubtype::PowerPlant:
        case BuildingSubtype::Mill:
            return 3;

        case BuildingSubtype::MarketHall:
        case BuildingSubtype::Bank:
        case BuildingSubtype::DepartmentStore:
        case BuildingSubtype::OfficeBuilding:
        case BuildingSubtype::Skyscraper:
        case BuildingSubtype::Inn:
        case BuildingSubtype::School:
        case BuildingSubtype::PoliceStation:
        case BuildingSubtype::TrainStation:
        case BuildingSubtype::FireStation:
        case BuildingSubtype::WaterTower:
        case BuildingSubtype::Warehouse:
            return 2;

        default:
            return 1;
    }
}

LegacyBuildingType getLegacyBuildingType(BuildingCategory category, BuildingSubtype subtype) {
    switch (category) {
        case BuildingCategory::Residential:
        case BuildingCategory::Agricultural:
            return LegacyBuildingType::House;
        case BuildingCategory::Civic:
            if (subtype == BuildingSubtype::Chapel ||
                subtype == BuildingSubtype::Church ||
                subtype == BuildingSubtype::Cathedral) {
                return LegacyBuildingType::Church;
            }
            return LegacyBuildingType::House;
        case BuildingCategory::Industrial:
            return LegacyBuildingType::Factory;
        case BuildingCategory::Commercial:
        case BuildingCategory::Infrastructure:
            // Tall blocks read as factories on the coarse renderer
            if (subtype == BuildingSubtype::Skyscraper || subtype == BuildingSubtype::OfficeBuilding) {
                return LegacyBuildingType::Factory;
            }
            return LegacyBuildingType::Shop;
        default:
            return LegacyBuildingType::House;
    }
}

} // namespace settlegen
