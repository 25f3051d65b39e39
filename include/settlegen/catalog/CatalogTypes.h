#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace settlegen {

enum class SettlementSize : uint8_t {
    Hamlet = 0,
    Village = 1,
    Town = 2,
    City = 3,
    Count
};

enum class LayoutType : uint8_t {
    Organic = 0,
    Grid = 1,
    Mixed = 2,
    Count
};

// Coarse road class, also selects the street width
enum class RoadClass : uint8_t {
    Town = 0,
    Highway = 1,
    Dirt = 2,
    Count
};

enum class BuildingCategory : uint8_t {
    Residential = 0,
    Commercial,
    Industrial,
    Civic,
    Agricultural,
    Infrastructure,
    Count
};

enum class BuildingSubtype : uint8_t {
    // Residential
    House = 0,
    Cottage,
    RowHouse,
    Apartment,
    Villa,
    Tenement,

    // Commercial
    Shop,
    Inn,
    MarketHall,
    Bank,
    OfficeBuilding,
    DepartmentStore,
    Skyscraper,

    // Industrial
    Workshop,
    Warehouse,
    Mill,
    Factory,
    PowerPlant,

    // Civic
    Chapel,
    Church,
    Cathedral,
    TownHall,
    School,
    Hospital,
    PoliceStation,
    ClockTower,

    // Agricultural
    Farmhouse,
    Barn,
    Stable,
    Greenhouse,
    SiloCluster,

    // Infrastructure
    WaterTower,
    PostOffice,
    FireStation,
    GasStation,
    TrainStation,
    RadioTower,

    Count
};

// Coarse renderer type kept for consumers that predate categories
enum class LegacyBuildingType : uint8_t {
    House = 0,
    Church,
    Factory,
    Shop
};

constexpr size_t kSettlementSizeCount = static_cast<size_t>(SettlementSize::Count);
constexpr size_t kLayoutTypeCount = static_cast<size_t>(LayoutType::Count);
constexpr size_t kRoadClassCount = static_cast<size_t>(RoadClass::Count);
constexpr size_t kBuildingCategoryCount = static_cast<size_t>(BuildingCategory::Count);
constexpr size_t kBuildingSubtypeCount = static_cast<size_t>(BuildingSubtype::Count);

// Table indexed by an enum value
template <typename Enum, typename T, size_t N = static_cast<size_t>(Enum::Count)>
struct EnumTable {
    std::array<T, N> values{};

    T& operator[](Enum e) { return values[static_cast<size_t>(e)]; }
    const T& operator[](Enum e) const { return values[static_cast<size_t>(e)]; }

    bool operator==(const EnumTable& other) const { return values == other.values; }
    bool operator!=(const EnumTable& other) const { return !(*this == other); }
};

// Order in which category quotas are filled
constexpr std::array<BuildingCategory, kBuildingCategoryCount> kCategoryOrder = {
    BuildingCategory::Civic,
    BuildingCategory::Commercial,
    BuildingCategory::Residential,
    BuildingCategory::Industrial,
    BuildingCategory::Agricultural,
    BuildingCategory::Infrastructure,
};

const char* getSettlementSizeName(SettlementSize size);
const char* getLayoutTypeName(LayoutType layout);
const char* getRoadClassName(RoadClass road);
const char* getBuildingCategoryName(BuildingCategory category);
const char* getBuildingSubtypeName(BuildingSubtype subtype);
const char* getLegacyBuildingTypeName(LegacyBuildingType type);

std::optional<SettlementSize> parseSettlementSize(std::string_view name);
std::optional<LayoutType> parseLayoutType(std::string_view name);
std::optional<RoadClass> parseRoadClass(std::string_view name);
std::optional<BuildingCategory> parseBuildingCategory(std::string_view name);
std::optional<BuildingSubtype> parseBuildingSubtype(std::string_view name);

// Category a subtype belongs to
BuildingCategory getSubtypeCategory(BuildingSubtype subtype);

// Placement priority: 3 for anchors, 2 for notable buildings, 1 otherwise
int getPlacementPriority(BuildingSubtype subtype);

LegacyBuildingType getLegacyBuildingType(BuildingCategory category, BuildingSubtype subtype);

} // namespace settlegen
