#include "settlegen/catalog/BuildingCatalog.h"
#include <sstream>

namespace settlegen {

namespace {

constexpr uint8_t H = sizeBit(SettlementSize::Hamlet);
constexpr uint8_t V = sizeBit(SettlementSize::Village);
constexpr uint8_t T = sizeBit(SettlementSize::Town);
constexpr uint8_t C = sizeBit(SettlementSize::City);

BuildingSpec makeSpec(BuildingSubtype subtype, float width, float depth,
                      int minFloors, int maxFloors, uint8_t allowed) {
    BuildingSpec spec;
    spec.category = getSubtypeCategory(subtype);
    spec.subtype = subtype;
    spec.width = width;
    spec.depth = depth;
    spec.floors = {minFloors, maxFloors};
    spec.allowedMask = allowed;
    return spec;
}

Composition makeComposition(FloatRange residential, FloatRange commercial, FloatRange industrial,
                            FloatRange civic, FloatRange agricultural, FloatRange infrastructure) {
    Composition c;
    c[BuildingCategory::Residential] = residential;
    c[BuildingCategory::Commercial] = commercial;
    c[BuildingCategory::Industrial] = industrial;
    c[BuildingCategory::Civic] = civic;
    c[BuildingCategory::Agricultural] = agricultural;
    c[BuildingCategory::Infrastructure] = infrastructure;
    return c;
}

} // namespace

BuildingCatalog BuildingCatalog::builtin() {
    using S = BuildingSubtype;
    BuildingCatalog catalog;

    catalog.specs_ = {
        // Residential
        makeSpec(S::House,           9.0f,  8.0f,  1, 2,  H | V | T | C),
        makeSpec(S::Cottage,         7.0f,  6.0f,  1, 1,  H | V | T),
        makeSpec(S::RowHouse,        6.0f,  10.0f, 2, 3,  T | C),
        makeSpec(S::Apartment,       16.0f, 12.0f, 3, 5,  T | C),
        makeSpec(S::Villa,           14.0f, 12.0f, 2, 2,  V | T | C),
        makeSpec(S::Tenement,        12.0f, 10.0f, 3, 4,  C),

        // Commercial
        makeSpec(S::Shop,            8.0f,  8.0f,  1, 2,  V | T | C),
        makeSpec(S::Inn,             12.0f, 10.0f, 2, 2,  H | V | T),
        makeSpec(S::MarketHall,      20.0f, 14.0f, 1, 1,  T | C),
        makeSpec(S::Bank,            14.0f, 12.0f, 2, 2,  T | C),
        makeSpec(S::OfficeBuilding,  18.0f, 14.0f, 4, 6,  C),
        makeSpec(S::DepartmentStore, 24.0f, 18.0f, 3, 3,  C),
        makeSpec(S::Skyscraper,      20.0f, 20.0f, 10, 20, C),

        // Industrial
        makeSpec(S::Workshop,        10.0f, 8.0f,  1, 1,  V | T | C),
        makeSpec(S::Warehouse,       20.0f, 14.0f, 1, 1,  T | C),
        makeSpec(S::Mill,            12.0f, 10.0f, 2, 2,  H | V | T),
        makeSpec(S::Factory,         28.0f, 20.0f, 2, 2,  T | C),
        makeSpec(S::PowerPlant,      30.0f, 24.0f, 2, 2,  C),

        // Civic
        makeSpec(S::Chapel,          10.0f, 7.0f,  1, 1,  H | V),
        makeSpec(S::Church,          20.0f, 12.0f, 1, 1,  V | T | C),
        makeSpec(S::Cathedral,       34.0f, 20.0f, 1, 1,  C),
        makeSpec(S::TownHall,        18.0f, 14.0f, 2, 2,  T | C),
        makeSpec(S::School,          18.0f, 12.0f, 2, 2,  V | T | C),
        makeSpec(S::Hospital,        26.0f, 18.0f, 3, 3,  T | C),
        makeSpec(S::PoliceStation,   14.0f, 12.0f, 2, 2,  T | C),
        makeSpec(S::ClockTower,      6.0f,  6.0f,  1, 1,  T | C),

        // Agricultural
        makeSpec(S::Farmhouse,       12.0f, 10.0f, 2, 2,  H | V | T),
        makeSpec(S::Barn,            14.0f, 10.0f, 1, 1,  H | V | T),
        makeSpec(S::Stable,          10.0f, 8.0f,  1, 1,  H | V),
        makeSpec(S::Greenhouse,      12.0f, 6.0f,  1, 1,  V | T | C),
        makeSpec(S::SiloCluster,     8.0f,  8.0f,  1, 1,  H | V | T | C),

        // Infrastructure
        makeSpec(S::WaterTower,      6.0f,  6.0f,  1, 1,  V | T | C),
        makeSpec(S::PostOffice,      10.0f, 8.0f,  1, 1,  V | T | C),
        makeSpec(S::FireStation,     14.0f, 12.0f, 2, 2,  T | C),
        makeSpec(S::GasStation,      12.0f, 10.0f, 1, 1,  V | T | C),
        makeSpec(S::TrainStation,    28.0f, 12.0f, 2, 2,  T | C),
        makeSpec(S::RadioTower,      5.0f,  5.0f,  1, 1,  H | V | T | C),
    };

    SettlementParams hamlet;
    hamlet.radius = {25.0f, 40.0f};
    hamlet.buildingCount = {3, 6};
    hamlet.layoutWeights = {0.8f, 0.1f, 0.1f};
    hamlet.roadConnections = {1, 2};
    catalog.params_[SettlementSize::Hamlet] = hamlet;

    SettlementParams village;
    village.radius = {45.0f, 70.0f};
    village.buildingCount = {10, 18};
    village.layoutWeights = {0.6f, 0.25f, 0.15f};
    village.roadConnections = {2, 3};
    catalog.params_[SettlementSize::Village] = village;

    SettlementParams town;
    town.radius = {75.0f, 110.0f};
    town.buildingCount = {22, 40};
    town.layoutWeights = {0.35f, 0.4f, 0.25f};
    town.roadConnections = {3, 4};
    catalog.params_[SettlementSize::Town] = town;

    SettlementParams city;
    city.radius = {110.0f, 160.0f};
    city.buildingCount = {45, 80};
    city.layoutWeights = {0.25f, 0.4f, 0.35f};
    city.roadConnections = {4, 6};
    catalog.params_[SettlementSize::City] = city;

    //                                      residential     commercial      industrial      civic           agricultural    infrastructure
    catalog.composition_[SettlementSize::Hamlet] =
        makeComposition({0.55f, 0.75f}, {0.0f, 0.1f},   {0.0f, 0.1f},   {0.0f, 0.1f},   {0.15f, 0.3f},  {0.0f, 0.05f});
    catalog.composition_[SettlementSize::Village] =
        makeComposition({0.5f, 0.65f},  {0.08f, 0.15f}, {0.03f, 0.08f}, {0.05f, 0.1f},  {0.08f, 0.15f}, {0.02f, 0.06f});
    catalog.composition_[SettlementSize::Town] =
        makeComposition({0.4f, 0.55f},  {0.15f, 0.25f}, {0.06f, 0.12f}, {0.05f, 0.1f},  {0.02f, 0.06f}, {0.04f, 0.08f});
    catalog.composition_[SettlementSize::City] =
        makeComposition({0.35f, 0.5f},  {0.2f, 0.3f},   {0.08f, 0.14f}, {0.05f, 0.08f}, {0.0f, 0.02f},  {0.05f, 0.1f});

    catalog.roadWidths_[RoadClass::Town] = 6.0f;
    catalog.roadWidths_[RoadClass::Highway] = 10.0f;
    catalog.roadWidths_[RoadClass::Dirt] = 4.0f;

    return catalog;
}

const BuildingSpec* BuildingCatalog::findSpec(BuildingSubtype subtype) const {
    for (const auto& spec : specs_) {
        if (spec.subtype == subtype) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<const BuildingSpec*> BuildingCatalog::eligibleSpecs(BuildingCategory category,
                                                                SettlementSize size) const {
    std::vector<const BuildingSpec*> result;
    for (const auto& spec : specs_) {
        if (spec.category == category && spec.allowedIn(size)) {
            result.push_back(&spec);
        }
    }
    return result;
}

std::string BuildingCatalog::validate() const {
    std::ostringstream err;

    for (const auto& spec : specs_) {
        const char* name = getBuildingSubtypeName(spec.subtype);
        if (getSubtypeCategory(spec.subtype) != spec.category) {
            err << "spec '" << name << "' listed under category '"
                << getBuildingCategoryName(spec.category) << "'";
            return err.str();
        }
        if (!(spec.width > 0.0f) || !(spec.depth > 0.0f)) {
            err << "spec '" << name << "' has a non-positive footprint";
            return err.str();
        }
        if (spec.floors.min < 1 || spec.floors.max < spec.floors.min) {
            err << "spec '" << name << "' has an invalid floor range";
            return err.str();
        }
    }

    for (size_t s = 0; s < kSettlementSizeCount; ++s) {
        auto size = static_cast<SettlementSize>(s);
        const char* sizeName = getSettlementSizeName(size);
        const SettlementParams& p = params_[size];

        if (!(p.radius.min > 0.0f) || p.radius.max < p.radius.min) {
            err << "size '" << sizeName << "' has an invalid radius range";
            return err.str();
        }
        if (p.buildingCount.min < 0 || p.buildingCount.max < p.buildingCount.min) {
            err << "size '" << sizeName << "' has an invalid building count range";
            return err.str();
        }
        if (p.roadConnections.min < 1 || p.roadConnections.max < p.roadConnections.min) {
            err << "size '" << sizeName << "' has an invalid road connection range";
            return err.str();
        }
        if (p.layoutWeights.organic < 0.0f || p.layoutWeights.grid < 0.0f || p.layoutWeights.mixed < 0.0f) {
            err << "size '" << sizeName << "' has a negative layout weight";
            return err.str();
        }

        // Residential absorbs the rounding remainder, so the others must leave room
        float otherMax = 0.0f;
        for (size_t c = 0; c < kBuildingCategoryCount; ++c) {
            auto category = static_cast<BuildingCategory>(c);
            const FloatRange& r = composition_[size][category];
            if (r.min < 0.0f || r.max > 1.0f || r.max < r.min) {
                err << "size '" << sizeName << "' has an invalid '"
                    << getBuildingCategoryName(category) << "' percentage";
                return err.str();
            }
            if (category != BuildingCategory::Residential) {
                otherMax += r.max;
            }
        }
        if (otherMax > 1.0f + 1e-4f) {
            err << "size '" << sizeName << "' non-residential maxima exceed 100%";
            return err.str();
        }
    }

    for (size_t r = 0; r < kRoadClassCount; ++r) {
        auto road = static_cast<RoadClass>(r);
        if (!(roadWidths_[road] > 0.0f)) {
            err << "road class '" << getRoadClassName(road) << "' has a non-positive width";
            return err.str();
        }
    }

    return {};
}

} // namespace settlegen
