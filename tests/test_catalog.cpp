#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <string>

#include "settlegen/catalog/BuildingCatalog.h"

using namespace settlegen;

TEST_SUITE("CatalogTypes") {
    TEST_CASE("names round-trip through parse") {
        for (size_t i = 0; i < kBuildingSubtypeCount; ++i) {
            auto subtype = static_cast<BuildingSubtype>(i);
            auto parsed = parseBuildingSubtype(getBuildingSubtypeName(subtype));
            REQUIRE(parsed.has_value());
            CHECK(*parsed == subtype);
        }
        for (size_t i = 0; i < kSettlementSizeCount; ++i) {
            auto size = static_cast<SettlementSize>(i);
            CHECK(parseSettlementSize(getSettlementSizeName(size)) == size);
        }
    }

    TEST_CASE("unknown names are rejected") {
        CHECK_FALSE(parseBuildingSubtype("spaceport").has_value());
        CHECK_FALSE(parseSettlementSize("metropolis").has_value());
        CHECK_FALSE(parseLayoutType("").has_value());
        CHECK_FALSE(parseRoadClass("Highway").has_value());
    }

    TEST_CASE("subtype categories") {
        CHECK(getSubtypeCategory(BuildingSubtype::Tenement) == BuildingCategory::Residential);
        CHECK(getSubtypeCategory(BuildingSubtype::Skyscraper) == BuildingCategory::Commercial);
        CHECK(getSubtypeCategory(BuildingSubtype::PowerPlant) == BuildingCategory::Industrial);
        CHECK(getSubtypeCategory(BuildingSubtype::Chapel) == BuildingCategory::Civic);
        CHECK(getSubtypeCategory(BuildingSubtype::SiloCluster) == BuildingCategory::Agricultural);
        CHECK(getSubtypeCategory(BuildingSubtype::WaterTower) == BuildingCategory::Infrastructure);
    }

    TEST_CASE("placement priority tiers") {
        CHECK(getPlacementPriority(BuildingSubtype::Cathedral) == 3);
        CHECK(getPlacementPriority(BuildingSubtype::Factory) == 3);
        CHECK(getPlacementPriority(BuildingSubtype::MarketHall) == 2);
        CHECK(getPlacementPriority(BuildingSubtype::TrainStation) == 2);
        CHECK(getPlacementPriority(BuildingSubtype::House) == 1);
        CHECK(getPlacementPriority(BuildingSubtype::Barn) == 1);
    }

    TEST_CASE("legacy building types") {
        CHECK(getLegacyBuildingType(BuildingCategory::Residential, BuildingSubtype::House) == LegacyBuildingType::House);
        CHECK(getLegacyBuildingType(BuildingCategory::Agricultural, BuildingSubtype::Barn) == LegacyBuildingType::House);
        CHECK(getLegacyBuildingType(BuildingCategory::Civic, BuildingSubtype::Church) == LegacyBuildingType::Church);
        CHECK(getLegacyBuildingType(BuildingCategory::Civic, BuildingSubtype::TownHall) == LegacyBuildingType::House);
        CHECK(getLegacyBuildingType(BuildingCategory::Industrial, BuildingSubtype::Mill) == LegacyBuildingType::Factory);
        CHECK(getLegacyBuildingType(BuildingCategory::Commercial, BuildingSubtype::Skyscraper) == LegacyBuildingType::Factory);
        CHECK(getLegacyBuildingType(BuildingCategory::Commercial, BuildingSubtype::Shop) == LegacyBuildingType::Shop);
    }
}

TEST_SUITE("BuildingCatalog") {
    TEST_CASE("builtin catalog is valid") {
        BuildingCatalog catalog = BuildingCatalog::builtin();
        CHECK(catalog.validate().empty());
        CHECK(catalog.specs().size() == kBuildingSubtypeCount);
    }

    TEST_CASE("every focal subtype is present and allowed where it is used") {
        BuildingCatalog catalog = BuildingCatalog::builtin();
        const BuildingSpec* cathedral = catalog.findSpec(BuildingSubtype::Cathedral);
        const BuildingSpec* chapel = catalog.findSpec(BuildingSubtype::Chapel);
        REQUIRE(cathedral != nullptr);
        REQUIRE(chapel != nullptr);
        CHECK(cathedral->allowedIn(SettlementSize::City));
        CHECK(chapel->allowedIn(SettlementSize::Hamlet));
        CHECK(catalog.findSpec(BuildingSubtype::TownHall) != nullptr);
        CHECK(catalog.findSpec(BuildingSubtype::Church) != nullptr);
    }

    TEST_CASE("eligibleSpecs filters by category and size") {
        BuildingCatalog catalog = BuildingCatalog::builtin();
        auto specs = catalog.eligibleSpecs(BuildingCategory::Commercial, SettlementSize::Hamlet);
        REQUIRE_FALSE(specs.empty());
        for (const BuildingSpec* spec : specs) {
            CHECK(spec->category == BuildingCategory::Commercial);
            CHECK(spec->allowedIn(SettlementSize::Hamlet));
        }

        bool hasSkyscraper = false;
        for (const BuildingSpec* spec : catalog.eligibleSpecs(BuildingCategory::Commercial, SettlementSize::City)) {
            if (spec->subtype == BuildingSubtype::Skyscraper) hasSkyscraper = true;
        }
        CHECK(hasSkyscraper);
    }

    TEST_CASE("road widths order highway > town > dirt") {
        BuildingCatalog catalog = BuildingCatalog::builtin();
        CHECK(catalog.roadWidth(RoadClass::Highway) > catalog.roadWidth(RoadClass::Town));
        CHECK(catalog.roadWidth(RoadClass::Town) > catalog.roadWidth(RoadClass::Dirt));
    }

    TEST_CASE("toJson and fromJson reproduce the builtin tables") {
        BuildingCatalog catalog = BuildingCatalog::builtin();
        auto loaded = BuildingCatalog::fromJson(catalog.toJson());
        REQUIRE(loaded.has_value());
        CHECK(*loaded == catalog);
    }

    TEST_CASE("shipped data file matches the builtin tables") {
        auto loaded = BuildingCatalog::loadFromFile(std::string(SETTLEGEN_DATA_DIR) + "/building_catalog.json");
        REQUIRE(loaded.has_value());
        CHECK(*loaded == BuildingCatalog::builtin());
    }

    TEST_CASE("missing file returns nullopt") {
        CHECK_FALSE(BuildingCatalog::loadFromFile("/nonexistent/catalog.json").has_value());
    }

    TEST_CASE("unknown keys are rejected at load time") {
        nlohmann::json j = BuildingCatalog::builtin().toJson();

        SUBCASE("top level") {
            j["colour"] = "red";
        }
        SUBCASE("building entry") {
            j["buildings"][0]["roof"] = "thatch";
        }
        SUBCASE("unknown subtype") {
            j["buildings"][0]["subtype"] = "spaceport";
        }
        SUBCASE("unknown size in allowed_in") {
            j["buildings"][0]["allowed_in"].push_back("metropolis");
        }
        SUBCASE("unknown composition category") {
            j["settlements"]["town"]["composition"]["military"] = {0.0, 0.1};
        }

        CHECK_FALSE(BuildingCatalog::fromJson(j).has_value());
    }

    TEST_CASE("invalid tables are rejected") {
        nlohmann::json j = BuildingCatalog::builtin().toJson();

        SUBCASE("non-residential maxima above one") {
            j["settlements"]["village"]["composition"]["commercial"] = {0.5, 0.9};
        }
        SUBCASE("inverted percentage") {
            j["settlements"]["city"]["composition"]["civic"] = {0.2, 0.1};
        }
        SUBCASE("zero road connections") {
            j["settlements"]["hamlet"]["road_connections"] = {0, 2};
        }
        SUBCASE("non-positive radius") {
            j["settlements"]["town"]["radius"] = {0.0, 50.0};
        }
        SUBCASE("subtype under the wrong category") {
            j["buildings"][0]["category"] = "industrial";
        }
        SUBCASE("zero floors") {
            j["buildings"][0]["floors"] = 0;
        }
        SUBCASE("negative footprint") {
            j["buildings"][0]["footprint"] = {-4.0, 8.0};
        }

        CHECK_FALSE(BuildingCatalog::fromJson(j).has_value());
    }

    TEST_CASE("integer floors expand to a fixed range") {
        nlohmann::json j = BuildingCatalog::builtin().toJson();
        j["buildings"][0]["floors"] = 2;
        auto loaded = BuildingCatalog::fromJson(j);
        REQUIRE(loaded.has_value());
        CHECK(loaded->specs()[0].floors == IntRange{2, 2});
    }

    TEST_CASE("validate reports the first problem") {
        BuildingCatalog catalog = BuildingCatalog::builtin();
        catalog.setRoadWidth(RoadClass::Dirt, 0.0f);
        CHECK(catalog.validate().find("dirt") != std::string::npos);
    }
}
