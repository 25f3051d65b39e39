#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <vector>

#include "settlegen/io/SettlementJson.h"
#include "settlegen/layout/SettlementGenerator.h"

using namespace settlegen;

namespace fs = std::filesystem;

namespace {

Settlement makeTown(uint32_t seed) {
    SettlementGenerator generator(seed);
    SettlementRequest request;
    request.size = SettlementSize::Town;
    request.layout = LayoutType::Grid;
    request.position = glm::vec2(12.0f, -8.0f);
    return generator.generate(request);
}

} // namespace

TEST_SUITE("SettlementJson") {
    TEST_CASE("settlement fields are exported") {
        Settlement s = makeTown(42);
        nlohmann::json j = io::settlementToJson(s);

        CHECK(j["id"] == s.id);
        CHECK(j["name"] == s.name);
        CHECK(j["size"] == "town");
        CHECK(j["layout"] == "grid");
        CHECK(j["position"][0].get<float>() == doctest::Approx(12.0f));
        CHECK(j["position"][1].get<float>() == doctest::Approx(-8.0f));
        CHECK(j["radius"].get<float>() == doctest::Approx(s.radius));
        CHECK(j["bounds"]["min_x"].get<float>() == doctest::Approx(s.bounds.minX));
        CHECK(j["bounds"]["max_z"].get<float>() == doctest::Approx(s.bounds.maxZ));
        CHECK(j["main_axis"].get<float>() == doctest::Approx(s.mainAxis));

        CHECK(j["entry_points"].size() == s.entryPoints.size());
        CHECK(j["streets"].size() == s.streets.size());
        CHECK(j["buildings"].size() == s.buildings.size());

        CHECK(j["stats"]["target_buildings"] == s.targetBuildingCount);
        CHECK(j["stats"]["placed_buildings"] == s.buildings.size());
        CHECK(j["stats"]["placement_failures"] == s.placementFailures);
        CHECK(j["stats"]["quotas"]["residential"] == s.quotas[BuildingCategory::Residential]);
        CHECK(j["stats"]["quotas"].size() == kBuildingCategoryCount);
    }

    TEST_CASE("streets and buildings carry their details") {
        Settlement s = makeTown(42);
        nlohmann::json j = io::settlementToJson(s);

        REQUIRE_FALSE(s.streets.empty());
        const nlohmann::json& street = j["streets"][0];
        CHECK(street["id"] == s.streets[0].id);
        CHECK(street["type"] == getRoadClassName(s.streets[0].roadClass));
        CHECK(street["points"].size() == s.streets[0].points.size());

        REQUIRE_FALSE(s.buildings.empty());
        const nlohmann::json& focal = j["buildings"][0];
        CHECK(focal["subtype"] == "town_hall");
        CHECK(focal["category"] == "civic");
        CHECK(focal["type"] == "house");
        CHECK(focal["settlement_id"] == s.id);
        CHECK(focal["floors"] == s.buildings[0].floors);
        CHECK(focal["garrison_capacity"] == s.buildings[0].garrisonCapacity);
        CHECK(focal.contains("defense_bonus"));
        CHECK(focal.contains("stealth_bonus"));
    }

    TEST_CASE("collection is versioned") {
        std::vector<Settlement> settlements = {makeTown(1), makeTown(2)};
        nlohmann::json j = io::settlementsToJson(settlements);
        CHECK(j["version"] == 1);
        REQUIRE(j["settlements"].size() == 2);

        nlohmann::json empty = io::settlementsToJson({});
        CHECK(empty["settlements"].is_array());
        CHECK(empty["settlements"].empty());
    }

    TEST_CASE("save writes parseable JSON") {
        std::vector<Settlement> settlements = {makeTown(5)};
        fs::path path = fs::temp_directory_path() / "settlegen_test_settlements.json";

        REQUIRE(io::saveSettlements(path.string(), settlements));

        std::ifstream file(path);
        REQUIRE(file.good());
        nlohmann::json loaded = nlohmann::json::parse(file);
        CHECK(loaded == io::settlementsToJson(settlements));

        file.close();
        fs::remove(path);
    }

    TEST_CASE("save reports an unwritable path") {
        fs::path path = fs::temp_directory_path() / "settlegen_missing_dir" / "nested" / "out.json";
        CHECK_FALSE(io::saveSettlements(path.string(), {}));
    }
}
