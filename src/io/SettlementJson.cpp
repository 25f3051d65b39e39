#include "settlegen/io/SettlementJson.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <fstream>

namespace settlegen {
namespace io {

namespace {

nlohmann::json pointToJson(const glm::vec2& p) {
    return {p.x, p.y};
}

nlohmann::json streetToJson(const Street& street) {
    nlohmann::json points = nlohmann::json::array();
    for (const auto& p : street.points) {
        points.push_back(pointToJson(p));
    }

    nlohmann::json j;
    j["id"] = street.id;
    j["type"] = getRoadClassName(street.roadClass);
    j["width"] = street.width;
    j["points"] = points;
    return j;
}

nlohmann::json buildingToJson(const Building& b) {
    nlohmann::json j;
    j["position"] = pointToJson(b.position);
    j["width"] = b.width;
    j["depth"] = b.depth;
    j["height"] = b.height;
    j["rotation"] = b.rotation;
    j["category"] = getBuildingCategoryName(b.category);
    j["subtype"] = getBuildingSubtypeName(b.subtype);
    j["type"] = getLegacyBuildingTypeName(b.legacyType);
    j["floors"] = b.floors;
    j["garrison_capacity"] = b.garrisonCapacity;
    j["defense_bonus"] = b.defenseBonus;
    j["stealth_bonus"] = b.stealthBonus;
    j["settlement_id"] = b.settlementId;
    return j;
}

} // namespace

nlohmann::json settlementToJson(const Settlement& s) {
    nlohmann::json j;
    j["id"] = s.id;
    j["name"] = s.name;
    j["size"] = getSettlementSizeName(s.size);
    j["layout"] = getLayoutTypeName(s.layoutType);
    j["position"] = pointToJson(s.position);
    j["focal_point"] = pointToJson(s.focalPoint);
    j["radius"] = s.radius;
    j["bounds"] = {{"min_x", s.bounds.minX}, {"max_x", s.bounds.maxX},
                   {"min_z", s.bounds.minZ}, {"max_z", s.bounds.maxZ}};
    j["main_axis"] = s.mainAxis;
    j["density"] = s.density;

    nlohmann::json entries = nlohmann::json::array();
    for (const auto& e : s.entryPoints) {
        entries.push_back({{"position", pointToJson(e.position)},
                           {"direction", e.direction},
                           {"type", getRoadClassName(e.roadClass)}});
    }
    j["entry_points"] = entries;

    nlohmann::json streets = nlohmann::json::array();
    for (const auto& street : s.streets) {
        streets.push_back(streetToJson(street));
    }
    j["streets"] = streets;

    nlohmann::json buildings = nlohmann::json::array();
    for (const auto& b : s.buildings) {
        buildings.push_back(buildingToJson(b));
    }
    j["buildings"] = buildings;

    nlohmann::json quotas = nlohmann::json::object();
    for (BuildingCategory category : kCategoryOrder) {
        quotas[getBuildingCategoryName(category)] = s.quotas[category];
    }

    j["stats"] = {
        {"target_buildings", s.targetBuildingCount},
        {"placed_buildings", s.buildings.size()},
        {"placement_failures", s.placementFailures},
        {"quotas", quotas},
    };
    return j;
}

nlohmann::json settlementsToJson(const std::vector<Settlement>& settlements) {
    nlohmann::json j;
    j["version"] = 1;

    nlohmann::json list = nlohmann::json::array();
    for (const auto& s : settlements) {
        list.push_back(settlementToJson(s));
    }
    j["settlements"] = list;
    return j;
}

bool saveSettlements(const std::string& path, const std::vector<Settlement>& settlements) {
    std::ofstream file(path);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to write settlements: %s", path.c_str());
        return false;
    }

    file << settlementsToJson(settlements).dump(2);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to write settlements: %s", path.c_str());
        return false;
    }

    SDL_Log("Saved %zu settlements to: %s", settlements.size(), path.c_str());
    return true;
}

} // namespace io
} // namespace settlegen
