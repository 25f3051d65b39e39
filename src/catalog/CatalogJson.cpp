#include "settlegen/catalog/BuildingCatalog.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <initializer_list>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace settlegen {

namespace {

// Unknown keys are a load-time error, not silently ignored
void requireKnownKeys(const json& obj, std::initializer_list<const char*> known, const std::string& where) {
    if (!obj.is_object()) {
        throw std::runtime_error(where + ": expected an object");
    }
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        bool found = false;
        for (const char* k : known) {
            if (it.key() == k) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw std::runtime_error(where + ": unknown key '" + it.key() + "'");
        }
    }
}

FloatRange readFloatRange(const json& j, const std::string& where) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error(where + ": expected [min, max]");
    }
    return {j[0].get<float>(), j[1].get<float>()};
}

IntRange readIntRange(const json& j, const std::string& where) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error(where + ": expected [min, max]");
    }
    return {j[0].get<int>(), j[1].get<int>()};
}

template <typename Enum>
Enum readEnum(const json& j, std::optional<Enum> (*parse)(std::string_view), const std::string& where) {
    std::string name = j.get<std::string>();
    auto value = parse(name);
    if (!value) {
        throw std::runtime_error(where + ": unknown value '" + name + "'");
    }
    return *value;
}

BuildingSpec readSpec(const json& j, size_t index) {
    std::string where = "buildings[" + std::to_string(index) + "]";
    requireKnownKeys(j, {"category", "subtype", "footprint", "floors", "allowed_in"}, where);

    BuildingSpec spec;
    spec.category = readEnum<BuildingCategory>(j.at("category"), parseBuildingCategory, where + ".category");
    spec.subtype = readEnum<BuildingSubtype>(j.at("subtype"), parseBuildingSubtype, where + ".subtype");

    FloatRange footprint = readFloatRange(j.at("footprint"), where + ".footprint");
    spec.width = footprint.min;
    spec.depth = footprint.max;

    if (j.contains("floors")) {
        const json& floors = j["floors"];
        if (floors.is_number_integer()) {
            spec.floors = {floors.get<int>(), floors.get<int>()};
        } else {
            spec.floors = readIntRange(floors, where + ".floors");
        }
    }

    spec.allowedMask = 0;
    for (const auto& sizeName : j.at("allowed_in")) {
        spec.allowedMask |= sizeBit(readEnum<SettlementSize>(sizeName, parseSettlementSize, where + ".allowed_in"));
    }
    return spec;
}

json rangeToJson(const FloatRange& r) { return json::array({r.min, r.max}); }
json rangeToJson(const IntRange& r) { return json::array({r.min, r.max}); }

} // namespace

std::optional<BuildingCatalog> BuildingCatalog::fromJson(const json& j) {
    try {
        requireKnownKeys(j, {"version", "road_widths", "settlements", "buildings"}, "catalog");

        BuildingCatalog catalog;

        const json& widths = j.at("road_widths");
        requireKnownKeys(widths, {"town", "highway", "dirt"}, "road_widths");
        for (auto it = widths.begin(); it != widths.end(); ++it) {
            auto road = parseRoadClass(it.key());
            catalog.roadWidths_[*road] = it.value().get<float>();
        }

        const json& settlements = j.at("settlements");
        requireKnownKeys(settlements, {"hamlet", "village", "town", "city"}, "settlements");
        for (size_t s = 0; s < kSettlementSizeCount; ++s) {
            auto size = static_cast<SettlementSize>(s);
            std::string where = std::string("settlements.") + getSettlementSizeName(size);
            if (!settlements.contains(getSettlementSizeName(size))) {
                throw std::runtime_error(where + ": missing");
            }
            const json& sj = settlements[getSettlementSizeName(size)];
            requireKnownKeys(sj, {"radius", "building_count", "layout_weights", "road_connections", "composition"}, where);

            SettlementParams params;
            params.radius = readFloatRange(sj.at("radius"), where + ".radius");
            params.buildingCount = readIntRange(sj.at("building_count"), where + ".building_count");
            params.roadConnections = readIntRange(sj.at("road_connections"), where + ".road_connections");

            const json& weights = sj.at("layout_weights");
            requireKnownKeys(weights, {"organic", "grid", "mixed"}, where + ".layout_weights");
            params.layoutWeights.organic = weights.value("organic", 0.0f);
            params.layoutWeights.grid = weights.value("grid", 0.0f);
            params.layoutWeights.mixed = weights.value("mixed", 0.0f);
            catalog.params_[size] = params;

            // Categories left out of the table get a zero share
            Composition composition;
            const json& cj = sj.at("composition");
            if (!cj.is_object()) {
                throw std::runtime_error(where + ".composition: expected an object");
            }
            for (auto it = cj.begin(); it != cj.end(); ++it) {
                auto category = parseBuildingCategory(it.key());
                if (!category) {
                    throw std::runtime_error(where + ".composition: unknown key '" + it.key() + "'");
                }
                composition[*category] = readFloatRange(it.value(), where + ".composition." + it.key());
            }
            catalog.composition_[size] = composition;
        }

        const json& buildings = j.at("buildings");
        if (!buildings.is_array()) {
            throw std::runtime_error("buildings: expected an array");
        }
        for (size_t i = 0; i < buildings.size(); ++i) {
            catalog.specs_.push_back(readSpec(buildings[i], i));
        }

        std::string problem = catalog.validate();
        if (!problem.empty()) {
            throw std::runtime_error(problem);
        }
        return catalog;

    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "BuildingCatalog: Invalid catalog: %s", e.what());
        return std::nullopt;
    }
}

std::optional<BuildingCatalog> BuildingCatalog::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "BuildingCatalog: Could not open catalog file: %s", path.c_str());
        return std::nullopt;
    }

    json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
            "BuildingCatalog: Failed to parse catalog JSON %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }

    auto catalog = fromJson(j);
    if (catalog) {
        SDL_Log("BuildingCatalog: Loaded %zu building specs from %s", catalog->specs().size(), path.c_str());
    }
    return catalog;
}

json BuildingCatalog::toJson() const {
    json j;
    j["version"] = 1;

    json widths = json::object();
    for (size_t r = 0; r < kRoadClassCount; ++r) {
        auto road = static_cast<RoadClass>(r);
        widths[getRoadClassName(road)] = roadWidths_[road];
    }
    j["road_widths"] = widths;

    json settlements = json::object();
    for (size_t s = 0; s < kSettlementSizeCount; ++s) {
        auto size = static_cast<SettlementSize>(s);
        const SettlementParams& p = params_[size];

        json sj;
        sj["radius"] = rangeToJson(p.radius);
        sj["building_count"] = rangeToJson(p.buildingCount);
        sj["road_connections"] = rangeToJson(p.roadConnections);
        sj["layout_weights"] = {
            {"organic", p.layoutWeights.organic},
            {"grid", p.layoutWeights.grid},
            {"mixed", p.layoutWeights.mixed},
        };

        json composition = json::object();
        for (size_t c = 0; c < kBuildingCategoryCount; ++c) {
            auto category = static_cast<BuildingCategory>(c);
            composition[getBuildingCategoryName(category)] = rangeToJson(composition_[size][category]);
        }
        sj["composition"] = composition;
        settlements[getSettlementSizeName(size)] = sj;
    }
    j["settlements"] = settlements;

    json buildings = json::array();
    for (const auto& spec : specs_) {
        json bj;
        bj["category"] = getBuildingCategoryName(spec.category);
        bj["subtype"] = getBuildingSubtypeName(spec.subtype);
        bj["footprint"] = json::array({spec.width, spec.depth});
        bj["floors"] = rangeToJson(spec.floors);

        json allowed = json::array();
        for (size_t s = 0; s < kSettlementSizeCount; ++s) {
            auto size = static_cast<SettlementSize>(s);
            if (spec.allowedIn(size)) {
                allowed.push_back(getSettlementSizeName(size));
            }
        }
        bj["allowed_in"] = allowed;
        buildings.push_back(bj);
    }
    j["buildings"] = buildings;

    return j;
}

} // namespace settlegen
