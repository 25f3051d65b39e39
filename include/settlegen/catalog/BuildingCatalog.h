#pragma once

#include "settlegen/catalog/CatalogTypes.h"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace settlegen {

struct FloatRange {
    float min = 0.0f;
    float max = 0.0f;

    bool operator==(const FloatRange& o) const { return min == o.min && max == o.max; }
};

struct IntRange {
    int min = 0;
    int max = 0;

    bool operator==(const IntRange& o) const { return min == o.min && max == o.max; }
};

struct BuildingSpec {
    BuildingCategory category = BuildingCategory::Residential;
    BuildingSubtype subtype = BuildingSubtype::House;
    float width = 8.0f;         // Along the frontage
    float depth = 8.0f;         // Away from the frontage
    IntRange floors{1, 1};
    uint8_t allowedMask = 0;    // Bit per SettlementSize

    bool allowedIn(SettlementSize size) const {
        return (allowedMask & (1u << static_cast<unsigned>(size))) != 0;
    }

    float area() const { return width * depth; }

    bool operator==(const BuildingSpec& o) const {
        return category == o.category && subtype == o.subtype && width == o.width &&
               depth == o.depth && floors == o.floors && allowedMask == o.allowedMask;
    }
};

struct LayoutWeights {
    float organic = 1.0f;
    float grid = 1.0f;
    float mixed = 1.0f;

    bool operator==(const LayoutWeights& o) const {
        return organic == o.organic && grid == o.grid && mixed == o.mixed;
    }
};

// Per-size generation parameters
struct SettlementParams {
    FloatRange radius{20.0f, 30.0f};
    IntRange buildingCount{3, 6};
    LayoutWeights layoutWeights;
    IntRange roadConnections{1, 2};

    bool operator==(const SettlementParams& o) const {
        return radius == o.radius && buildingCount == o.buildingCount &&
               layoutWeights == o.layoutWeights && roadConnections == o.roadConnections;
    }
};

// Category -> fraction-of-target range
using Composition = EnumTable<BuildingCategory, FloatRange>;

/**
 * BuildingCatalog - Read-only building specs and per-size tables
 *
 * Built once (in code or from JSON) and validated at load time; the
 * generator never mutates it.
 */
class BuildingCatalog {
public:
    static BuildingCatalog builtin();

    // Returns nullopt (and logs) on malformed or invalid data
    static std::optional<BuildingCatalog> fromJson(const nlohmann::json& j);
    static std::optional<BuildingCatalog> loadFromFile(const std::string& path);

    nlohmann::json toJson() const;

    const std::vector<BuildingSpec>& specs() const { return specs_; }
    const SettlementParams& params(SettlementSize size) const { return params_[size]; }
    const Composition& composition(SettlementSize size) const { return composition_[size]; }
    float roadWidth(RoadClass road) const { return roadWidths_[road]; }

    const BuildingSpec* findSpec(BuildingSubtype subtype) const;

    // Specs of a category legal in the given size, in catalog order
    std::vector<const BuildingSpec*> eligibleSpecs(BuildingCategory category, SettlementSize size) const;

    // Empty string when valid, otherwise the first problem found
    std::string validate() const;

    bool operator==(const BuildingCatalog& o) const {
        return specs_ == o.specs_ && params_ == o.params_ &&
               composition_ == o.composition_ && roadWidths_ == o.roadWidths_;
    }

    void setSpecs(std::vector<BuildingSpec> specs) { specs_ = std::move(specs); }
    void setParams(SettlementSize size, const SettlementParams& p) { params_[size] = p; }
    void setComposition(SettlementSize size, const Composition& c) { composition_[size] = c; }
    void setRoadWidth(RoadClass road, float width) { roadWidths_[road] = width; }

private:
    std::vector<BuildingSpec> specs_;
    EnumTable<SettlementSize, SettlementParams> params_;
    EnumTable<SettlementSize, Composition> composition_;
    EnumTable<RoadClass, float> roadWidths_;
};

// Bit mask helper for BuildingSpec::allowedMask
constexpr uint8_t sizeBit(SettlementSize size) {
    return static_cast<uint8_t>(1u << static_cast<unsigned>(size));
}

} // namespace settlegen
