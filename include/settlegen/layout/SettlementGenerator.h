#pragma once

#include "settlegen/catalog/BuildingCatalog.h"
#include "settlegen/layout/GenerationEvents.h"
#include "settlegen/layout/GeneratorConfig.h"
#include "settlegen/layout/Settlement.h"
#include "settlegen/utils/SeededRandom.h"
#include <cstdint>
#include <utility>
#include <vector>

namespace settlegen {

/**
 * SettlementGenerator - Deterministic settlement layout synthesis
 *
 * Pipeline per generate() call: settlement shell (layout, radius, building
 * count, main axis, name), streets (not for hamlets), entry points, then
 * buildings. Identical seed and requests give identical output.
 *
 * Not thread-safe; use one generator per thread.
 */
class SettlementGenerator {
public:
    explicit SettlementGenerator(uint32_t seed,
                                 BuildingCatalog catalog = BuildingCatalog::builtin(),
                                 GeneratorConfig config = {});

    // Resets the random stream and the settlement id counter
    void reseed(uint32_t seed);

    void setEventCallback(EventCallback callback) { events_ = std::move(callback); }

    Settlement generate(const SettlementRequest& request);

    const BuildingCatalog& catalog() const { return catalog_; }
    const GeneratorConfig& config() const { return config_; }

    static std::vector<Building> flattenBuildings(const std::vector<Settlement>& settlements);
    static std::vector<Street> flattenStreets(const std::vector<Settlement>& settlements);

private:
    utils::SeededRandom rng_;
    BuildingCatalog catalog_;
    GeneratorConfig config_;
    EventCallback events_;
    uint32_t nextId_ = 0;
};

} // namespace settlegen
