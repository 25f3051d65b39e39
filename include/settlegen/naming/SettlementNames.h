#pragma once

#include "settlegen/catalog/CatalogTypes.h"
#include "settlegen/utils/SeededRandom.h"
#include <string>

namespace settlegen {
namespace naming {

// Prefix + size-specific suffix, e.g. "Oakford". Consumes two draws.
std::string generateSettlementName(utils::SeededRandom& rng, SettlementSize size);

} // namespace naming
} // namespace settlegen
