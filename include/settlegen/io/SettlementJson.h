#pragma once

#include "settlegen/layout/Settlement.h"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace settlegen {
namespace io {

nlohmann::json settlementToJson(const Settlement& settlement);

// {"version": 1, "settlements": [...]}
nlohmann::json settlementsToJson(const std::vector<Settlement>& settlements);

bool saveSettlements(const std::string& path, const std::vector<Settlement>& settlements);

} // namespace io
} // namespace settlegen
