#pragma once

#include "settlegen/layout/Settlement.h"
#include <string>
#include <vector>

// Top-down preview of generated settlements: streets, building footprints,
// entry points and labels. World X maps to SVG x, world Z to SVG y.
bool writeSettlementsSVG(
    const std::string& filename,
    const std::vector<settlegen::Settlement>& settlements,
    int outputWidth = 2048,
    int outputHeight = 2048
);
