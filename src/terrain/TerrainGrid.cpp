#include "settlegen/terrain/TerrainGrid.h"
#include <algorithm>
#include <cmath>

namespace settlegen {
namespace terrain {

TerrainGrid TerrainGrid::centered(float width, float height, float size) {
    TerrainGrid grid;
    grid.cellSize = size;
    grid.columns = static_cast<uint32_t>(std::ceil(width / size));
    grid.rows = static_cast<uint32_t>(std::ceil(height / size));
    grid.origin = glm::vec2(-width * 0.5f, -height * 0.5f);
    grid.cells.assign(static_cast<size_t>(grid.columns) * grid.rows, TerrainCell{});
    return grid;
}

TerrainCell* TerrainGrid::cell(uint32_t column, uint32_t row) {
    if (column >= columns || row >= rows) return nullptr;
    size_t index = static_cast<size_t>(row) * columns + column;
    if (index >= cells.size()) return nullptr;
    return &cells[index];
}

const TerrainCell* TerrainGrid::cell(uint32_t column, uint32_t row) const {
    if (column >= columns || row >= rows) return nullptr;
    size_t index = static_cast<size_t>(row) * columns + column;
    if (index >= cells.size()) return nullptr;
    return &cells[index];
}

const TerrainCell* TerrainGrid::cellAt(const glm::vec2& world) const {
    if (empty()) return nullptr;

    float gx = (world.x - origin.x) / cellSize;
    float gz = (world.y - origin.y) / cellSize;
    if (!std::isfinite(gx) || !std::isfinite(gz)) return nullptr;
    if (gx < 0.0f || gz < 0.0f) return nullptr;
    if (gx >= static_cast<float>(columns) || gz >= static_cast<float>(rows)) return nullptr;

    return cell(static_cast<uint32_t>(gx), static_cast<uint32_t>(gz));
}

float TerrainGrid::elevationAt(const glm::vec2& world) const {
    if (empty()) return 0.0f;

    float gx = (world.x - origin.x) / cellSize;
    float gz = (world.y - origin.y) / cellSize;
    if (!std::isfinite(gx) || !std::isfinite(gz)) return 0.0f;

    // Clamping the coordinate matches clamping the indices and keeps the casts in range
    gx = std::clamp(gx, 0.0f, static_cast<float>(columns - 1));
    gz = std::clamp(gz, 0.0f, static_cast<float>(rows - 1));

    int x0 = static_cast<int>(std::floor(gx));
    int z0 = static_cast<int>(std::floor(gz));
    float fx = gx - static_cast<float>(x0);
    float fz = gz - static_cast<float>(z0);

    auto clampX = [this](int x) { return static_cast<uint32_t>(std::clamp(x, 0, static_cast<int>(columns) - 1)); };
    auto clampZ = [this](int z) { return static_cast<uint32_t>(std::clamp(z, 0, static_cast<int>(rows) - 1)); };

    float e00 = cell(clampX(x0), clampZ(z0))->elevation;
    float e10 = cell(clampX(x0 + 1), clampZ(z0))->elevation;
    float e01 = cell(clampX(x0), clampZ(z0 + 1))->elevation;
    float e11 = cell(clampX(x0 + 1), clampZ(z0 + 1))->elevation;

    float e0 = e00 * (1.0f - fx) + e10 * fx;
    float e1 = e01 * (1.0f - fx) + e11 * fx;
    return e0 * (1.0f - fz) + e1 * fz;
}

bool TerrainGrid::isWater(const glm::vec2& world) const {
    const TerrainCell* c = cellAt(world);
    return c && (c->type == TerrainType::Water || c->type == TerrainType::River);
}

bool TerrainGrid::isBlocked(const glm::vec2& world, float steepHillElevation) const {
    const TerrainCell* c = cellAt(world);
    if (!c) return false;
    if (c->type == TerrainType::Water || c->type == TerrainType::River) return true;
    return c->type == TerrainType::Hill && c->elevation > steepHillElevation;
}

void TerrainGrid::paintCircle(const glm::vec2& center, float radius, TerrainType type, float elevation) {
    for (uint32_t row = 0; row < rows; ++row) {
        for (uint32_t column = 0; column < columns; ++column) {
            glm::vec2 cellCenter = origin + (glm::vec2(column, row) + 0.5f) * cellSize;
            if (glm::length(cellCenter - center) <= radius) {
                if (TerrainCell* c = cell(column, row)) {
                    c->type = type;
                    c->elevation = elevation;
                }
            }
        }
    }
}

} // namespace terrain
} // namespace settlegen
