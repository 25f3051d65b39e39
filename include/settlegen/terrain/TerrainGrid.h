#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace settlegen {
namespace terrain {

enum class TerrainType : uint8_t {
    Road = 0,
    Field,
    Forest,
    Building,
    River,
    Hill,
    Water
};

enum class CoverType : uint8_t {
    None = 0,
    Light,
    Heavy,
    Full
};

struct TerrainCell {
    TerrainType type = TerrainType::Field;
    float elevation = 0.0f;
    CoverType cover = CoverType::None;
};

/**
 * TerrainGrid - Read-only view of the map's cell grid
 *
 * Cells are row-major (row = world Z, column = world X). `origin` is the
 * world position of the corner of cell (0, 0). An empty grid answers every
 * query with "open ground".
 */
struct TerrainGrid {
    std::vector<TerrainCell> cells;
    uint32_t columns = 0;
    uint32_t rows = 0;
    float cellSize = 4.0f;
    glm::vec2 origin{0.0f};

    // Grid covering [-width/2, width/2] x [-height/2, height/2], all fields
    static TerrainGrid centered(float width, float height, float cellSize);

    // Also true when the cell vector is shorter than columns * rows
    bool empty() const {
        return cells.empty() || columns == 0 || rows == 0 || !(cellSize > 0.0f) ||
               cells.size() < static_cast<size_t>(columns) * rows;
    }

    TerrainCell* cell(uint32_t column, uint32_t row);
    const TerrainCell* cell(uint32_t column, uint32_t row) const;

    // nullptr outside the grid
    const TerrainCell* cellAt(const glm::vec2& world) const;

    // Bilinear, indices clamped to the grid; 0 for an empty grid
    float elevationAt(const glm::vec2& world) const;

    bool isWater(const glm::vec2& world) const;

    // Water, river, or a hill cell above the steep threshold
    bool isBlocked(const glm::vec2& world, float steepHillElevation) const;

    // Paint every cell whose center lies inside the circle
    void paintCircle(const glm::vec2& center, float radius, TerrainType type, float elevation);
};

} // namespace terrain
} // namespace settlegen
