#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <limits>

#include "settlegen/terrain/TerrainGrid.h"

using namespace settlegen::terrain;

TEST_SUITE("TerrainGrid") {
    TEST_CASE("centered grid covers the requested extent") {
        TerrainGrid grid = TerrainGrid::centered(400.0f, 200.0f, 4.0f);
        CHECK(grid.columns == 100);
        CHECK(grid.rows == 50);
        CHECK(grid.origin.x == doctest::Approx(-200.0f));
        CHECK(grid.origin.y == doctest::Approx(-100.0f));
        CHECK_FALSE(grid.empty());
    }

    TEST_CASE("cellAt maps world positions to cells") {
        TerrainGrid grid = TerrainGrid::centered(40.0f, 40.0f, 4.0f);
        grid.cell(5, 5)->type = TerrainType::Forest;

        // Cell (5, 5) spans world [0, 4) on both axes
        const TerrainCell* c = grid.cellAt(glm::vec2(1.0f, 3.0f));
        REQUIRE(c != nullptr);
        CHECK(c->type == TerrainType::Forest);

        CHECK(grid.cellAt(glm::vec2(-25.0f, 0.0f)) == nullptr);
        CHECK(grid.cellAt(glm::vec2(0.0f, 25.0f)) == nullptr);
    }

    TEST_CASE("out of range cell lookups return nullptr") {
        TerrainGrid grid = TerrainGrid::centered(8.0f, 8.0f, 4.0f);
        CHECK(grid.cell(2, 0) == nullptr);
        CHECK(grid.cell(0, 2) == nullptr);
    }

    TEST_CASE("empty grid never blocks") {
        TerrainGrid grid;
        CHECK(grid.empty());
        CHECK(grid.cellAt(glm::vec2(0.0f)) == nullptr);
        CHECK(grid.elevationAt(glm::vec2(3.0f, 4.0f)) == doctest::Approx(0.0f));
        CHECK_FALSE(grid.isWater(glm::vec2(0.0f)));
        CHECK_FALSE(grid.isBlocked(glm::vec2(0.0f), 8.0f));
    }

    TEST_CASE("elevation is bilinear between cells") {
        TerrainGrid grid = TerrainGrid::centered(8.0f, 4.0f, 4.0f);
        grid.cell(0, 0)->elevation = 0.0f;
        grid.cell(1, 0)->elevation = 10.0f;

        // Sample positions are in cell units from the origin corner
        CHECK(grid.elevationAt(grid.origin + glm::vec2(0.0f, 0.0f)) == doctest::Approx(0.0f));
        CHECK(grid.elevationAt(grid.origin + glm::vec2(2.0f, 0.0f)) == doctest::Approx(5.0f));
        CHECK(grid.elevationAt(grid.origin + glm::vec2(4.0f, 0.0f)) == doctest::Approx(10.0f));
        // Clamped past the far edge
        CHECK(grid.elevationAt(grid.origin + glm::vec2(100.0f, 0.0f)) == doctest::Approx(10.0f));
    }

    TEST_CASE("water and river block, hills block only when steep") {
        TerrainGrid grid = TerrainGrid::centered(40.0f, 40.0f, 4.0f);
        grid.cell(0, 0)->type = TerrainType::Water;
        grid.cell(1, 0)->type = TerrainType::River;
        grid.cell(2, 0)->type = TerrainType::Hill;
        grid.cell(2, 0)->elevation = 12.0f;
        grid.cell(3, 0)->type = TerrainType::Hill;
        grid.cell(3, 0)->elevation = 4.0f;
        grid.cell(4, 0)->type = TerrainType::Forest;

        auto center = [&](uint32_t column) {
            return grid.origin + glm::vec2((column + 0.5f) * grid.cellSize, 0.5f * grid.cellSize);
        };

        CHECK(grid.isWater(center(0)));
        CHECK(grid.isWater(center(1)));
        CHECK_FALSE(grid.isWater(center(2)));

        CHECK(grid.isBlocked(center(0), 8.0f));
        CHECK(grid.isBlocked(center(1), 8.0f));
        CHECK(grid.isBlocked(center(2), 8.0f));
        CHECK_FALSE(grid.isBlocked(center(3), 8.0f));
        CHECK_FALSE(grid.isBlocked(center(4), 8.0f));
    }

    TEST_CASE("paintCircle marks cells inside the radius") {
        TerrainGrid grid = TerrainGrid::centered(100.0f, 100.0f, 4.0f);
        grid.paintCircle(glm::vec2(20.0f, 0.0f), 10.0f, TerrainType::Water, 0.0f);
        CHECK(grid.isWater(glm::vec2(20.0f, 0.0f)));
        CHECK(grid.isWater(glm::vec2(26.0f, 2.0f)));
        CHECK_FALSE(grid.isWater(glm::vec2(0.0f, 0.0f)));
        CHECK_FALSE(grid.isWater(glm::vec2(20.0f, 20.0f)));
    }

    TEST_CASE("grid with fewer cells than columns x rows is treated as empty") {
        TerrainGrid grid;
        grid.columns = 100;
        grid.rows = 100;
        grid.cellSize = 4.0f;
        grid.cells.resize(10, TerrainCell{TerrainType::Water, 0.0f, CoverType::None});

        CHECK(grid.empty());
        CHECK(grid.cell(50, 50) == nullptr);
        CHECK(grid.cell(5, 0) != nullptr);
        CHECK(grid.cellAt(glm::vec2(200.0f, 200.0f)) == nullptr);
        CHECK_FALSE(grid.isWater(glm::vec2(1.0f, 1.0f)));
        CHECK_FALSE(grid.isBlocked(glm::vec2(399.0f, 399.0f), 8.0f));
        CHECK(grid.elevationAt(glm::vec2(200.0f, 200.0f)) == doctest::Approx(0.0f));

        grid.paintCircle(glm::vec2(200.0f, 200.0f), 50.0f, TerrainType::Hill, 20.0f);
        CHECK(grid.cells.size() == 10);
    }

    TEST_CASE("non-finite and far away positions are outside the grid") {
        TerrainGrid grid = TerrainGrid::centered(40.0f, 40.0f, 4.0f);
        grid.paintCircle(glm::vec2(0.0f), 100.0f, TerrainType::Water, 5.0f);

        const float nan = std::numeric_limits<float>::quiet_NaN();
        const float inf = std::numeric_limits<float>::infinity();

        CHECK(grid.cellAt(glm::vec2(nan, 0.0f)) == nullptr);
        CHECK(grid.cellAt(glm::vec2(0.0f, inf)) == nullptr);
        CHECK(grid.cellAt(glm::vec2(1e20f, 0.0f)) == nullptr);
        CHECK(grid.cellAt(glm::vec2(0.0f, 1e12f)) == nullptr);
        CHECK_FALSE(grid.isWater(glm::vec2(nan, nan)));
        CHECK_FALSE(grid.isBlocked(glm::vec2(1e20f, 1e20f), 8.0f));

        CHECK(grid.elevationAt(glm::vec2(nan, 0.0f)) == doctest::Approx(0.0f));
        CHECK(grid.elevationAt(glm::vec2(1e20f, -1e20f)) == doctest::Approx(5.0f));
    }
}
