#include <doctest/doctest.h>

#include "BruteForce.h"
#include "CostGrid.h"
#include "HeuristicTable.h"
#include "MovementPolicy.h"
#include "TestGrids.h"

TEST_CASE("HeuristicTable/SmallGridByHand") {
    // 1 9
    // 1 1    cheapest way in from the top left goes down then right
    CostGrid grid = CostGrid::parse("19\n11\n");
    HeuristicTable table(grid, grid.target());

    CHECK(table.at({1, 1}) == 0u);
    CHECK(table.at({0, 1}) == 1u);
    CHECK(table.at({1, 0}) == 1u);
    CHECK(table.at({0, 0}) == 2u);
    CHECK(table.getCellsSettled() == 4);
}

TEST_CASE("HeuristicTable/SingleCell") {
    CostGrid grid = CostGrid::parse("7");
    HeuristicTable table(grid, grid.target());

    CHECK(table.at({0, 0}) == 0u);
    CHECK(table.isReachable({0, 0}));
}

TEST_CASE("HeuristicTable/TargetMustBeOnGrid") {
    CostGrid grid = CostGrid::parse("12\n34\n");
    const GridPos outside{5, 5};
    CHECK_THROWS_AS(HeuristicTable(grid, outside), std::out_of_range);
}

TEST_CASE("HeuristicTable/MatchesUnconstrainedShortestPaths") {
    for (const std::string& text : {test_grids::EXAMPLE, test_grids::CORRIDOR}) {
        CostGrid grid = CostGrid::parse(text);
        HeuristicTable table(grid, grid.target());
        auto expected = brute_force::unconstrainedCostToTarget(grid, grid.target());

        for (size_t row = 0; row < grid.height(); ++row) {
            for (size_t col = 0; col < grid.width(); ++col) {
                CHECK(table.at({row, col}) == expected[row][col]);
            }
        }
    }
}

TEST_CASE("HeuristicTable/NonDefaultTarget") {
    CostGrid grid = CostGrid::parse("123\n456\n789\n");
    HeuristicTable table(grid, GridPos{0, 0});

    CHECK(table.target() == GridPos{0, 0});
    CHECK(table.at({0, 0}) == 0u);
    CHECK(table.at({0, 1}) == 1u);       // enter the 1
    CHECK(table.at({0, 2}) == 3u);       // 2 then 1
    CHECK(table.at({2, 2}) == 12u);  // 6, 3, 2, 1 along the right edge and top row
}

TEST_CASE("HeuristicTable/AdmissibleForBothPolicies") {
    CostGrid grid = CostGrid::parse(test_grids::EXAMPLE);
    HeuristicTable table(grid, grid.target());
    BoundedRunPolicy bounded;
    MinimumRunPolicy minimum;

    for (size_t row = 0; row < grid.height(); ++row) {
        for (size_t col = 0; col < grid.width(); ++col) {
            GridPos cell{row, col};

            auto boundedCost = brute_force::cheapestCost(grid, bounded, cell, grid.target());
            REQUIRE(boundedCost.has_value());
            CHECK(table.at(cell) <= *boundedCost);

            auto minimumCost = brute_force::cheapestCost(grid, minimum, cell, grid.target());
            if (minimumCost) {
                CHECK(table.at(cell) <= *minimumCost);
            }
        }
    }
}
