#include <doctest/doctest.h>

#include "CostGrid.h"
#include "TestGrids.h"

#include <cstdio>
#include <fstream>
#include <stdexcept>

TEST_CASE("CostGrid/ParsesExample") {
    CostGrid grid = CostGrid::parse(test_grids::EXAMPLE);

    CHECK(grid.height() == 13u);
    CHECK(grid.width() == 13u);
    CHECK(grid.costAt({0, 0}) == 2u);
    CHECK(grid.costAt({0, 1}) == 4u);
    CHECK(grid.costAt({1, 0}) == 3u);
    CHECK(grid.costAt({12, 12}) == 3u);
    CHECK(grid.target() == GridPos{12, 12});
}

TEST_CASE("CostGrid/TrailingNewlineIsOptional") {
    CostGrid with = CostGrid::parse("123\n456\n");
    CostGrid without = CostGrid::parse("123\n456");

    CHECK(with.height() == 2u);
    CHECK(without.height() == 2u);
    CHECK(with.width() == 3u);
    CHECK(without.costAt({1, 2}) == 6u);
}

TEST_CASE("CostGrid/ZeroCostCellsAreValid") {
    CostGrid grid = CostGrid::parse("00\n09");
    CHECK(grid.costAt({0, 0}) == 0u);
    CHECK(grid.costAt({1, 1}) == 9u);
}

TEST_CASE("CostGrid/RejectsMalformedInput") {
    SUBCASE("empty") {
        CHECK_THROWS_AS(CostGrid::parse(""), GridFormatError);
        CHECK_THROWS_AS(CostGrid::parse("\n"), GridFormatError);
    }
    SUBCASE("ragged rows") {
        CHECK_THROWS_AS(CostGrid::parse("123\n45\n"), GridFormatError);
        CHECK_THROWS_AS(CostGrid::parse("12\n345"), GridFormatError);
    }
    SUBCASE("blank row") {
        CHECK_THROWS_AS(CostGrid::parse("12\n\n34\n"), GridFormatError);
        CHECK_THROWS_AS(CostGrid::parse("12\n34\n\n"), GridFormatError);
    }
    SUBCASE("non digit") {
        CHECK_THROWS_AS(CostGrid::parse("12\n3x\n"), GridFormatError);
        CHECK_THROWS_AS(CostGrid::parse("12 \n345\n"), GridFormatError);
        CHECK_THROWS_AS(CostGrid::parse("12\r\n34\r\n"), GridFormatError);
    }
}

TEST_CASE("CostGrid/ErrorNamesTheRow") {
    try {
        CostGrid::parse("123\n123\n12\n");
        FAIL("expected GridFormatError");
    } catch (const GridFormatError& e) {
        CHECK(std::string(e.what()).find("row 2") != std::string::npos);
    }
}

TEST_CASE("CostGrid/Bounds") {
    CostGrid grid = CostGrid::parse("12\n34\n56\n");

    CHECK(grid.inBounds({2, 1}));
    CHECK_FALSE(grid.inBounds({3, 0}));
    CHECK_FALSE(grid.inBounds({0, 2}));
    const GridPos below{3, 0};
    CHECK_THROWS_AS(grid.costAt(below), std::out_of_range);
}

TEST_CASE("CostGrid/Neighbours") {
    CostGrid grid = CostGrid::parse("123\n456\n789\n");

    CHECK(grid.neighbour({1, 1}, Direction::North) == GridPos{0, 1});
    CHECK(grid.neighbour({1, 1}, Direction::East) == GridPos{1, 2});
    CHECK(grid.neighbour({1, 1}, Direction::South) == GridPos{2, 1});
    CHECK(grid.neighbour({1, 1}, Direction::West) == GridPos{1, 0});

    CHECK_FALSE(grid.neighbour({0, 0}, Direction::North).has_value());
    CHECK_FALSE(grid.neighbour({0, 0}, Direction::West).has_value());
    CHECK_FALSE(grid.neighbour({2, 2}, Direction::South).has_value());
    CHECK_FALSE(grid.neighbour({2, 2}, Direction::East).has_value());
}

TEST_CASE("Direction/OppositeAndDeltas") {
    CHECK(opposite(Direction::North) == Direction::South);
    CHECK(opposite(Direction::East) == Direction::West);
    CHECK(opposite(Direction::South) == Direction::North);
    CHECK(opposite(Direction::West) == Direction::East);

    CHECK(rowDelta(Direction::North) == -1);
    CHECK(colDelta(Direction::North) == 0);
    CHECK(rowDelta(Direction::East) == 0);
    CHECK(colDelta(Direction::West) == -1);
    CHECK(std::string(directionName(Direction::South)) == "South");
}

TEST_CASE("CostGrid/LoadFromFile") {
    const std::string path = "crucible_test_grid.txt";
    {
        std::ofstream out(path);
        out << "19\n11\n";
    }

    CostGrid grid = CostGrid::loadFromFile(path);
    CHECK(grid.height() == 2u);
    CHECK(grid.costAt({0, 1}) == 9u);
    std::remove(path.c_str());

    CHECK_THROWS_AS(CostGrid::loadFromFile("no/such/crucible_grid.txt"), GridFormatError);
}
