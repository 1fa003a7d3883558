#pragma once
#include <string>

// puzzle example maps shared by the test files
namespace test_grids
{

// 13x13 example: 102 with bounded runs, 94 with minimum runs
inline const std::string EXAMPLE =
    "2413432311323\n"
    "3215453535623\n"
    "3255245654254\n"
    "3446585845452\n"
    "4546657867536\n"
    "1438598798454\n"
    "4457876987766\n"
    "3637877979653\n"
    "4654967986887\n"
    "4564679986453\n"
    "1224686865563\n"
    "2546548887735\n"
    "4322674655533\n";

// long cheap corridor along the top that the minimum run crucible has to leave
// early enough to still make 4 steps down: 71
inline const std::string CORRIDOR =
    "111111111111\n"
    "999999999991\n"
    "999999999991\n"
    "999999999991\n"
    "999999999991\n";

} // namespace test_grids
