#pragma once
#include <cstdint>
#include <limits>
#include <vector>
#include "CostGrid.h"

/**
 * lower bound on the cost from every cell to a fixed target
 * computed with a single backwards dijkstra pass that ignores run length rules,
 * so it never overestimates the constrained cost (admissible for A*)
 */
class HeuristicTable {
public:
    static constexpr uint32_t UNREACHABLE = std::numeric_limits<uint32_t>::max();

    HeuristicTable(const CostGrid& grid, const GridPos& target);

    uint32_t at(const GridPos& pos) const { return costToTarget_[pos.row * width_ + pos.col]; }
    bool isReachable(const GridPos& pos) const { return at(pos) != UNREACHABLE; }

    const GridPos& target() const { return target_; }
    int getCellsSettled() const { return cellsSettled_; }

private:
    size_t width_;
    GridPos target_;
    std::vector<uint32_t> costToTarget_;  // row major, UNREACHABLE until settled
    int cellsSettled_ = 0;
};
