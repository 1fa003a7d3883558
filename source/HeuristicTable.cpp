#include "HeuristicTable.h"
#include <functional>
#include <queue>
#include <utility>

HeuristicTable::HeuristicTable(const CostGrid& grid, const GridPos& target)
    : width_(grid.width()), target_(target),
      costToTarget_(grid.height() * grid.width(), UNREACHABLE) {
    if (!grid.inBounds(target)) {
        throw std::out_of_range("heuristic target is outside the grid");
    }

    std::vector<bool> settled(costToTarget_.size(), false);

    // priority queue: (cost, cell) - min heap by cost, duplicates allowed instead of decrease key
    using PQEntry = std::pair<uint32_t, GridPos>;
    std::priority_queue<PQEntry, std::vector<PQEntry>, std::greater<PQEntry>> frontier;

    costToTarget_[target.row * width_ + target.col] = 0;
    frontier.push({0, target});

    const Direction directions[] = {Direction::North, Direction::East, Direction::South, Direction::West};

    // walking backwards from the target: stepping from neighbour onto current
    // costs whatever it costs to enter current
    while (!frontier.empty()) {
        auto [currentCost, current] = frontier.top();
        frontier.pop();

        size_t idx = current.row * width_ + current.col;
        if (settled[idx]) {
            continue;  // stale entry, a cheaper one already settled this cell
        }
        settled[idx] = true;
        cellsSettled_++;

        uint32_t enterCost = grid.costAt(current);
        for (Direction d : directions) {
            std::optional<GridPos> next = grid.neighbour(current, d);
            if (!next) continue;

            size_t nextIdx = next->row * width_ + next->col;
            uint32_t newCost = currentCost + enterCost;
            if (!settled[nextIdx] && newCost < costToTarget_[nextIdx]) {
                costToTarget_[nextIdx] = newCost;
                frontier.push({newCost, *next});
            }
        }
    }
}
