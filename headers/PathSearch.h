#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "CostGrid.h"
#include "HeuristicTable.h"
#include "MovementPolicy.h"
#include "SolverSettings.h"

// result of a constrained search
struct SearchResult {
    std::optional<uint32_t> totalCost;   // cheapest total cost, absent if the target is unreachable
    std::vector<GridPos> path;           // the path from start to target (empty when unreachable)
    int nodesExpanded = 0;               // number of frontier entries popped
    double computeTimeMs = 0.0;          // time taken to compute path in milliseconds
    std::string policyName;              // which movement rules were used

    bool found() const { return totalCost.has_value(); }
};

// one frontier slot: f = g + h, g, node
struct FrontierEntry {
    uint32_t priority;
    uint32_t cost;
    CrucibleNode node;
};

// min heap ordering for std::priority_queue (returns true when a pops after b)
struct FrontierOrder {
    SolverSettings::TieBreak tieBreak = SolverSettings::TieBreak::LowestCostFirst;

    bool operator()(const FrontierEntry& a, const FrontierEntry& b) const {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.cost != b.cost) {
            return tieBreak == SolverSettings::TieBreak::LowestCostFirst ? a.cost > b.cost : a.cost < b.cost;
        }
        return b.node < a.node;
    }
};

/**
 * A* over CrucibleNodes, with the movement rules supplied by a MovementPolicy
 * the grid and the heuristic table are only read, so one PathSearch can run any
 * number of searches (with different policies) back to back
 */
class PathSearch {
public:
    PathSearch(const CostGrid& grid, const HeuristicTable& heuristic);

    // cheapest cost from start to the heuristic table's target
    SearchResult findCheapestPath(const MovementPolicy& policy, const GridPos& start,
                                  SolverSettings::TieBreak tieBreak = SolverSettings::TieBreak::LowestCostFirst) const;

private:
    const CostGrid& grid_;
    const HeuristicTable& heuristic_;

    // walk the parent map back from the accepted node to the start node
    std::vector<GridPos> reconstructPath(
        const std::unordered_map<CrucibleNode, CrucibleNode, CrucibleNodeHash>& cameFrom,
        const CrucibleNode& start, const CrucibleNode& goal) const;
};
