#include "PathSearch.h"
#include <algorithm>
#include <chrono>
#include <queue>
#include <unordered_set>

PathSearch::PathSearch(const CostGrid& grid, const HeuristicTable& heuristic)
    : grid_(grid), heuristic_(heuristic) {}

SearchResult PathSearch::findCheapestPath(const MovementPolicy& policy, const GridPos& start,
                                          SolverSettings::TieBreak tieBreak) const {
    auto startTime = std::chrono::high_resolution_clock::now();

    SearchResult result;
    result.policyName = policy.name();

    const GridPos target = heuristic_.target();
    if (!grid_.inBounds(start) || !heuristic_.isReachable(start)) {
        return result;
    }

    std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, FrontierOrder> frontier(FrontierOrder{tieBreak});
    std::unordered_set<CrucibleNode, CrucibleNodeHash> visited;                       // fully expanded nodes
    std::unordered_map<CrucibleNode, uint32_t, CrucibleNodeHash> bestCost;            // g score per node
    std::unordered_map<CrucibleNode, CrucibleNode, CrucibleNodeHash> cameFrom;        // parent pointers

    const CrucibleNode startNode = policy.initialNode(start);
    frontier.push({policy.heuristic(startNode, heuristic_), 0, startNode});
    bestCost[startNode] = 0;

    // main A* loop: pop lowest f score node, accept it or expand it
    while (!frontier.empty()) {
        FrontierEntry current = frontier.top();
        frontier.pop();
        result.nodesExpanded++;

        if (current.node.pos == target && policy.canStop(current.node)) {
            result.totalCost = current.cost;
            result.path = reconstructPath(cameFrom, startNode, current.node);
            break;
        }

        if (visited.count(current.node)) {
            continue;  // stale entry, this node was already expanded at a lower cost
        }

        for (const std::optional<CrucibleNode>& next : policy.expand(current.node, grid_)) {
            if (!next) continue;

            uint32_t h = policy.heuristic(*next, heuristic_);
            if (h == HeuristicTable::UNREACHABLE) continue;  // target can't be reached from there at all

            uint32_t newCost = current.cost + grid_.costAt(next->pos);

            // only a strict improvement is worth another frontier entry
            auto it = bestCost.find(*next);
            if (it != bestCost.end() && it->second <= newCost) {
                continue;
            }
            bestCost[*next] = newCost;
            cameFrom[*next] = current.node;
            frontier.push({newCost + h, newCost, *next});
        }

        visited.insert(current.node);
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    result.computeTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    return result;
}

std::vector<GridPos> PathSearch::reconstructPath(
    const std::unordered_map<CrucibleNode, CrucibleNode, CrucibleNodeHash>& cameFrom,
    const CrucibleNode& start, const CrucibleNode& goal) const {

    std::vector<GridPos> path;
    CrucibleNode current = goal;

    // walking backwards through the parent map from goal toward start
    while (current != start) {
        path.push_back(current.pos);
        auto it = cameFrom.find(current);
        if (it == cameFrom.end()) break;  // only the start node lacks a parent
        current = it->second;
    }
    path.push_back(start.pos);

    // built goal->start so flip it to start->goal
    std::reverse(path.begin(), path.end());
    return path;
}
