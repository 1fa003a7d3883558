#include "CrucibleSolver.h"
#include "MovementPolicy.h"
#include <utility>

CrucibleSolver::CrucibleSolver(CostGrid grid)
    : grid_(std::move(grid)), heuristic_(grid_, grid_.target()) {}

CrucibleSolver CrucibleSolver::fromText(const std::string& text) {
    return CrucibleSolver(CostGrid::parse(text));
}

CrucibleSolver CrucibleSolver::fromFile(const std::string& path) {
    return CrucibleSolver(CostGrid::loadFromFile(path));
}

SearchResult CrucibleSolver::solveBoundedRun(SolverSettings::TieBreak tieBreak) const {
    return solve(SolverSettings::Policy::BoundedRun, tieBreak);
}

SearchResult CrucibleSolver::solveMinimumRun(SolverSettings::TieBreak tieBreak) const {
    return solve(SolverSettings::Policy::MinimumRun, tieBreak);
}

SearchResult CrucibleSolver::solve(SolverSettings::Policy policy, SolverSettings::TieBreak tieBreak) const {
    PathSearch search(grid_, heuristic_);
    const GridPos start{0, 0};

    switch (policy) {
        case SolverSettings::Policy::BoundedRun:
            return search.findCheapestPath(BoundedRunPolicy(), start, tieBreak);
        case SolverSettings::Policy::MinimumRun:
            return search.findCheapestPath(MinimumRunPolicy(), start, tieBreak);
    }
    // unreachable for valid enum values, fall back to part 1 rules
    return search.findCheapestPath(BoundedRunPolicy(), start, tieBreak);
}
