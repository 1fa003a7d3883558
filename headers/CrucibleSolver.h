#pragma once
#include <string>
#include "CostGrid.h"
#include "HeuristicTable.h"
#include "PathSearch.h"
#include "SolverSettings.h"

// a puzzle map ready to be solved: the cost grid plus its heuristic table towards
// the bottom right corner. every search starts at the top left corner
class CrucibleSolver {
public:
    explicit CrucibleSolver(CostGrid grid);

    // throws GridFormatError on malformed text
    static CrucibleSolver fromText(const std::string& text);
    static CrucibleSolver fromFile(const std::string& path);

    // part 1 and part 2 of the puzzle
    SearchResult solveBoundedRun(SolverSettings::TieBreak tieBreak = SolverSettings::TieBreak::LowestCostFirst) const;
    SearchResult solveMinimumRun(SolverSettings::TieBreak tieBreak = SolverSettings::TieBreak::LowestCostFirst) const;

    // generic dispatcher
    SearchResult solve(SolverSettings::Policy policy,
                       SolverSettings::TieBreak tieBreak = SolverSettings::TieBreak::LowestCostFirst) const;

    const CostGrid& grid() const { return grid_; }
    const HeuristicTable& heuristic() const { return heuristic_; }

private:
    CostGrid grid_;
    HeuristicTable heuristic_;  // built from grid_, so declared after it
};
