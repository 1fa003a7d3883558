#include "MovementPolicy.h"

NodeExpansion MovementPolicy::expand(const CrucibleNode& node, const CostGrid& grid) const {
    NodeExpansion successors;
    const Direction directions[] = {Direction::North, Direction::East, Direction::South, Direction::West};

    for (size_t i = 0; i < 4; i++) {
        Direction d = directions[i];

        std::optional<GridPos> nextPos = grid.neighbour(node.pos, d);
        if (!nextPos) continue;                        // off the grid
        if (d == opposite(node.direction)) continue;   // no 180 degree reversals

        std::optional<uint8_t> run = nextRun(node, d);
        if (!run) continue;                            // run length rule says no

        successors[i] = CrucibleNode{*nextPos, d, *run};
    }

    return successors;
}

CrucibleNode BoundedRunPolicy::initialNode(const GridPos& start) const {
    return {start, Direction::South, MAX_RUN};
}

bool BoundedRunPolicy::canStop(const CrucibleNode&) const {
    return true;
}

std::optional<uint8_t> BoundedRunPolicy::nextRun(const CrucibleNode& node, Direction d) const {
    if (d == node.direction) {
        if (node.run == 0) return std::nullopt;  // straight run used up
        return static_cast<uint8_t>(node.run - 1);
    }
    return TURN_REFILL;
}

CrucibleNode MinimumRunPolicy::initialNode(const GridPos& start) const {
    return {start, Direction::South, 0};
}

bool MinimumRunPolicy::canStop(const CrucibleNode& node) const {
    return node.run >= MIN_RUN;
}

std::optional<uint8_t> MinimumRunPolicy::nextRun(const CrucibleNode& node, Direction d) const {
    // run == 0 only on the start node, which may go any (non reversing) way
    bool atStart = node.run == 0;

    if (d == node.direction) {
        if (node.run >= MAX_RUN && !atStart) return std::nullopt;
        return static_cast<uint8_t>(node.run + 1);
    }

    if (node.run < MIN_RUN && !atStart) return std::nullopt;
    return static_cast<uint8_t>(1);
}
