#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include "CostGrid.h"
#include "HeuristicTable.h"

// a search state: where the crucible is, which way it was moving to get there
// and how its current straight run looks. the meaning of run is owned by the policy
struct CrucibleNode {
    GridPos pos;
    Direction direction = Direction::South;
    uint8_t run = 0;

    bool operator==(const CrucibleNode& other) const {
        return pos == other.pos && direction == other.direction && run == other.run;
    }

    bool operator!=(const CrucibleNode& other) const {
        return !(*this == other);
    }

    // required for priority queue tie breaks between equal (priority, cost) entries
    bool operator<(const CrucibleNode& other) const {
        if (pos != other.pos) return pos < other.pos;
        if (direction != other.direction) return direction < other.direction;
        return run < other.run;
    }
};

struct CrucibleNodeHash {
    size_t operator()(const CrucibleNode& node) const {
        size_t h = GridPosHash()(node.pos);
        return h ^ (static_cast<size_t>(node.direction) << 24) ^ (static_cast<size_t>(node.run) << 28);
    }
};

// successors in North, East, South, West order; empty slot = move not allowed
using NodeExpansion = std::array<std::optional<CrucibleNode>, 4>;

/**
 * movement rules plugged into the A* engine
 * a policy decides the start state, which moves are legal from a node and
 * whether a node standing on the target is allowed to finish there
 */
class MovementPolicy {
public:
    virtual ~MovementPolicy() = default;

    virtual const char* name() const = 0;

    // start facing South: this only rules out an initial move North, which would
    // leave the grid anyway when the start is the top left corner. it is NOT a valid
    // rule for arbitrary start cells
    virtual CrucibleNode initialNode(const GridPos& start) const = 0;

    virtual bool canStop(const CrucibleNode& node) const = 0;

    NodeExpansion expand(const CrucibleNode& node, const CostGrid& grid) const;

    uint32_t heuristic(const CrucibleNode& node, const HeuristicTable& table) const {
        return table.at(node.pos);
    }

protected:
    // run state after moving one step in the given direction, nullopt if the rules forbid it.
    // bounds and 180 degree reversals are already filtered by expand()
    virtual std::optional<uint8_t> nextRun(const CrucibleNode& node, Direction d) const = 0;
};

// normal crucible: at most MAX_RUN straight steps, then it has to turn
class BoundedRunPolicy : public MovementPolicy {
public:
    static constexpr uint8_t MAX_RUN = 3;
    static constexpr uint8_t TURN_REFILL = MAX_RUN - 1;  // the turning step itself uses one

    const char* name() const override { return "bounded run"; }
    CrucibleNode initialNode(const GridPos& start) const override;
    bool canStop(const CrucibleNode& node) const override;

protected:
    std::optional<uint8_t> nextRun(const CrucibleNode& node, Direction d) const override;
};

// ultra crucible: at least MIN_RUN straight steps before turning or stopping,
// never more than MAX_RUN
class MinimumRunPolicy : public MovementPolicy {
public:
    static constexpr uint8_t MIN_RUN = 4;
    static constexpr uint8_t MAX_RUN = 10;

    const char* name() const override { return "minimum run"; }
    CrucibleNode initialNode(const GridPos& start) const override;
    bool canStop(const CrucibleNode& node) const override;

protected:
    std::optional<uint8_t> nextRun(const CrucibleNode& node, Direction d) const override;
};
