#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// grid cell coordinates (row down, col right, origin top left)
struct GridPos {
    size_t row = 0;
    size_t col = 0;

    bool operator==(const GridPos& other) const {
        return row == other.row && col == other.col;
    }

    bool operator!=(const GridPos& other) const {
        return !(*this == other);
    }

    // needed so frontier entries holding nodes can be totally ordered
    bool operator<(const GridPos& other) const {
        if (row != other.row) return row < other.row;
        return col < other.col;
    }
};

// hash function for GridPos (for use in unordered_map/set)
struct GridPosHash {
    size_t operator()(const GridPos& pos) const {
        return std::hash<size_t>()(pos.row) ^ (std::hash<size_t>()(pos.col) << 16);
    }
};

// compass direction of travel
enum class Direction : uint8_t {
    North,
    East,
    South,
    West
};

Direction opposite(Direction d);
int rowDelta(Direction d);
int colDelta(Direction d);
const char* directionName(Direction d);

// thrown when puzzle text is not a rectangular block of digits
class GridFormatError : public std::runtime_error {
public:
    explicit GridFormatError(const std::string& what) : std::runtime_error(what) {}
};

// immutable rectangular grid of per cell entry costs (0-9)
class CostGrid {
public:
    static CostGrid parse(const std::string& text);
    static CostGrid loadFromFile(const std::string& path);

    size_t height() const { return height_; }
    size_t width() const { return width_; }

    bool inBounds(const GridPos& pos) const {
        return pos.row < height_ && pos.col < width_;
    }

    // cost of entering the cell, throws std::out_of_range off the grid
    uint32_t costAt(const GridPos& pos) const;

    // the cell one step away in the given direction, if it is on the grid
    std::optional<GridPos> neighbour(const GridPos& pos, Direction d) const;

    // bottom right corner, the goal of every search
    GridPos target() const { return {height_ - 1, width_ - 1}; }

private:
    CostGrid(size_t height, size_t width, std::vector<uint8_t> costs);

    size_t getIndex(const GridPos& pos) const { return pos.row * width_ + pos.col; }

    size_t height_, width_;
    std::vector<uint8_t> costs_;  // row major
};
