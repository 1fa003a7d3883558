#include "CostGrid.h"
#include <fstream>
#include <sstream>
#include <utility>

Direction opposite(Direction d) {
    switch (d) {
        case Direction::North: return Direction::South;
        case Direction::East:  return Direction::West;
        case Direction::South: return Direction::North;
        case Direction::West:  return Direction::East;
    }
    return d;
}

int rowDelta(Direction d) {
    switch (d) {
        case Direction::North: return -1;
        case Direction::South: return 1;
        default:               return 0;
    }
}

int colDelta(Direction d) {
    switch (d) {
        case Direction::East: return 1;
        case Direction::West: return -1;
        default:              return 0;
    }
}

const char* directionName(Direction d) {
    switch (d) {
        case Direction::North: return "North";
        case Direction::East:  return "East";
        case Direction::South: return "South";
        case Direction::West:  return "West";
    }
    return "Unknown";
}

CostGrid::CostGrid(size_t height, size_t width, std::vector<uint8_t> costs)
    : height_(height), width_(width), costs_(std::move(costs)) {}

CostGrid CostGrid::parse(const std::string& text) {
    // a single trailing newline is allowed, anything else after it is a ragged row
    std::string body = text;
    if (!body.empty() && body.back() == '\n') {
        body.pop_back();
    }
    if (body.empty()) {
        throw GridFormatError("grid input is empty");
    }

    std::vector<uint8_t> costs;
    costs.reserve(body.size());
    size_t width = 0;
    size_t row = 0;
    size_t col = 0;

    for (char ch : body) {
        if (ch == '\n') {
            if (row == 0) {
                width = col;
            } else if (col != width) {
                throw GridFormatError("row " + std::to_string(row) + " has " + std::to_string(col) +
                                      " cells, expected " + std::to_string(width));
            }
            row++;
            col = 0;
            continue;
        }
        if (ch < '0' || ch > '9') {
            std::ostringstream msg;
            msg << "invalid character 0x" << std::hex << static_cast<int>(static_cast<unsigned char>(ch))
                << std::dec << " at row " << row << ", column " << col;
            throw GridFormatError(msg.str());
        }
        costs.push_back(static_cast<uint8_t>(ch - '0'));
        col++;
    }

    // last row has no terminating newline left, close it out here
    if (row == 0) {
        width = col;
    } else if (col != width) {
        throw GridFormatError("row " + std::to_string(row) + " has " + std::to_string(col) +
                              " cells, expected " + std::to_string(width));
    }
    if (width == 0) {
        throw GridFormatError("grid rows are empty");
    }

    return CostGrid(row + 1, width, std::move(costs));
}

CostGrid CostGrid::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GridFormatError("could not open grid file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

uint32_t CostGrid::costAt(const GridPos& pos) const {
    if (!inBounds(pos)) {
        throw std::out_of_range("cell (" + std::to_string(pos.row) + ", " + std::to_string(pos.col) +
                                ") is outside the grid");
    }
    return costs_[getIndex(pos)];
}

std::optional<GridPos> CostGrid::neighbour(const GridPos& pos, Direction d) const {
    // unsigned wrap on row 0 / col 0 lands far out of bounds, so inBounds catches it
    GridPos next{pos.row + static_cast<size_t>(rowDelta(d)), pos.col + static_cast<size_t>(colDelta(d))};
    if (!inBounds(next)) {
        return std::nullopt;
    }
    return next;
}
