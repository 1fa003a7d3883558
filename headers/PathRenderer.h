#pragma once
#include <SFML/Graphics.hpp>
#include <string>
#include <vector>
#include "CostGrid.h"

// one path to draw on top of the heat map
struct RenderedPath
{
    std::vector<GridPos> cells;
    sf::Color color;
};

class PathRenderer
{
public:
    // colours used for the start and target markers
    static constexpr sf::Color START_COLOR = sf::Color(255, 255, 255);
    static constexpr sf::Color TARGET_COLOR = sf::Color(255, 215, 0);

    // heat map of the grid costs (cellSize x cellSize pixels per cell) with each
    // path painted over it, later paths drawn on top of earlier ones
    static sf::Image render(const CostGrid &grid, const std::vector<RenderedPath> &paths, unsigned int cellSize);

    static bool saveImage(const sf::Image &image, const std::string &filename);

    // the grid as text with every step of the path replaced by an arrow (> < ^ v)
    static std::string renderText(const CostGrid &grid, const std::vector<GridPos> &path);

    // dark for cheap cells, bright orange for expensive ones
    static sf::Color heatColor(uint32_t cost);

private:
    static void fillCell(sf::Image &image, const GridPos &pos, unsigned int cellSize, const sf::Color &color,
                         unsigned int inset = 0);
};
