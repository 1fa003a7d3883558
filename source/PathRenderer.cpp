#include "PathRenderer.h"
#include <algorithm>
#include <iostream>

sf::Color PathRenderer::heatColor(uint32_t cost)
{
    float intensity = std::min(1.0f, static_cast<float>(cost) / 9.0f);

    return sf::Color(
        static_cast<uint8_t>(40 + 215 * intensity),
        static_cast<uint8_t>(10 + 90 * intensity),
        static_cast<uint8_t>(10),
        255);
}

void PathRenderer::fillCell(sf::Image &image, const GridPos &pos, unsigned int cellSize, const sf::Color &color,
                            unsigned int inset)
{
    // keep at least one pixel even when the inset would swallow the whole cell
    if (inset * 2 >= cellSize)
        inset = 0;

    unsigned int left = static_cast<unsigned int>(pos.col) * cellSize;
    unsigned int top = static_cast<unsigned int>(pos.row) * cellSize;

    for (unsigned int y = top + inset; y < top + cellSize - inset; ++y)
    {
        for (unsigned int x = left + inset; x < left + cellSize - inset; ++x)
        {
            image.setPixel(sf::Vector2u(x, y), color);
        }
    }
}

sf::Image PathRenderer::render(const CostGrid &grid, const std::vector<RenderedPath> &paths, unsigned int cellSize)
{
    cellSize = std::max(1u, cellSize);
    sf::Image image(sf::Vector2u(static_cast<unsigned int>(grid.width()) * cellSize,
                                 static_cast<unsigned int>(grid.height()) * cellSize),
                    sf::Color::Black);

    for (size_t row = 0; row < grid.height(); ++row)
    {
        for (size_t col = 0; col < grid.width(); ++col)
        {
            GridPos pos{row, col};
            fillCell(image, pos, cellSize, heatColor(grid.costAt(pos)));
        }
    }

    // paths are drawn slightly inset so the heat colour stays visible as a border
    unsigned int pathInset = cellSize / 4;
    for (const RenderedPath &path : paths)
    {
        for (const GridPos &pos : path.cells)
        {
            if (grid.inBounds(pos))
                fillCell(image, pos, cellSize, path.color, pathInset);
        }
    }

    fillCell(image, GridPos{0, 0}, cellSize, START_COLOR, pathInset);
    fillCell(image, grid.target(), cellSize, TARGET_COLOR, pathInset);

    return image;
}

bool PathRenderer::saveImage(const sf::Image &image, const std::string &filename)
{
    if (!image.saveToFile(filename))
    {
        std::cerr << "Error: Could not save path image: " << filename << std::endl;
        return false;
    }

    std::cout << "Saved path image to " << filename << " (" << image.getSize().x << "x" << image.getSize().y
              << ")" << std::endl;
    return true;
}

std::string PathRenderer::renderText(const CostGrid &grid, const std::vector<GridPos> &path)
{
    std::vector<std::string> rows(grid.height(), std::string(grid.width(), '0'));
    for (size_t row = 0; row < grid.height(); ++row)
    {
        for (size_t col = 0; col < grid.width(); ++col)
        {
            rows[row][col] = static_cast<char>('0' + grid.costAt(GridPos{row, col}));
        }
    }

    // the start cell keeps its digit, every later cell shows how it was entered
    for (size_t i = 1; i < path.size(); ++i)
    {
        const GridPos &from = path[i - 1];
        const GridPos &to = path[i];
        if (!grid.inBounds(to))
            continue;

        char arrow = '?';
        if (to.row > from.row)
            arrow = 'v';
        else if (to.row < from.row)
            arrow = '^';
        else if (to.col > from.col)
            arrow = '>';
        else if (to.col < from.col)
            arrow = '<';
        rows[to.row][to.col] = arrow;
    }

    std::string text;
    for (const std::string &row : rows)
    {
        text += row;
        text += '\n';
    }
    return text;
}
