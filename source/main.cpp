#include <SFML/Graphics.hpp>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

#include "SolverSettings.h"
#include "CrucibleSolver.h"
#include "PathRenderer.h"

namespace
{

void printUsage(const char *program)
{
    std::cerr << "usage: " << program << " <input-file> [options]\n"
              << "  --settings <file>                 load settings from a key=value file\n"
              << "  --policy both|bounded|minimum     which answers to compute (default both)\n"
              << "  --tie-break lowestCost|highestCost\n"
              << "  --render <png>                    save an image of the grid and the paths\n"
              << "  --show-path                       print the grid with the path overlaid\n"
              << "  --stats                           print nodes expanded and compute time\n"
              << "  --save-settings <file>            write the effective settings and exit\n";
}

void printResult(int part, SolverSettings::Policy policy, const SearchResult &result, const SolverSettings &settings,
                 const CostGrid &grid)
{
    std::cout << "Part " << part << " (" << SolverSettings::policyNames(policy) << "): ";
    if (result.found())
        std::cout << *result.totalCost << std::endl;
    else
        std::cout << "unreachable" << std::endl;

    if (settings.showStats)
    {
        std::cout << "  nodes expanded: " << result.nodesExpanded << " | time: " << std::fixed
                  << std::setprecision(3) << result.computeTimeMs << "ms" << std::endl;
        std::cout.unsetf(std::ios::floatfield);
    }

    if (settings.showPath && result.found())
    {
        std::cout << PathRenderer::renderText(grid, result.path);
    }
}

} // namespace

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        printUsage(argv[0]);
        return 1;
    }

    SolverSettings settings;
    std::string inputFile;
    std::string saveSettingsFile;

    // settings file first so explicit flags override it regardless of order
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--settings" && !settings.loadFromFile(argv[i + 1]))
            return 1;
    }

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--settings" && hasValue)
        {
            ++i;  // already loaded above
        }
        else if (arg == "--policy" && hasValue)
        {
            auto selection = SolverSettings::parseSelection(argv[++i]);
            if (!selection)
            {
                std::cerr << "Error: unknown policy: " << argv[i] << std::endl;
                return 1;
            }
            settings.policySelection = *selection;
        }
        else if (arg == "--tie-break" && hasValue)
        {
            auto order = SolverSettings::parseTieBreak(argv[++i]);
            if (!order)
            {
                std::cerr << "Error: unknown tie break: " << argv[i] << std::endl;
                return 1;
            }
            settings.tieBreak = *order;
        }
        else if (arg == "--render" && hasValue)
        {
            settings.renderEnabled = true;
            settings.renderFile = argv[++i];
        }
        else if (arg == "--save-settings" && hasValue)
        {
            saveSettingsFile = argv[++i];
        }
        else if (arg == "--show-path")
        {
            settings.showPath = true;
        }
        else if (arg == "--stats")
        {
            settings.showStats = true;
        }
        else if (!arg.empty() && arg[0] != '-' && inputFile.empty())
        {
            inputFile = arg;
        }
        else
        {
            std::cerr << "Error: unexpected argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }
    settings.validateAndClamp();

    if (!saveSettingsFile.empty())
        return settings.saveToFile(saveSettingsFile) ? 0 : 1;

    if (inputFile.empty())
    {
        printUsage(argv[0]);
        return 1;
    }

    try
    {
        CrucibleSolver solver = CrucibleSolver::fromFile(inputFile);
        if (settings.showStats)
        {
            std::cout << "Grid: " << solver.grid().width() << "x" << solver.grid().height()
                      << " | heuristic cells settled: " << solver.heuristic().getCellsSettled() << std::endl;
        }

        std::vector<RenderedPath> renderedPaths;
        const SolverSettings::Policy policies[] = {SolverSettings::Policy::BoundedRun,
                                                   SolverSettings::Policy::MinimumRun};
        for (int part = 1; part <= 2; ++part)
        {
            SolverSettings::Policy policy = policies[part - 1];
            if (!settings.wantsPolicy(policy))
                continue;

            SearchResult result = solver.solve(policy, settings.tieBreak);
            printResult(part, policy, result, settings, solver.grid());
            if (result.found())
                renderedPaths.push_back({result.path, settings.pathColor(policy)});
        }

        if (settings.renderEnabled)
        {
            sf::Image image = PathRenderer::render(solver.grid(), renderedPaths,
                                                   static_cast<unsigned int>(settings.renderCellSize));
            if (!PathRenderer::saveImage(image, settings.renderFile))
                return 2;
        }
    }
    catch (const GridFormatError &e)
    {
        std::cerr << "Error: " << inputFile << ": " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
