#pragma once
#include <SFML/Graphics.hpp>
#include <optional>
#include <string>

class SolverSettings
{
public:
    // movement rule sets the solver knows about
    enum class Policy
    {
        BoundedRun,  // part 1: at most 3 straight steps, then turn
        MinimumRun,  // part 2: 4 to 10 straight steps between turns
    };

    // which answers the cli computes
    enum class PolicySelection
    {
        Both,
        BoundedOnly,
        MinimumOnly,
    };

    // ordering among frontier entries with equal priority. the reported cost must not
    // depend on it, it only changes which of several equally cheap paths is found first
    enum class TieBreak
    {
        LowestCostFirst,
        HighestCostFirst,
    };

    static const char *policyNames(Policy p)
    {
        switch (p)
        {
        case Policy::BoundedRun:
            return "bounded run";
        case Policy::MinimumRun:
            return "minimum run";
        default:
            return "Unknown";
        }
    }

    static const char *selectionNames(PolicySelection s)
    {
        switch (s)
        {
        case PolicySelection::Both:
            return "both";
        case PolicySelection::BoundedOnly:
            return "bounded";
        case PolicySelection::MinimumOnly:
            return "minimum";
        default:
            return "Unknown";
        }
    }

    static const char *tieBreakNames(TieBreak t)
    {
        switch (t)
        {
        case TieBreak::LowestCostFirst:
            return "lowestCost";
        case TieBreak::HighestCostFirst:
            return "highestCost";
        default:
            return "Unknown";
        }
    }

    static std::optional<PolicySelection> parseSelection(const std::string &name);
    static std::optional<TieBreak> parseTieBreak(const std::string &name);

    bool wantsPolicy(Policy p) const
    {
        if (policySelection == PolicySelection::Both)
            return true;
        return (p == Policy::BoundedRun) == (policySelection == PolicySelection::BoundedOnly);
    }

    // search settings
    PolicySelection policySelection = PolicySelection::Both;
    TieBreak tieBreak = TieBreak::LowestCostFirst;

    // console output
    bool showPath = false;   // print the grid with the found path overlaid
    bool showStats = false;  // nodes expanded and compute time per search

    // image output
    bool renderEnabled = false;
    std::string renderFile = "crucible_path.png";
    int renderCellSize = 8;  // pixels per grid cell
    sf::Color boundedPathColor = sf::Color(70, 130, 180);  // steel blue
    sf::Color minimumPathColor = sf::Color(50, 205, 50);   // lime green

    const sf::Color &pathColor(Policy p) const
    {
        return p == Policy::BoundedRun ? boundedPathColor : minimumPathColor;
    }

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();

private:
    static bool parseColor(const std::string &value, sf::Color &color);
};
