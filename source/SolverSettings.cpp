#include "SolverSettings.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cstdint>
#include <stdexcept>

std::optional<SolverSettings::PolicySelection> SolverSettings::parseSelection(const std::string &name)
{
    for (PolicySelection s : {PolicySelection::Both, PolicySelection::BoundedOnly, PolicySelection::MinimumOnly})
    {
        if (name == selectionNames(s))
            return s;
    }
    return std::nullopt;
}

std::optional<SolverSettings::TieBreak> SolverSettings::parseTieBreak(const std::string &name)
{
    for (TieBreak t : {TieBreak::LowestCostFirst, TieBreak::HighestCostFirst})
    {
        if (name == tieBreakNames(t))
            return t;
    }
    return std::nullopt;
}

bool SolverSettings::parseColor(const std::string &value, sf::Color &color)
{
    // "r,g,b" with each channel 0-255
    std::istringstream in(value);
    int rgb[3];
    char sep;
    if (!(in >> rgb[0] >> sep >> rgb[1] >> sep >> rgb[2]))
        return false;

    for (int channel : rgb)
    {
        if (channel < 0 || channel > 255)
            return false;
    }
    color = sf::Color(static_cast<uint8_t>(rgb[0]), static_cast<uint8_t>(rgb[1]), static_cast<uint8_t>(rgb[2]));
    return true;
}

bool SolverSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# Crucible Solver Settings\n";
    file << "policy=" << selectionNames(policySelection) << "\n";
    file << "tieBreak=" << tieBreakNames(tieBreak) << "\n";
    file << "showPath=" << (showPath ? 1 : 0) << "\n";
    file << "showStats=" << (showStats ? 1 : 0) << "\n";
    file << "renderEnabled=" << (renderEnabled ? 1 : 0) << "\n";
    file << "renderFile=" << renderFile << "\n";
    file << "renderCellSize=" << renderCellSize << "\n";
    file << "boundedPathColor=" << static_cast<int>(boundedPathColor.r) << ","
         << static_cast<int>(boundedPathColor.g) << "," << static_cast<int>(boundedPathColor.b) << "\n";
    file << "minimumPathColor=" << static_cast<int>(minimumPathColor.r) << ","
         << static_cast<int>(minimumPathColor.g) << "," << static_cast<int>(minimumPathColor.b) << "\n";

    return true;
}

bool SolverSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        lineNumber++;
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        bool valid = true;
        if (key == "policy")
        {
            auto selection = parseSelection(value);
            valid = selection.has_value();
            if (valid)
                policySelection = *selection;
        }
        else if (key == "tieBreak")
        {
            auto order = parseTieBreak(value);
            valid = order.has_value();
            if (valid)
                tieBreak = *order;
        }
        else if (key == "renderFile")
            renderFile = value;
        else if (key == "boundedPathColor")
            valid = parseColor(value, boundedPathColor);
        else if (key == "minimumPathColor")
            valid = parseColor(value, minimumPathColor);
        else if (key == "showPath" || key == "showStats" || key == "renderEnabled" || key == "renderCellSize")
        {
            // numeric keys
            int number = 0;
            try
            {
                number = std::stoi(value);
            }
            catch (const std::exception &)
            {
                valid = false;
            }

            if (valid)
            {
                if (key == "showPath")
                    showPath = (number != 0);
                else if (key == "showStats")
                    showStats = (number != 0);
                else if (key == "renderEnabled")
                    renderEnabled = (number != 0);
                else
                    renderCellSize = number;
            }
        }
        // unknown keys are ignored so older/newer settings files still load

        if (!valid)
        {
            std::cerr << "Warning: " << filename << ":" << lineNumber << ": ignoring bad value for "
                      << key << ": " << value << std::endl;
        }
    }

    validateAndClamp();
    return true;
}

void SolverSettings::validateAndClamp()
{
    renderCellSize = std::clamp(renderCellSize, 1, 64);
    if (renderFile.empty())
        renderFile = "crucible_path.png";
}
