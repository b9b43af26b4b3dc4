#include "utils/ReadCalibrationConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <fstream>
#include <sstream>

namespace seroherd {

namespace {

    const std::string LOG_SOURCE = "CONFIG_READER";

    // Strips comments and surrounding whitespace; returns false for lines with no content.
    bool extractContent(const std::string& raw, std::string& content) {
        std::string line = raw.substr(0, raw.find('#'));
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) return false;
        const auto last = line.find_last_not_of(" \t\r");
        content = line.substr(first, last - first + 1);
        return true;
    }

    std::ifstream openOrThrow(const std::string& filepath, const std::string& source) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw DataFormatException(source, "Could not open file: " + filepath);
        }
        return file;
    }

} // namespace

std::map<std::string, double> parseSettings(std::istream& input, const std::string& source_name) {
    std::map<std::string, double> settings;
    std::string raw;
    int line_number = 0;

    while (std::getline(input, raw)) {
        ++line_number;
        std::string content;
        if (!extractContent(raw, content)) continue;

        std::istringstream iss(content);
        std::string key;
        double value = 0.0;
        std::string trailing;
        if (!(iss >> key >> value) || (iss >> trailing)) {
            throw DataFormatException("parseSettings",
                source_name + ":" + std::to_string(line_number) +
                ": expected '<key> <number>', got '" + content + "'");
        }
        settings[key] = value;
    }
    return settings;
}

std::map<std::string, double> readOptimizerSettings(const std::string& filepath) {
    std::ifstream file = openOrThrow(filepath, "readOptimizerSettings");
    auto settings = parseSettings(file, filepath);
    Logger::getInstance().info(LOG_SOURCE, "Read " + std::to_string(settings.size()) +
                               " optimizer settings from " + filepath);
    return settings;
}

std::map<std::string, double> readSolverSettings(const std::string& filepath) {
    std::ifstream file = openOrThrow(filepath, "readSolverSettings");
    return parseSettings(file, filepath);
}

std::map<std::string, std::pair<double, double>> parseParamBounds(std::istream& input,
                                                                  const std::string& source_name) {
    std::map<std::string, std::pair<double, double>> bounds;
    std::string raw;
    int line_number = 0;

    while (std::getline(input, raw)) {
        ++line_number;
        std::string content;
        if (!extractContent(raw, content)) continue;

        std::istringstream iss(content);
        std::string name;
        double lower = 0.0, upper = 0.0;
        std::string trailing;
        if (!(iss >> name >> lower >> upper) || (iss >> trailing)) {
            throw DataFormatException("parseParamBounds",
                source_name + ":" + std::to_string(line_number) +
                ": expected '<name> <lower> <upper>', got '" + content + "'");
        }
        if (lower > upper) {
            throw DataFormatException("parseParamBounds",
                source_name + ":" + std::to_string(line_number) +
                ": lower bound exceeds upper bound for '" + name + "'");
        }
        bounds[name] = {lower, upper};
    }
    return bounds;
}

std::map<std::string, std::pair<double, double>> readParamBounds(const std::string& filepath) {
    std::ifstream file = openOrThrow(filepath, "readParamBounds");
    return parseParamBounds(file, filepath);
}

} // namespace seroherd
