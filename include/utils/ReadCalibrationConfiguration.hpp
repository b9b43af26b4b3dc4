#ifndef SEROHERD_READ_CALIBRATION_CONFIGURATION_HPP
#define SEROHERD_READ_CALIBRATION_CONFIGURATION_HPP

#include <istream>
#include <map>
#include <string>
#include <utility>

namespace seroherd {

/**
 * @brief Parses "key value" settings lines into a map.
 *
 * Blank lines and anything after '#' are ignored. A key may appear more than once;
 * the last value wins.
 *
 * @param input Stream to read.
 * @param source_name Name used in error messages (usually the file path).
 * @throws DataFormatException if a line does not hold exactly one key and one number.
 */
std::map<std::string, double> parseSettings(std::istream& input, const std::string& source_name);

/**
 * @brief Reads optimizer settings (e.g. nelder_mead_settings.txt) from disk.
 * @throws DataFormatException if the file cannot be opened or parsed.
 */
std::map<std::string, double> readOptimizerSettings(const std::string& filepath);

/**
 * @brief Reads solver settings ("abs_error", "rel_error", ...) from disk.
 * @throws DataFormatException if the file cannot be opened or parsed.
 */
std::map<std::string, double> readSolverSettings(const std::string& filepath);

/**
 * @brief Parses "name lower upper" lines into per-parameter bounds.
 * @throws DataFormatException on malformed lines or when lower > upper.
 */
std::map<std::string, std::pair<double, double>> parseParamBounds(std::istream& input,
                                                                  const std::string& source_name);

/**
 * @brief Reads parameter bounds from disk.
 * @throws DataFormatException if the file cannot be opened or parsed.
 */
std::map<std::string, std::pair<double, double>> readParamBounds(const std::string& filepath);

} // namespace seroherd

#endif // SEROHERD_READ_CALIBRATION_CONFIGURATION_HPP
