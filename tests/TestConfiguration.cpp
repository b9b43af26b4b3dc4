#include "TestSupport.hpp"

#include "exceptions/Exceptions.hpp"
#include "stratified/SolverSettings.hpp"
#include "stratified/optimizers/HillClimbingOptimizer.hpp"
#include "stratified/optimizers/NelderMeadOptimizer.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadCalibrationConfiguration.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace seroherd;

namespace {

void testParseSettings() {
    std::istringstream input(
        "# Nelder-Mead settings\n"
        "\n"
        "iterations 800\n"
        "   tolerance_f   1e-7   # trailing comment\n"
        "restarts 2\n"
        "iterations 1200\n");
    const auto settings = parseSettings(input, "inline");
    REQUIRE(settings.size() == 3, "three distinct keys");
    REQUIRE(settings.at("iterations") == 1200.0, "last value wins");
    REQUIRE(settings.at("tolerance_f") == 1e-7, "scientific notation and inline comments");
    REQUIRE(settings.at("restarts") == 2.0, "plain integer");

    std::istringstream missing_value("iterations\n");
    REQUIRE_THROWS(parseSettings(missing_value, "inline"), DataFormatException, "key without value");
    std::istringstream not_a_number("iterations many\n");
    REQUIRE_THROWS(parseSettings(not_a_number, "inline"), DataFormatException, "non-numeric value");
    std::istringstream trailing("iterations 10 20\n");
    REQUIRE_THROWS(parseSettings(trailing, "inline"), DataFormatException, "trailing token");
    std::cout << "[PASS] parseSettings\n";
}

void testParseParamBounds() {
    std::istringstream input(
        "# name lower upper\n"
        "activity_0 0.5 1.5\n"
        "activity_3 1e-3 10\n");
    const auto bounds = parseParamBounds(input, "inline");
    REQUIRE(bounds.size() == 2, "two bounds");
    REQUIRE(bounds.at("activity_0").first == 0.5 && bounds.at("activity_0").second == 1.5, "activity_0 box");
    REQUIRE(bounds.at("activity_3").second == 10.0, "activity_3 upper");

    std::istringstream inverted("activity_0 2 1\n");
    REQUIRE_THROWS(parseParamBounds(inverted, "inline"), DataFormatException, "lower above upper");
    std::istringstream short_line("activity_0 2\n");
    REQUIRE_THROWS(parseParamBounds(short_line, "inline"), DataFormatException, "missing upper bound");
    std::cout << "[PASS] parseParamBounds\n";
}

void testReadFromDisk() {
    const std::string path = "seroherd_test_solver_settings.txt";
    {
        std::ofstream out(path);
        out << "abs_error 1e-10\nrel_error 1e-9\nmax_step_reductions 12\n";
    }
    const auto solver_map = readSolverSettings(path);
    const SolverSettings settings = SolverSettings::fromMap(solver_map);
    REQUIRE(settings.abs_error == 1e-10 && settings.rel_error == 1e-9, "tolerances read");
    REQUIRE(settings.max_step_reductions == 12, "step reductions read");
    REQUIRE(settings.dt_hint == SolverSettings().dt_hint, "unset keys keep defaults");
    std::remove(path.c_str());

    REQUIRE_THROWS(readOptimizerSettings("does/not/exist.txt"), DataFormatException, "missing settings file");
    REQUIRE_THROWS(readParamBounds("does/not/exist.txt"), DataFormatException, "missing bounds file");
    REQUIRE_THROWS(readSolverSettings("does/not/exist.txt"), DataFormatException, "missing solver file");
    std::cout << "[PASS] file readers\n";
}

void testSolverSettingsValidation() {
    SolverSettings s;
    s.validate();
    REQUIRE_THROWS(SolverSettings::fromMap({{"abs_error", 0.0}}), InvalidParameterException, "zero tolerance");
    REQUIRE_THROWS(SolverSettings::fromMap({{"dt_hint", -1.0}}), InvalidParameterException, "negative dt");
    REQUIRE_THROWS(SolverSettings::fromMap({{"max_steps_per_interval", 0.0}}), InvalidParameterException,
                   "zero step budget");

    const std::vector<double> grid = buildTimeGrid(1.0, 0.25);
    REQUIRE(grid.size() == 5 && grid.back() == 1.0, "grid ends exactly at the end time");
    REQUIRE_THROWS(validateTimeGrid({0.0, 1.0, 1.0}, "test"), InvalidParameterException, "repeated time");
    REQUIRE_THROWS(validateTimeGrid({}, "test"), InvalidParameterException, "empty grid");
    std::cout << "[PASS] solver settings\n";
}

void testOptimizerConfiguration() {
    NelderMeadOptimizer simplex;
    simplex.configure({{"iterations", 250}, {"restarts", 0}, {"log_transform", 0}, {"unknown_key", 3}});
    REQUIRE(simplex.getOptions().max_iter == 250, "iterations applied");
    REQUIRE(simplex.getOptions().restarts == 0, "restarts applied");
    REQUIRE(!simplex.getOptions().log_transform, "log transform disabled");
    REQUIRE(simplex.getOptions().max_evaluations == NelderMeadOptions().max_evaluations, "unset keys keep defaults");
    REQUIRE_THROWS(simplex.configure({{"initial_step", 0.0}}), InvalidParameterException, "zero initial step");

    HillClimbingOptimizer climber;
    climber.configure({{"iterations", 10}, {"seed", 3}});
    std::cout << "[PASS] optimizer configuration\n";
}

void testLogger() {
    Logger& logger = Logger::getInstance();
    std::ostringstream sink;
    logger.setOutputStream(&sink);
    logger.setLogLevel(LogLevel::WARNING);
    REQUIRE(logger.getLogLevel() == LogLevel::WARNING, "level round-trips");

    logger.info("TEST", "hidden");
    logger.warning("TEST", "shown");
    REQUIRE(sink.str().find("hidden") == std::string::npos, "info filtered at WARNING level");
    REQUIRE(sink.str().find("[WARNING] [TEST] shown") != std::string::npos, "line format");
    REQUIRE(logger.isEnabled(LogLevel::ERROR) && !logger.isEnabled(LogLevel::DEBUG), "level checks");

    logger.setOutputStream(nullptr);
    testing::quietLogs();
    REQUIRE(logger.getLogLevel() == LogLevel::ERROR, "quiet level restored");
    std::cout << "[PASS] logger\n";
}

} // namespace

int main() {
    testing::quietLogs();
    testParseSettings();
    testParseParamBounds();
    testReadFromDisk();
    testSolverSettingsValidation();
    testOptimizerConfiguration();
    testLogger();
    std::cout << "[PASS] TestConfiguration\n";
    return 0;
}
