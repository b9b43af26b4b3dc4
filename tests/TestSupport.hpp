#ifndef SEROHERD_TEST_SUPPORT_HPP
#define SEROHERD_TEST_SUPPORT_HPP

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <vector>

#include "model/parameters/ScenarioTypes.hpp"
#include "utils/Logger.hpp"

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

// |actual - expected| <= rel_tol * |expected|
#define REQUIRE_CLOSE(actual, expected, rel_tol, msg)                                   \
    do {                                                                                \
        const double a_ = (actual);                                                     \
        const double e_ = (expected);                                                   \
        if (!std::isfinite(a_) || std::abs(a_ - e_) > (rel_tol) * std::abs(e_)) {       \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg         \
                      << " (got " << a_ << ", expected " << e_ << ")\n";               \
            std::exit(1);                                                               \
        }                                                                               \
    } while (0)

#define REQUIRE_THROWS(stmt, ExceptionType, msg)                                \
    do {                                                                        \
        bool thrown_ = false;                                                   \
        try {                                                                   \
            stmt;                                                               \
        } catch (const ExceptionType&) {                                        \
            thrown_ = true;                                                     \
        }                                                                       \
        REQUIRE(thrown_, msg << " (expected " #ExceptionType ")");              \
    } while (0)

namespace seroherd {
namespace testing {

inline void quietLogs() {
    Logger::getInstance().setLogLevel(LogLevel::ERROR);
}

/**
 * @brief Long Island serosurvey scenario (5 groups) with 1e-6 of every group infectious at t=0.
 */
inline PopulationContext longIslandContext() {
    const double fractions[] = {0.632, 0.186, 0.093, 0.068, 0.022};
    const double activities[] = {1.0, 4.31, 1.96, 0.92, 2.48};
    PopulationContext context;
    context.total_population = 2839436.0;
    for (int i = 0; i < 5; ++i) {
        DemographicGroup g;
        g.population_fraction = fractions[i];
        g.activity = activities[i];
        g.initial_infected = 1e-6 * context.total_population * fractions[i];
        context.groups.push_back(g);
    }
    return context;
}

inline SeroObservation longIslandObservation() {
    SeroObservation obs;
    obs.tested = {1599.0, 301.0, 111.0, 50.0, 50.0};
    obs.seropositive_fraction = {0.087, 0.320, 0.158, 0.084, 0.207};
    return obs;
}

inline TransitionRates longIslandRates() {
    return TransitionRates::fromPeriods(3.0, 4.0);
}

} // namespace testing
} // namespace seroherd

#endif // SEROHERD_TEST_SUPPORT_HPP
