#ifndef SEROHERD_I_SCENARIO_RUNNER_HPP
#define SEROHERD_I_SCENARIO_RUNNER_HPP

#include "model/AnalysisTypes.hpp"
#include "model/CompartmentState.hpp"
#include "model/parameters/ScenarioTypes.hpp"
#include <Eigen/Dense>
#include <vector>

namespace seroherd {

/**
 * @brief Everything produced by one forward scenario run.
 */
struct ScenarioResult {
    /** @brief Output of buildContactMatrix for the scenario's activities. */
    Eigen::MatrixXd beta_unscaled;
    /** @brief Divisor that calibrates beta_unscaled to the target R0. */
    double scaling_factor = 1.0;
    Trajectory trajectory;
    EpidemicMetrics metrics;
};

/**
 * @brief Interface for forward runs: matrix, R0 calibration, integration and metrics.
 */
class IScenarioRunner {
public:
    virtual ~IScenarioRunner() = default;

    /**
     * @brief Run one scenario over the given output grid.
     * @param context Population, activities and initial infections.
     * @param rates Latent and recovery rates.
     * @param epsilon Assortativity in [0,1].
     * @param r0_target Basic reproduction number to calibrate to.
     * @param time_grid Strictly increasing output times starting at the initial state.
     */
    virtual ScenarioResult run(
        const PopulationContext& context,
        const TransitionRates& rates,
        double epsilon,
        double r0_target,
        const std::vector<double>& time_grid
    ) const = 0;
};

} // namespace seroherd

#endif // SEROHERD_I_SCENARIO_RUNNER_HPP
