#ifndef SEROHERD_SCENARIO_RUNNER_HPP
#define SEROHERD_SCENARIO_RUNNER_HPP

#include "model/interfaces/IScenarioRunner.hpp"
#include "model/ModelConstants.hpp"
#include "stratified/interfaces/IOdeSolverStrategy.hpp"
#include "stratified/SolverSettings.hpp"
#include <memory>
#include <vector>

namespace seroherd {

/**
 * @brief Concrete IScenarioRunner.
 *
 * Every run builds its own matrix, model and trajectory; nothing is cached or shared
 * between runs.
 */
class ScenarioRunner : public IScenarioRunner {
public:
    /**
     * @param solver ODE solver strategy (nullptr selects the default stiffness-switching solver).
     * @param settings Solver tolerances.
     */
    explicit ScenarioRunner(std::shared_ptr<IOdeSolverStrategy> solver = nullptr,
                            SolverSettings settings = SolverSettings());

    /**
     * @throws InvalidParameterException for malformed inputs.
     * @throws DegenerateSpectrumException from the R0 calibration.
     * @throws IntegrationDivergenceException, PhysicalInvariantViolationException from the integration.
     * @throws ThresholdNotReachedException if Rt stays above 1 over the whole grid.
     */
    ScenarioResult run(
        const PopulationContext& context,
        const TransitionRates& rates,
        double epsilon,
        double r0_target,
        const std::vector<double>& time_grid
    ) const override;

    /**
     * @brief Runs on a uniform grid over [0, horizon] and doubles the horizon whenever the
     * threshold is not reached, at most max_extensions times.
     * @throws ThresholdNotReachedException if the last attempt still does not reach it.
     */
    ScenarioResult runWithHorizonExtension(
        const PopulationContext& context,
        const TransitionRates& rates,
        double epsilon,
        double r0_target,
        double horizon,
        double step,
        int max_extensions = constants::MAX_HORIZON_EXTENSIONS
    ) const;

private:
    std::shared_ptr<IOdeSolverStrategy> solver_;
    SolverSettings settings_;
};

/**
 * @brief Free-function form of ScenarioRunner::runWithHorizonExtension with the default solver.
 */
ScenarioResult runScenarioWithHorizonExtension(const PopulationContext& context,
                                               const TransitionRates& rates,
                                               double epsilon,
                                               double r0_target,
                                               double horizon,
                                               double step,
                                               const SolverSettings& settings = SolverSettings());

} // namespace seroherd

#endif // SEROHERD_SCENARIO_RUNNER_HPP
