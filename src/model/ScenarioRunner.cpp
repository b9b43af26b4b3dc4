#include "model/ScenarioRunner.hpp"
#include "model/CompartmentalIntegrator.hpp"
#include "model/ContactMatrixBuilder.hpp"
#include "model/MetricsCalculator.hpp"
#include "model/ReproductionNumberCalculator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

namespace seroherd {

static const std::string LOG_SOURCE = "SCENARIO_RUNNER";

ScenarioRunner::ScenarioRunner(std::shared_ptr<IOdeSolverStrategy> solver, SolverSettings settings)
    : solver_(std::move(solver)), settings_(settings) {
    settings_.validate();
}

ScenarioResult ScenarioRunner::run(
    const PopulationContext& context,
    const TransitionRates& rates,
    double epsilon,
    double r0_target,
    const std::vector<double>& time_grid) const {

    context.validate();
    rates.validate();

    ScenarioResult result;
    const Eigen::VectorXd fractions = context.fractions();
    result.beta_unscaled = buildContactMatrix(context.activities(), fractions, context.total_population, epsilon);
    result.scaling_factor = calibrateR0(result.beta_unscaled, rates.gamma, fractions, context.total_population, r0_target);

    const Eigen::MatrixXd beta_scaled = result.beta_unscaled / result.scaling_factor;
    CompartmentalIntegrator integrator(solver_, settings_);
    result.trajectory = integrator.integrate(context.initialState(), rates.r, rates.gamma, beta_scaled, time_grid);

    MetricsCalculator calculator;
    result.metrics = calculator.computeMetrics(result.trajectory, result.beta_unscaled, result.scaling_factor,
                                               rates.gamma, context.total_population, fractions);

    Logger::getInstance().debug(LOG_SOURCE,
        "Scenario done: R0=" + std::to_string(result.metrics.R0) +
        ", final size=" + std::to_string(result.metrics.final_size) +
        ", HIT=" + std::to_string(result.metrics.herd_immunity.overall));
    return result;
}

ScenarioResult ScenarioRunner::runWithHorizonExtension(
    const PopulationContext& context,
    const TransitionRates& rates,
    double epsilon,
    double r0_target,
    double horizon,
    double step,
    int max_extensions) const {

    if (max_extensions < 0) {
        THROW_INVALID_PARAM("ScenarioRunner::runWithHorizonExtension", "max_extensions must be non-negative.");
    }

    for (int attempt = 0; ; ++attempt) {
        try {
            return run(context, rates, epsilon, r0_target, buildTimeGrid(horizon, step));
        } catch (const ThresholdNotReachedException& e) {
            if (attempt >= max_extensions) throw;
            Logger::getInstance().info(LOG_SOURCE,
                "Threshold not reached by t=" + std::to_string(horizon) +
                " (min Rt " + std::to_string(e.getMinimumRt()) + "); doubling the horizon.");
            horizon *= 2.0;
        }
    }
}

ScenarioResult runScenarioWithHorizonExtension(const PopulationContext& context,
                                               const TransitionRates& rates,
                                               double epsilon,
                                               double r0_target,
                                               double horizon,
                                               double step,
                                               const SolverSettings& settings) {
    ScenarioRunner runner(nullptr, settings);
    return runner.runWithHorizonExtension(context, rates, epsilon, r0_target, horizon, step);
}

} // namespace seroherd
