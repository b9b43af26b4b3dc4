#ifndef SEROHERD_I_METRICS_CALCULATOR_HPP
#define SEROHERD_I_METRICS_CALCULATOR_HPP

#include "model/AnalysisTypes.hpp"
#include "model/CompartmentState.hpp"
#include <Eigen/Dense>
#include <vector>

namespace seroherd {

/**
 * @brief Interface for calculating metrics from simulated trajectories
 *
 * This interface provides pure, stateless calculation methods to transform
 * a trajectory into specific metrics.
 */
class IMetricsCalculator {
public:
    virtual ~IMetricsCalculator() = default;

    /**
     * @brief Calculate every metric of a trajectory
     * @param trajectory Completed trajectory
     * @param beta_unscaled Unscaled transmission matrix
     * @param scaling_factor Divisor that produced the matrix the trajectory was run with
     * @param gamma Recovery rate
     * @param total_population N
     * @param population_fraction Group shares f_i
     * @return Metrics structure
     * @throws ThresholdNotReachedException if no sampled point has Rt <= 1
     */
    virtual EpidemicMetrics computeMetrics(
        const Trajectory& trajectory,
        const Eigen::MatrixXd& beta_unscaled,
        double scaling_factor,
        double gamma,
        double total_population,
        const Eigen::VectorXd& population_fraction
    ) const = 0;

    /**
     * @brief Calculate effective reproduction number trajectory
     * @return Vector of Rt values, one per trajectory time point
     */
    virtual std::vector<double> calculateRtTrajectory(
        const Trajectory& trajectory,
        const Eigen::MatrixXd& beta_unscaled,
        double scaling_factor,
        double gamma
    ) const = 0;

    /**
     * @brief Calculate seroprevalence trajectory (overall removed fraction)
     * @return Vector of seroprevalence values over time
     */
    virtual std::vector<double> calculateSeroprevalenceTrajectory(
        const Trajectory& trajectory,
        double total_population
    ) const = 0;
};

} // namespace seroherd

#endif // SEROHERD_I_METRICS_CALCULATOR_HPP
