#ifndef SEROHERD_METRICS_CALCULATOR_HPP
#define SEROHERD_METRICS_CALCULATOR_HPP

#include "model/interfaces/IMetricsCalculator.hpp"

namespace seroherd {

/**
 * @brief Concrete implementation of IMetricsCalculator
 *
 * This class performs pure, stateless calculations to transform
 * trajectories into specific metrics. All methods are const.
 */
class MetricsCalculator : public IMetricsCalculator {
public:
    MetricsCalculator() = default;

    EpidemicMetrics computeMetrics(
        const Trajectory& trajectory,
        const Eigen::MatrixXd& beta_unscaled,
        double scaling_factor,
        double gamma,
        double total_population,
        const Eigen::VectorXd& population_fraction
    ) const override;

    std::vector<double> calculateRtTrajectory(
        const Trajectory& trajectory,
        const Eigen::MatrixXd& beta_unscaled,
        double scaling_factor,
        double gamma
    ) const override;

    std::vector<double> calculateSeroprevalenceTrajectory(
        const Trajectory& trajectory,
        double total_population
    ) const override;

    /**
     * @brief R_i / N_i over time; row k belongs to trajectory.time_points[k].
     */
    Eigen::MatrixXd calculateGroupSeroprevalenceTrajectory(
        const Trajectory& trajectory,
        const Eigen::VectorXd& group_sizes
    ) const;

    /**
     * @brief Sum of R_i at the last time point divided by N.
     */
    double calculateFinalSize(const Trajectory& trajectory, double total_population) const;

    /**
     * @brief Selects, among all points with Rt <= 1, the one with the largest Rt
     * (the earliest one on ties) and reports immunity there.
     * @throws ThresholdNotReachedException if Rt > 1 at every point.
     */
    HerdImmunityThreshold calculateHerdImmunityThreshold(
        const Trajectory& trajectory,
        const std::vector<double>& rt_series,
        double total_population,
        const Eigen::VectorXd& population_fraction
    ) const;

private:
    static void requireValid(const Trajectory& trajectory, const char* source);
};

/**
 * @brief Free-function form of MetricsCalculator::computeMetrics.
 */
EpidemicMetrics computeMetrics(const Trajectory& trajectory,
                               const Eigen::MatrixXd& beta_unscaled,
                               double scaling_factor,
                               double gamma,
                               double total_population,
                               const Eigen::VectorXd& population_fraction);

} // namespace seroherd

#endif // SEROHERD_METRICS_CALCULATOR_HPP
