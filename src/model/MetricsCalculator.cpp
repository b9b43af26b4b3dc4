#include "model/MetricsCalculator.hpp"
#include "model/ReproductionNumberCalculator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <limits>

namespace seroherd {

void MetricsCalculator::requireValid(const Trajectory& trajectory, const char* source) {
    if (!trajectory.isValid()) {
        THROW_INVALID_PARAM(source, "Trajectory is empty or has mismatched time points and states.");
    }
}

EpidemicMetrics MetricsCalculator::computeMetrics(
    const Trajectory& trajectory,
    const Eigen::MatrixXd& beta_unscaled,
    double scaling_factor,
    double gamma,
    double total_population,
    const Eigen::VectorXd& population_fraction) const {

    requireValid(trajectory, "MetricsCalculator::computeMetrics");
    if (!(total_population > 0.0)) THROW_INVALID_PARAM("MetricsCalculator::computeMetrics", "Total population must be positive.");
    if (population_fraction.size() != trajectory.numGroups() || beta_unscaled.rows() != trajectory.numGroups()) {
        THROW_INVALID_PARAM("MetricsCalculator::computeMetrics", "Group count of inputs does not match the trajectory.");
    }

    EpidemicMetrics metrics;
    const Eigen::VectorXd group_sizes = total_population * population_fraction;

    metrics.final_size = calculateFinalSize(trajectory, total_population);
    metrics.attack_rate_per_group = trajectory.back().R.cwiseQuotient(group_sizes);

    ReproductionNumberCalculator rn_calc(beta_unscaled, gamma, scaling_factor);
    metrics.R0 = rn_calc.calculateR0(group_sizes);
    metrics.rt_series = calculateRtTrajectory(trajectory, beta_unscaled, scaling_factor, gamma);

    // Track peak prevalence
    for (size_t t = 0; t < trajectory.size(); ++t) {
        const double prevalence = trajectory.states[t].E.sum() + trajectory.states[t].I.sum();
        if (prevalence > metrics.peak_prevalence) {
            metrics.peak_prevalence = prevalence;
            metrics.peak_time = trajectory.time_points[t];
        }
    }

    metrics.herd_immunity = calculateHerdImmunityThreshold(trajectory, metrics.rt_series, total_population, population_fraction);
    return metrics;
}

std::vector<double> MetricsCalculator::calculateRtTrajectory(
    const Trajectory& trajectory,
    const Eigen::MatrixXd& beta_unscaled,
    double scaling_factor,
    double gamma) const {

    requireValid(trajectory, "MetricsCalculator::calculateRtTrajectory");

    std::vector<double> rt_trajectory;
    rt_trajectory.reserve(trajectory.size());

    ReproductionNumberCalculator rn_calc(beta_unscaled, gamma, scaling_factor);
    for (const CompartmentState& state : trajectory.states) {
        rt_trajectory.push_back(rn_calc.calculateRt(state.S));
    }
    return rt_trajectory;
}

std::vector<double> MetricsCalculator::calculateSeroprevalenceTrajectory(
    const Trajectory& trajectory,
    double total_population) const {

    requireValid(trajectory, "MetricsCalculator::calculateSeroprevalenceTrajectory");

    std::vector<double> sero_trajectory;
    sero_trajectory.reserve(trajectory.size());
    for (const CompartmentState& state : trajectory.states) {
        sero_trajectory.push_back(state.R.sum() / total_population);
    }
    return sero_trajectory;
}

Eigen::MatrixXd MetricsCalculator::calculateGroupSeroprevalenceTrajectory(
    const Trajectory& trajectory,
    const Eigen::VectorXd& group_sizes) const {

    requireValid(trajectory, "MetricsCalculator::calculateGroupSeroprevalenceTrajectory");
    if (group_sizes.size() != trajectory.numGroups()) {
        THROW_INVALID_PARAM("MetricsCalculator::calculateGroupSeroprevalenceTrajectory", "group_sizes size mismatch.");
    }

    Eigen::MatrixXd sero(static_cast<Eigen::Index>(trajectory.size()), group_sizes.size());
    for (size_t t = 0; t < trajectory.size(); ++t) {
        sero.row(static_cast<Eigen::Index>(t)) = trajectory.states[t].R.cwiseQuotient(group_sizes).transpose();
    }
    return sero;
}

double MetricsCalculator::calculateFinalSize(const Trajectory& trajectory, double total_population) const {
    requireValid(trajectory, "MetricsCalculator::calculateFinalSize");
    return trajectory.back().R.sum() / total_population;
}

HerdImmunityThreshold MetricsCalculator::calculateHerdImmunityThreshold(
    const Trajectory& trajectory,
    const std::vector<double>& rt_series,
    double total_population,
    const Eigen::VectorXd& population_fraction) const {

    const char* src = "MetricsCalculator::calculateHerdImmunityThreshold";
    requireValid(trajectory, src);
    if (rt_series.size() != trajectory.size()) THROW_INVALID_PARAM(src, "Rt series and trajectory differ in length.");

    bool found = false;
    size_t best = 0;
    double min_rt = std::numeric_limits<double>::infinity();
    for (size_t t = 0; t < rt_series.size(); ++t) {
        min_rt = std::min(min_rt, rt_series[t]);
        if (rt_series[t] <= 1.0 && (!found || rt_series[t] > rt_series[best])) {
            best = t;
            found = true;
        }
    }
    if (!found) {
        throw ThresholdNotReachedException(src,
            "Rt stays above 1 up to t=" + std::to_string(trajectory.time_points.back()) +
            " (minimum " + std::to_string(min_rt) + "); extend the time horizon.", min_rt);
    }

    const CompartmentState& state = trajectory.states[best];
    const Eigen::VectorXd group_sizes = total_population * population_fraction;

    HerdImmunityThreshold hit;
    hit.index = best;
    hit.time = trajectory.time_points[best];
    hit.rt = rt_series[best];
    hit.overall = 1.0 - state.S.sum() / total_population;
    hit.per_group = (Eigen::VectorXd::Ones(group_sizes.size()) - state.S.cwiseQuotient(group_sizes));

    Logger::getInstance().debug("MetricsCalculator",
        "HIT " + std::to_string(hit.overall) + " at t=" + std::to_string(hit.time) +
        " (Rt=" + std::to_string(hit.rt) + ")");
    return hit;
}

EpidemicMetrics computeMetrics(const Trajectory& trajectory,
                               const Eigen::MatrixXd& beta_unscaled,
                               double scaling_factor,
                               double gamma,
                               double total_population,
                               const Eigen::VectorXd& population_fraction) {
    MetricsCalculator calculator;
    return calculator.computeMetrics(trajectory, beta_unscaled, scaling_factor, gamma,
                                     total_population, population_fraction);
}

} // namespace seroherd
