#ifndef SEROHERD_ANALYSIS_TYPES_HPP
#define SEROHERD_ANALYSIS_TYPES_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace seroherd {

/**
 * @brief Herd immunity threshold read off a trajectory.
 */
struct HerdImmunityThreshold {
    /** @brief 1 - sum_i S_i / N at the selected point. */
    double overall = 0.0;
    /** @brief 1 - S_i / N_i at the selected point. */
    Eigen::VectorXd per_group;
    double time = 0.0;
    /** @brief Rt at the selected point: the largest sampled value that is <= 1. */
    double rt = 0.0;
    std::size_t index = 0;
};

/**
 * @brief Summary statistics derived from one completed trajectory.
 */
struct EpidemicMetrics {
    /** @brief Total removed at the last time point divided by N. */
    double final_size = 0.0;
    /** @brief Rt at every trajectory time point. */
    std::vector<double> rt_series;
    HerdImmunityThreshold herd_immunity;

    double R0 = 0.0;
    /** @brief R_i / N_i at the last time point. */
    Eigen::VectorXd attack_rate_per_group;
    /** @brief Largest total E + I over the trajectory, and when it occurs. */
    double peak_prevalence = 0.0;
    double peak_time = 0.0;
};

} // namespace seroherd

#endif // SEROHERD_ANALYSIS_TYPES_HPP
