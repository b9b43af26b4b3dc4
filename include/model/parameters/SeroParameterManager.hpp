#ifndef SEROHERD_SERO_PARAMETER_MANAGER_HPP
#define SEROHERD_SERO_PARAMETER_MANAGER_HPP

#include "stratified/interfaces/IParameterManager.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace seroherd {

/**
 * @brief Box-constrained per-group multipliers fitted by the serosurvey calibration.
 *
 * Parameter k is named "<prefix>_k" (e.g. "activity_0") and lives in [lower_k, upper_k],
 * with 0 < lower_k <= upper_k.
 */
class SeroParameterManager : public IParameterManager {
public:
    /**
     * @param prefix Name stem, usually the calibration mode ("activity", "susceptibility").
     * @param num_groups Number of fitted multipliers.
     * @param lower_bound Common lower bound.
     * @param upper_bound Common upper bound.
     * @throws InvalidParameterException if num_groups < 1 or the bounds are not 0 < lower <= upper.
     */
    SeroParameterManager(const std::string& prefix, int num_groups, double lower_bound, double upper_bound);

    /**
     * @brief Overrides bounds for the parameters named in the map (e.g. from readParamBounds).
     * Unknown names are logged and ignored.
     * @throws InvalidParameterException for non-positive or inverted bounds.
     */
    void setBounds(const std::map<std::string, std::pair<double, double>>& bounds);

    size_t getParameterCount() const override;
    const std::vector<std::string>& getParameterNames() const override;

    /** @brief Clamps every entry into its box; NaN entries move to the lower bound. */
    Eigen::VectorXd applyConstraints(const Eigen::VectorXd& parameters) const override;

    /** @brief 5% of the box width. */
    double getSigmaForParamIndex(int idx) const override;
    double getLowerBoundForParamIndex(int idx) const override;
    double getUpperBoundForParamIndex(int idx) const override;

    const Eigen::VectorXd& getLowerBounds() const { return lower_; }
    const Eigen::VectorXd& getUpperBounds() const { return upper_; }

    /** @brief True if every entry lies inside its box. */
    bool isFeasible(const Eigen::VectorXd& parameters) const;

private:
    std::vector<std::string> names_;
    Eigen::VectorXd lower_;
    Eigen::VectorXd upper_;

    void checkIndex(int idx) const;
};

} // namespace seroherd

#endif // SEROHERD_SERO_PARAMETER_MANAGER_HPP
