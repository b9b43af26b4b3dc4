#ifndef SEROHERD_I_PARAMETER_MANAGER_HPP
#define SEROHERD_I_PARAMETER_MANAGER_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace seroherd {

/**
 * @brief Interface for the set of calibrated parameters: names, bounds and proposal scales.
 */
class IParameterManager {
public:
    virtual ~IParameterManager() = default;

    virtual size_t getParameterCount() const = 0;

    virtual const std::vector<std::string>& getParameterNames() const = 0;

    /**
     * @brief Projects a parameter vector onto the feasible box. Const and thread-safe.
     */
    virtual Eigen::VectorXd applyConstraints(const Eigen::VectorXd& parameters) const = 0;

    /**
     * @brief Typical proposal standard deviation for parameter idx.
     */
    virtual double getSigmaForParamIndex(int idx) const = 0;

    virtual double getLowerBoundForParamIndex(int idx) const = 0;

    virtual double getUpperBoundForParamIndex(int idx) const = 0;
};

} // namespace seroherd

#endif // SEROHERD_I_PARAMETER_MANAGER_HPP
