#ifndef SEROHERD_I_OBJECTIVE_FUNCTION_HPP
#define SEROHERD_I_OBJECTIVE_FUNCTION_HPP

#include <Eigen/Dense>
#include <vector>
#include <string>

namespace seroherd {

/**
 * @brief Interface for objective function calculation used in model calibration.
 */
class IObjectiveFunction {
public:
    virtual ~IObjectiveFunction() = default;

    /**
     * @brief Calculate the objective function score (e.g., log-likelihood) for a given parameter set.
     *
     * Implementations must be safe to call concurrently from several threads.
     *
     * @param parameters The parameter vector to evaluate.
     * @return double The calculated objective score. Higher values are better.
     *         Returns std::numeric_limits<double>::lowest() for points that cannot be evaluated.
     */
    virtual double calculate(const Eigen::VectorXd& parameters) const = 0;

    /**
     * @brief Get the names of the parameters expected by this objective function.
     * @return const std::vector<std::string>&
     */
    virtual const std::vector<std::string>& getParameterNames() const = 0;
};

} // namespace seroherd

#endif // SEROHERD_I_OBJECTIVE_FUNCTION_HPP
