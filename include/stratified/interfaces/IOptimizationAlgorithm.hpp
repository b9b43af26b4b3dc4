#ifndef SEROHERD_I_OPTIMIZATION_ALGORITHM_HPP
#define SEROHERD_I_OPTIMIZATION_ALGORITHM_HPP

#include "stratified/interfaces/IObjectiveFunction.hpp"
#include "stratified/interfaces/IParameterManager.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>

namespace seroherd {

/**
 * @brief Outcome of one optimization run (maximization of the objective).
 */
struct OptimizationResult {
    Eigen::VectorXd bestParameters;
    double bestObjectiveValue = 0.0;
    /** @brief False when the run stopped on an iteration or evaluation cap. */
    bool converged = false;
    int iterations = 0;
    int evaluations = 0;
};

/**
 * @brief Interface for bounded optimizers that maximize an IObjectiveFunction.
 */
class IOptimizationAlgorithm {
public:
    virtual ~IOptimizationAlgorithm() = default;

    /**
     * @brief Configure the algorithm from a key/value map; unknown keys are ignored.
     */
    virtual void configure(const std::map<std::string, double>& settings) = 0;

    /**
     * @brief Run the optimization.
     * @param initialParameters Starting point (projected onto the bounds first).
     * @param objectiveFunction Objective to maximize.
     * @param parameterManager Bounds and proposal scales.
     * @return Best point found, with a converged flag that is never set on a capped run.
     */
    virtual OptimizationResult optimize(
        const Eigen::VectorXd& initialParameters,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager) = 0;
};

} // namespace seroherd

#endif // SEROHERD_I_OPTIMIZATION_ALGORITHM_HPP
