#ifndef SEROHERD_HILL_CLIMBING_OPTIMIZER_HPP
#define SEROHERD_HILL_CLIMBING_OPTIMIZER_HPP

#include "stratified/interfaces/IOptimizationAlgorithm.hpp"
#include "stratified/interfaces/IObjectiveFunction.hpp"
#include "stratified/interfaces/IParameterManager.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>

namespace seroherd {

/**
 * @brief Parallel adaptive hill climbing ("cloud search").
 *
 * Each iteration draws a cloud of candidate steps around the incumbent (half correlated
 * through an adapted covariance, half axis-aligned), evaluates them in parallel, accepts
 * the best improvement and pushes further along it with a backtracking/expanding line
 * search. The covariance follows the accepted moves.
 *
 * Every candidate is drawn from its own generator seeded by (seed, iteration, index), so a
 * run depends only on its settings and never on the number of OpenMP threads. An exception
 * thrown by the objective inside the parallel evaluation is rethrown to the caller.
 */
class HillClimbingOptimizer : public IOptimizationAlgorithm {
public:
    HillClimbingOptimizer();
    virtual ~HillClimbingOptimizer() = default;

    /**
     * @brief Configure optimizer parameters.
     * Keys:
     * - "iterations": Maximum optimization steps (default: 2000).
     * - "report_interval": Logging frequency (default: 100).
     * - "cloud_size": Candidates evaluated per iteration, at least 4 (default: 32).
     * - "stall_iterations": Steps without improvement before declaring convergence (default: 150).
     * - "tolerance_f": Minimum objective gain that counts as improvement (default: 1e-8).
     * - "seed": Seed of the candidate generators (default: 42).
     */
    void configure(const std::map<std::string, double>& settings) override;

    OptimizationResult optimize(
        const Eigen::VectorXd& initialParameters,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager) override;

private:
    int iterations_ = 2000;
    int report_interval_ = 100;
    int cloud_size_ = 32;
    int stall_iterations_ = 150;
    double tolerance_f_ = 1e-8;
    unsigned int seed_ = 42;
};

} // namespace seroherd

#endif // SEROHERD_HILL_CLIMBING_OPTIMIZER_HPP
