#ifndef SEROHERD_NELDER_MEAD_OPTIMIZER_HPP
#define SEROHERD_NELDER_MEAD_OPTIMIZER_HPP

#include "stratified/interfaces/IOptimizationAlgorithm.hpp"
#include <Eigen/Dense>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace seroherd {

/**
 * @brief Options of the bounded Nelder-Mead simplex search.
 */
struct NelderMeadOptions {
    int max_iter = 5000;          ///< Iterations per restart
    int max_evaluations = 20000;  ///< Objective evaluations over the whole run
    int restarts = 3;             ///< Fresh simplices built around the incumbent
    double tol_f = 1e-9;          ///< Objective spread across the simplex, relative to 1 + |f_best|
    double tol_x = 1e-7;          ///< Vertex spread (in search coordinates)
    double initial_step = 0.25;   ///< Relative edge length of the initial simplex
    bool log_transform = true;    ///< Search in log coordinates (requires positive bounds)
    double alpha = 1.0;           ///< Reflection
    double gamma = 2.0;           ///< Expansion
    double rho = 0.5;             ///< Contraction
    double sigma = 0.5;           ///< Shrink
    int report_interval = 500;
};

/**
 * @brief Deterministic bounded Nelder-Mead maximizer.
 *
 * Vertices are clamped to the parameter manager's box after every move. With
 * log_transform the simplex lives in log space, which keeps multiplicative
 * parameters well scaled. After a simplex converges, a new one is built around the
 * best vertex; the search stops when a restart no longer improves the objective.
 */
class NelderMeadOptimizer : public IOptimizationAlgorithm {
public:
    explicit NelderMeadOptimizer(const NelderMeadOptions& options = NelderMeadOptions());

    /**
     * @brief Configure optimizer parameters.
     * Keys: "iterations", "max_evaluations", "restarts", "tolerance_f", "tolerance_x",
     * "initial_step", "log_transform" (0/1), "alpha", "gamma", "rho", "sigma",
     * "report_interval".
     */
    void configure(const std::map<std::string, double>& settings) override;

    OptimizationResult optimize(
        const Eigen::VectorXd& initialParameters,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager) override;

    const NelderMeadOptions& getOptions() const;

private:
    NelderMeadOptions m_options;

    /**
     * @brief One simplex run in search coordinates; minimizes f.
     * @return True when the simplex met both tolerances.
     */
    bool runSimplex(const std::function<double(const Eigen::VectorXd&)>& f,
                    Eigen::VectorXd& best, double& best_value,
                    const Eigen::VectorXd& lower, const Eigen::VectorXd& upper,
                    int& evaluations, int& iterations) const;
};

} // namespace seroherd

#endif // SEROHERD_NELDER_MEAD_OPTIMIZER_HPP
