#ifndef SEROHERD_SERO_OBJECTIVE_FUNCTION_HPP
#define SEROHERD_SERO_OBJECTIVE_FUNCTION_HPP

#include "stratified/interfaces/IObjectiveFunction.hpp"
#include "stratified/interfaces/IOdeSolverStrategy.hpp"
#include "stratified/interfaces/IParameterManager.hpp"
#include "stratified/SolverSettings.hpp"
#include "model/parameters/ScenarioTypes.hpp"
#include "model/ModelConstants.hpp"
#include <Eigen/Dense>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace seroherd {

/**
 * @brief Builds an unscaled transmission matrix from a trial parameter vector.
 */
using TransmissionMatrixBuilder = std::function<Eigen::MatrixXd(const Eigen::VectorXd& parameters,
                                                                const PopulationContext& context,
                                                                double epsilon)>;

/**
 * @brief Binomial log-likelihood of a serosurvey under the stratified SEIR model.
 *
 * For a trial vector of per-group multipliers the model is run from the scenario's
 * initial state to the survey time with the scaling factor fixed at 1, and the removed
 * fraction p_i = R_i / N_i of every group is scored against the observed positives:
 *
 *   logL = sum_i [ log C(n_i, k_i) + k_i log p_i + (n_i - k_i) log(1 - p_i) ]
 *
 * with p_i clamped to [PROBABILITY_FLOOR, 1 - PROBABILITY_FLOOR].
 *
 * calculate() keeps no state between calls and can be evaluated from several threads.
 */
class SeroObjectiveFunction : public IObjectiveFunction {
public:
    /**
     * @param context Validated scenario (population, fractions, initial infections).
     * @param observation Serosurvey counts, one entry per group.
     * @param rates Latent and recovery rates.
     * @param epsilon Assortativity in [0,1].
     * @param survey_time Time of the survey, > 0 (days since the initial state).
     * @param mode Activity: parameters are the group activities fed to buildContactMatrix.
     *        Susceptibility: parameters go through matrix_builder.
     * @param parameterManager Parameter names; must outlive the objective.
     * @param matrix_builder Required in susceptibility mode, ignored in activity mode.
     * @param settings Solver tolerances.
     * @param grid_step Output spacing of the integration grid.
     * @param solver ODE solver (nullptr selects the default stiffness-switching solver).
     * @throws InvalidParameterException on inconsistent inputs or a missing builder.
     */
    SeroObjectiveFunction(const PopulationContext& context,
                          const SeroObservation& observation,
                          const TransitionRates& rates,
                          double epsilon,
                          double survey_time,
                          CalibrationMode mode,
                          const IParameterManager& parameterManager,
                          TransmissionMatrixBuilder matrix_builder = nullptr,
                          const SolverSettings& settings = SolverSettings(),
                          double grid_step = constants::DEFAULT_SURVEY_GRID_STEP,
                          std::shared_ptr<IOdeSolverStrategy> solver = nullptr);

    /**
     * @brief Log-likelihood of the observation at the given multipliers.
     *
     * Trial vectors whose simulation fails numerically (degenerate spectrum, diverging
     * integration, broken physical invariants) score std::numeric_limits<double>::lowest().
     * @throws InvalidParameterException if the parameter vector has the wrong size or
     *         the matrix builder returns a malformed matrix.
     */
    double calculate(const Eigen::VectorXd& parameters) const override;

    const std::vector<std::string>& getParameterNames() const override;

    /**
     * @brief Model seroprevalence R_i / N_i at the survey time.
     * @throws ModelException subclasses from the simulation; nothing is swallowed.
     */
    Eigen::VectorXd predictedSeroprevalence(const Eigen::VectorXd& parameters) const;

    /** @brief Unscaled transmission matrix for a trial vector. */
    Eigen::MatrixXd buildTransmissionMatrix(const Eigen::VectorXd& parameters) const;

    /**
     * @brief Binomial log-likelihood of the observed positives for predicted probabilities p.
     */
    double logLikelihood(const Eigen::VectorXd& p) const;

    const std::vector<double>& getTimeGrid() const { return time_grid_; }

private:
    PopulationContext context_;
    TransitionRates rates_;
    double epsilon_;
    CalibrationMode mode_;
    const IParameterManager& parameterManager_;
    TransmissionMatrixBuilder matrix_builder_;
    SolverSettings settings_;
    std::shared_ptr<IOdeSolverStrategy> solver_;

    Eigen::VectorXd group_sizes_;
    Eigen::VectorXd tested_;
    Eigen::VectorXd positives_;
    double log_binomial_coefficients_ = 0.0;
    std::vector<double> time_grid_;
};

} // namespace seroherd

#endif // SEROHERD_SERO_OBJECTIVE_FUNCTION_HPP
