#ifndef SEROHERD_SERO_CALIBRATION_ENGINE_HPP
#define SEROHERD_SERO_CALIBRATION_ENGINE_HPP

#include "model/objectives/SeroObjectiveFunction.hpp"
#include "model/parameters/ScenarioTypes.hpp"
#include "model/ModelConstants.hpp"
#include "stratified/interfaces/IOptimizationAlgorithm.hpp"
#include "stratified/SolverSettings.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace seroherd {

/**
 * @brief Tuning of one calibration run. Defaults reproduce the reference fits.
 */
struct CalibrationOptions {
    /** @brief "nelder_mead", "hill_climbing" or "hill_climbing+nelder_mead". */
    std::string algorithm = "nelder_mead";
    /** @brief Passed to the optimizer's configure(); unknown keys are ignored. */
    std::map<std::string, double> optimizer_settings;
    /** @brief Per-parameter bound overrides keyed by name ("activity_2"). */
    std::map<std::string, std::pair<double, double>> parameter_bounds;
    SolverSettings solver;
    double survey_grid_step = constants::DEFAULT_SURVEY_GRID_STEP;
    /** @brief Matrix construction for the susceptibility mode; required by that mode. */
    TransmissionMatrixBuilder susceptibility_matrix_builder;
};

/**
 * @brief Fitted multipliers and fit diagnostics.
 */
struct CalibrationResult {
    /**
     * @brief raw_parameters divided by raw_parameters(0).
     *
     * The reference group's multiplier is 1 by construction. This is a reporting
     * convention; it does not make the parameters identifiable.
     */
    Eigen::VectorXd parameters;
    /** @brief Best point found, on the scale that absorbed R0 (scaling factor 1). */
    Eigen::VectorXd raw_parameters;
    double log_likelihood = 0.0;
    /** @brief Model R_i / N_i at the survey time for raw_parameters. */
    Eigen::VectorXd predicted_seroprevalence;
    /** @brief R0 implied by raw_parameters at scaling factor 1 (NaN if degenerate). */
    double basic_reproduction_number = 0.0;
    /** @brief False when the optimizer stopped on an iteration or evaluation cap. */
    bool converged = false;
    int iterations = 0;
    int evaluations = 0;
    std::string algorithm;
    CalibrationMode mode = CalibrationMode::Activity;
};

/**
 * @brief Fits per-group multipliers to a serosurvey by maximizing the binomial likelihood.
 */
class SeroCalibrationEngine {
public:
    explicit SeroCalibrationEngine(CalibrationOptions options = CalibrationOptions());

    /**
     * @brief Runs one calibration.
     *
     * @param context Population and initial infections.
     * @param observation Tested counts and seropositive fractions per group.
     * @param rates Latent and recovery rates.
     * @param epsilon Assortativity in [0,1].
     * @param survey_time Time of the survey in days, > 0.
     * @param mode "activity" or "susceptibility" (case-insensitive).
     * @param initial_guess Starting multipliers (projected onto the bounds).
     * @param bounds Common (lower, upper) box, 0 < lower <= upper.
     * @return Best parameters found with a converged flag; non-convergence is not an error.
     * @throws ModelNotRecognizedException for an unknown mode.
     * @throws InvalidParameterException for malformed inputs, an unknown algorithm or a
     *         missing susceptibility builder.
     */
    CalibrationResult fit(const PopulationContext& context,
                          const SeroObservation& observation,
                          const TransitionRates& rates,
                          double epsilon,
                          double survey_time,
                          const std::string& mode,
                          const Eigen::VectorXd& initial_guess,
                          const std::pair<double, double>& bounds) const;

    const CalibrationOptions& getOptions() const { return options_; }

    /**
     * @brief Creates and configures a single optimizer by name.
     * @throws InvalidParameterException for an unknown name.
     */
    static std::unique_ptr<IOptimizationAlgorithm> createOptimizer(const std::string& name,
                                                                   const std::map<std::string, double>& settings);

private:
    CalibrationOptions options_;
};

/**
 * @brief Free-function form of SeroCalibrationEngine::fit.
 */
CalibrationResult fitParameters(const PopulationContext& context,
                                const SeroObservation& observation,
                                double r,
                                double gamma,
                                double epsilon,
                                double survey_time,
                                const std::string& mode,
                                const Eigen::VectorXd& initial_guess,
                                const std::pair<double, double>& bounds = {constants::DEFAULT_PARAM_LOWER_BOUND,
                                                                           constants::DEFAULT_PARAM_UPPER_BOUND},
                                const CalibrationOptions& options = CalibrationOptions());

} // namespace seroherd

#endif // SEROHERD_SERO_CALIBRATION_ENGINE_HPP
