#include "model/SeroCalibrationEngine.hpp"
#include "model/parameters/SeroParameterManager.hpp"
#include "model/ReproductionNumberCalculator.hpp"
#include "stratified/optimizers/HillClimbingOptimizer.hpp"
#include "stratified/optimizers/NelderMeadOptimizer.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <limits>
#include <sstream>

namespace seroherd {

    static Logger& logger = Logger::getInstance();
    static const std::string LOG_SOURCE = "SERO_CALIBRATION";

    static const std::string ALGORITHM_NELDER_MEAD = "nelder_mead";
    static const std::string ALGORITHM_HILL_CLIMBING = "hill_climbing";
    static const std::string ALGORITHM_HYBRID = "hill_climbing+nelder_mead";

    static std::string formatVector(const Eigen::VectorXd& v) {
        std::ostringstream oss;
        oss << "[";
        for (int i = 0; i < v.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << v(i);
        }
        oss << "]";
        return oss.str();
    }

    SeroCalibrationEngine::SeroCalibrationEngine(CalibrationOptions options)
        : options_(std::move(options))
    {
        if (options_.algorithm != ALGORITHM_NELDER_MEAD &&
            options_.algorithm != ALGORITHM_HILL_CLIMBING &&
            options_.algorithm != ALGORITHM_HYBRID) {
            THROW_INVALID_PARAM("SeroCalibrationEngine", "Unknown optimization algorithm '" + options_.algorithm +
                                "'. Expected nelder_mead, hill_climbing or hill_climbing+nelder_mead.");
        }
        options_.solver.validate();
    }

    std::unique_ptr<IOptimizationAlgorithm> SeroCalibrationEngine::createOptimizer(
        const std::string& name, const std::map<std::string, double>& settings) {
        std::unique_ptr<IOptimizationAlgorithm> optimizer;
        if (name == ALGORITHM_NELDER_MEAD) {
            optimizer = std::make_unique<NelderMeadOptimizer>();
        } else if (name == ALGORITHM_HILL_CLIMBING) {
            optimizer = std::make_unique<HillClimbingOptimizer>();
        } else {
            THROW_INVALID_PARAM("SeroCalibrationEngine::createOptimizer", "Unknown optimizer '" + name + "'");
        }
        optimizer->configure(settings);
        return optimizer;
    }

    CalibrationResult SeroCalibrationEngine::fit(const PopulationContext& context,
                                                 const SeroObservation& observation,
                                                 const TransitionRates& rates,
                                                 double epsilon,
                                                 double survey_time,
                                                 const std::string& mode,
                                                 const Eigen::VectorXd& initial_guess,
                                                 const std::pair<double, double>& bounds) const {
        const std::string src = "SeroCalibrationEngine::fit";
        const CalibrationMode calibration_mode = parseCalibrationMode(mode);
        const std::string mode_name = calibrationModeToString(calibration_mode);

        context.validate();
        const int n = context.numGroups();
        if (initial_guess.size() != n) {
            THROW_INVALID_PARAM(src, "Initial guess has " + std::to_string(initial_guess.size()) +
                                " entries for " + std::to_string(n) + " groups.");
        }
        if (!initial_guess.allFinite() || !(initial_guess.array() > 0.0).all()) {
            THROW_INVALID_PARAM(src, "Initial guess must be finite and strictly positive.");
        }

        SeroParameterManager parameterManager(mode_name, n, bounds.first, bounds.second);
        parameterManager.setBounds(options_.parameter_bounds);

        SeroObjectiveFunction objective(context, observation, rates, epsilon, survey_time, calibration_mode,
                                        parameterManager, options_.susceptibility_matrix_builder,
                                        options_.solver, options_.survey_grid_step);

        if (!parameterManager.isFeasible(initial_guess)) {
            logger.warning(LOG_SOURCE, "Initial guess " + formatVector(initial_guess) + " lies outside the bounds; projecting.");
        }
        const Eigen::VectorXd start = parameterManager.applyConstraints(initial_guess);

        logger.info(LOG_SOURCE, "Fitting " + std::to_string(n) + " " + mode_name + " multipliers with " +
                    options_.algorithm + " (survey t=" + std::to_string(survey_time) + ")");

        OptimizationResult opt;
        if (options_.algorithm == ALGORITHM_HYBRID) {
            auto climber = createOptimizer(ALGORITHM_HILL_CLIMBING, options_.optimizer_settings);
            OptimizationResult coarse = climber->optimize(start, objective, parameterManager);

            auto simplex = createOptimizer(ALGORITHM_NELDER_MEAD, options_.optimizer_settings);
            opt = simplex->optimize(coarse.bestParameters, objective, parameterManager);
            if (coarse.bestObjectiveValue > opt.bestObjectiveValue) {
                opt.bestParameters = coarse.bestParameters;
                opt.bestObjectiveValue = coarse.bestObjectiveValue;
            }
            opt.iterations += coarse.iterations;
            opt.evaluations += coarse.evaluations;
        } else {
            auto optimizer = createOptimizer(options_.algorithm, options_.optimizer_settings);
            opt = optimizer->optimize(start, objective, parameterManager);
        }

        if (!(opt.bestObjectiveValue > std::numeric_limits<double>::lowest())) {
            throw SimulationException(src, "No trial parameter vector could be simulated; last point " +
                                      formatVector(opt.bestParameters));
        }

        CalibrationResult result;
        result.raw_parameters = opt.bestParameters;
        result.parameters = opt.bestParameters / opt.bestParameters(0);
        result.log_likelihood = opt.bestObjectiveValue;
        result.predicted_seroprevalence = objective.predictedSeroprevalence(opt.bestParameters);
        result.converged = opt.converged;
        result.iterations = opt.iterations;
        result.evaluations = opt.evaluations;
        result.algorithm = options_.algorithm;
        result.mode = calibration_mode;

        try {
            ReproductionNumberCalculator calculator(objective.buildTransmissionMatrix(opt.bestParameters), rates.gamma);
            result.basic_reproduction_number = calculator.calculateR0(context.groupSizes());
        } catch (const DegenerateSpectrumException& e) {
            logger.warning(LOG_SOURCE, std::string("Implied R0 unavailable: ") + e.what());
            result.basic_reproduction_number = std::numeric_limits<double>::quiet_NaN();
        }

        logger.info(LOG_SOURCE, "Normalized " + mode_name + ": " + formatVector(result.parameters) +
                    " | LogL: " + std::to_string(result.log_likelihood) +
                    " | Implied R0: " + std::to_string(result.basic_reproduction_number));
        if (!result.converged) {
            logger.warning(LOG_SOURCE, "Optimizer did not converge after " + std::to_string(result.evaluations) +
                           " evaluations; reporting the best point found.");
        }
        return result;
    }

    CalibrationResult fitParameters(const PopulationContext& context,
                                    const SeroObservation& observation,
                                    double r,
                                    double gamma,
                                    double epsilon,
                                    double survey_time,
                                    const std::string& mode,
                                    const Eigen::VectorXd& initial_guess,
                                    const std::pair<double, double>& bounds,
                                    const CalibrationOptions& options) {
        TransitionRates rates;
        rates.r = r;
        rates.gamma = gamma;
        SeroCalibrationEngine engine(options);
        return engine.fit(context, observation, rates, epsilon, survey_time, mode, initial_guess, bounds);
    }

} // namespace seroherd
