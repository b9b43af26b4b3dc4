#include "model/objectives/SeroObjectiveFunction.hpp"
#include "model/CompartmentalIntegrator.hpp"
#include "model/ContactMatrixBuilder.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace seroherd {

    static Logger& logger = Logger::getInstance();
    static const std::string LOG_SOURCE = "SERO_OBJECTIVE";

    static std::string formatParameters(const Eigen::VectorXd& params) {
        std::ostringstream oss;
        oss << "[";
        for (int i = 0; i < params.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << params(i);
        }
        oss << "]";
        return oss.str();
    }

    SeroObjectiveFunction::SeroObjectiveFunction(const PopulationContext& context,
                                                 const SeroObservation& observation,
                                                 const TransitionRates& rates,
                                                 double epsilon,
                                                 double survey_time,
                                                 CalibrationMode mode,
                                                 const IParameterManager& parameterManager,
                                                 TransmissionMatrixBuilder matrix_builder,
                                                 const SolverSettings& settings,
                                                 double grid_step,
                                                 std::shared_ptr<IOdeSolverStrategy> solver)
        : context_(context), rates_(rates), epsilon_(epsilon), mode_(mode),
          parameterManager_(parameterManager), matrix_builder_(std::move(matrix_builder)),
          settings_(settings), solver_(std::move(solver))
    {
        const std::string src = "SeroObjectiveFunction";
        context_.validate();
        const int n = context_.numGroups();
        observation.validate(n);
        rates_.validate();
        settings_.validate();
        if (!(epsilon_ >= 0.0 && epsilon_ <= 1.0)) {
            THROW_INVALID_PARAM(src, "Assortativity must lie in [0,1], got " + std::to_string(epsilon_));
        }
        if (parameterManager_.getParameterCount() != static_cast<size_t>(n)) {
            THROW_INVALID_PARAM(src, "Parameter manager holds " + std::to_string(parameterManager_.getParameterCount()) +
                                " parameters for " + std::to_string(n) + " groups.");
        }
        if (mode_ == CalibrationMode::Susceptibility && !matrix_builder_) {
            THROW_INVALID_PARAM(src, "Susceptibility mode needs a transmission matrix builder; none was supplied.");
        }

        time_grid_ = buildTimeGrid(survey_time, grid_step);
        group_sizes_ = context_.groupSizes();
        tested_ = Eigen::Map<const Eigen::VectorXd>(observation.tested.data(), n);
        positives_ = observation.positives();

        // Constant part of the binomial likelihood
        log_binomial_coefficients_ = 0.0;
        for (int i = 0; i < n; ++i) {
            const double nt = tested_(i);
            const double k = positives_(i);
            log_binomial_coefficients_ += std::lgamma(nt + 1.0) - std::lgamma(k + 1.0) - std::lgamma(nt - k + 1.0);
        }
    }

    const std::vector<std::string>& SeroObjectiveFunction::getParameterNames() const {
        return parameterManager_.getParameterNames();
    }

    Eigen::MatrixXd SeroObjectiveFunction::buildTransmissionMatrix(const Eigen::VectorXd& parameters) const {
        const int n = context_.numGroups();
        if (parameters.size() != n) {
            THROW_INVALID_PARAM("SeroObjectiveFunction", "Expected " + std::to_string(n) +
                                " parameters, got " + std::to_string(parameters.size()));
        }
        if (mode_ == CalibrationMode::Activity) {
            return buildContactMatrix(parameters, context_.fractions(), context_.total_population, epsilon_);
        }
        Eigen::MatrixXd beta = matrix_builder_(parameters, context_, epsilon_);
        if (beta.rows() != n || beta.cols() != n) {
            THROW_INVALID_PARAM("SeroObjectiveFunction", "Transmission matrix builder returned a " +
                                std::to_string(beta.rows()) + "x" + std::to_string(beta.cols()) +
                                " matrix for " + std::to_string(n) + " groups.");
        }
        return beta;
    }

    Eigen::VectorXd SeroObjectiveFunction::predictedSeroprevalence(const Eigen::VectorXd& parameters) const {
        const Eigen::MatrixXd beta = buildTransmissionMatrix(parameters);

        // Scaling factor fixed at 1: the raw parameter scale absorbs R0.
        CompartmentalIntegrator integrator(solver_, settings_);
        Trajectory trajectory = integrator.integrate(context_.initialState(), rates_.r, rates_.gamma, beta, time_grid_);

        return trajectory.back().R.cwiseQuotient(group_sizes_);
    }

    double SeroObjectiveFunction::logLikelihood(const Eigen::VectorXd& p) const {
        const double floor = constants::PROBABILITY_FLOOR;
        double ll = log_binomial_coefficients_;
        for (int i = 0; i < p.size(); ++i) {
            const double pi = std::min(std::max(p(i), floor), 1.0 - floor);
            ll += positives_(i) * std::log(pi) + (tested_(i) - positives_(i)) * std::log1p(-pi);
        }
        return ll;
    }

    double SeroObjectiveFunction::calculate(const Eigen::VectorXd& parameters) const {
        Eigen::VectorXd p;
        try {
            p = predictedSeroprevalence(parameters);
        } catch (const DegenerateSpectrumException& e) {
            logger.debug(LOG_SOURCE, "Rejected " + formatParameters(parameters) + ": " + e.what());
            return std::numeric_limits<double>::lowest();
        } catch (const SimulationException& e) {
            logger.debug(LOG_SOURCE, "Rejected " + formatParameters(parameters) + ": " + e.what());
            return std::numeric_limits<double>::lowest();
        }

        double total = logLikelihood(p);
        if (std::isnan(total) || std::isinf(total)) total = std::numeric_limits<double>::lowest();
        return total;
    }

} // namespace seroherd
