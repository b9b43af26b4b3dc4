#include "model/CompartmentalIntegrator.hpp"
#include "model/StratifiedSEIRModel.hpp"
#include "stratified/solvers/StiffnessSwitchingSolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace seroherd {

    static const std::string LOG_SOURCE = "INTEGRATOR";

    CompartmentalIntegrator::CompartmentalIntegrator(std::shared_ptr<IOdeSolverStrategy> solver,
                                                     SolverSettings settings)
        : solver_(solver ? std::move(solver) : std::make_shared<StiffnessSwitchingSolverStrategy>()),
          settings_(settings)
    {
        settings_.validate();
    }

    void CompartmentalIntegrator::validateInitialState(const CompartmentState& state, int num_groups) const {
        const std::string src = "CompartmentalIntegrator::integrate";
        if (state.S.size() != num_groups || state.E.size() != num_groups ||
            state.I.size() != num_groups || state.R.size() != num_groups) {
            THROW_INVALID_PARAM(src, "Initial state does not have " + std::to_string(num_groups) + " groups in every compartment.");
        }
        const Eigen::VectorXd totals = state.groupTotals();
        for (int i = 0; i < num_groups; ++i) {
            if (state.S(i) < 0.0 || state.E(i) < 0.0 || state.I(i) < 0.0 || state.R(i) < 0.0) {
                THROW_INVALID_PARAM(src, "Initial compartments of group " + std::to_string(i) + " must be non-negative.");
            }
            if (!std::isfinite(totals(i)) || !(totals(i) > 0.0)) {
                THROW_INVALID_PARAM(src, "Group " + std::to_string(i) + " has no population.");
            }
        }
    }

    Trajectory CompartmentalIntegrator::integrate(const CompartmentState& initial_state,
                                                  double r,
                                                  double gamma,
                                                  const Eigen::MatrixXd& beta_scaled,
                                                  const std::vector<double>& time_grid) const {
        const std::string src = "CompartmentalIntegrator::integrate";
        validateTimeGrid(time_grid, src);

        // Each call owns its model; no state is shared between integrations.
        StratifiedSEIRModel model(beta_scaled, r, gamma);
        const int n = model.getNumGroups();
        validateInitialState(initial_state, n);

        const Eigen::VectorXd group_sizes = initial_state.groupTotals();
        Trajectory trajectory;
        trajectory.time_points.reserve(time_grid.size());
        trajectory.states.reserve(time_grid.size());

        int clamped_values = 0;
        double worst_clamp = 0.0;
        double last_stable_time = time_grid.front();

        auto observer = [&](const state_type& x, double t) {
            CompartmentState state = CompartmentState::fromStateVector(x, n);
            Eigen::VectorXd* blocks[] = {&state.S, &state.E, &state.I, &state.R};

            for (int i = 0; i < n; ++i) {
                const double scale = std::max(1.0, group_sizes(i));
                const double floor_value = -settings_.negativity_tolerance * scale;
                for (Eigen::VectorXd* block : blocks) {
                    double& v = (*block)(i);
                    if (v >= 0.0) continue;
                    if (v < floor_value) {
                        throw PhysicalInvariantViolationException(src,
                            "Compartment of group " + std::to_string(i) + " fell to " + std::to_string(v) +
                            " at t=" + std::to_string(t), t, i, last_stable_time);
                    }
                    worst_clamp = std::max(worst_clamp, -v);
                    ++clamped_values;
                    v = 0.0;
                }
                const double drift = std::abs(state.S(i) + state.E(i) + state.I(i) + state.R(i) - group_sizes(i));
                if (drift > settings_.mass_tolerance * scale) {
                    throw PhysicalInvariantViolationException(src,
                        "Population of group " + std::to_string(i) + " drifted by " + std::to_string(drift) +
                        " at t=" + std::to_string(t), t, i, last_stable_time);
                }
            }

            trajectory.time_points.push_back(t);
            trajectory.states.push_back(std::move(state));
            last_stable_time = t;
        };

        state_type x = initial_state.toStateVector();
        solver_->integrate(model.asOdeSystem(), x, time_grid, observer, settings_);

        if (clamped_values > 0) {
            Logger& logger = Logger::getInstance();
            const std::string message = "Clamped " + std::to_string(clamped_values) +
                " roundoff-level negative compartment values (largest magnitude " + std::to_string(worst_clamp) + ").";
            if (worst_clamp > settings_.abs_error) {
                logger.warning(LOG_SOURCE, message);
            } else {
                logger.debug(LOG_SOURCE, message);
            }
        }
        return trajectory;
    }

    Trajectory integrate(const CompartmentState& initial_state,
                         double r,
                         double gamma,
                         const Eigen::MatrixXd& beta_scaled,
                         const std::vector<double>& time_grid,
                         const SolverSettings& settings) {
        CompartmentalIntegrator integrator(nullptr, settings);
        return integrator.integrate(initial_state, r, gamma, beta_scaled, time_grid);
    }

} // namespace seroherd
