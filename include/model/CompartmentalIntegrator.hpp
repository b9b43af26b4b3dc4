#ifndef SEROHERD_COMPARTMENTAL_INTEGRATOR_HPP
#define SEROHERD_COMPARTMENTAL_INTEGRATOR_HPP

#include "model/CompartmentState.hpp"
#include "stratified/SolverSettings.hpp"
#include "stratified/interfaces/IOdeSolverStrategy.hpp"
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace seroherd {

    /**
     * @brief Integrates the stratified SEIR system over a caller-supplied time grid.
     *
     * Every recorded state is checked against two physical invariants: compartments stay
     * nonnegative and S_i + E_i + I_i + R_i stays equal to the initial group total.
     * Negative values down to -negativity_tolerance * max(1, N_i) are clamped to zero and
     * logged; anything further below, or a relative mass drift above mass_tolerance, raises
     * PhysicalInvariantViolationException.
     */
    class CompartmentalIntegrator {
    public:
        /**
         * @param solver ODE solver strategy (nullptr selects StiffnessSwitchingSolverStrategy).
         * @param settings Tolerances and give-up limits.
         */
        explicit CompartmentalIntegrator(std::shared_ptr<IOdeSolverStrategy> solver = nullptr,
                                         SolverSettings settings = SolverSettings());

        /**
         * @brief Runs the model from initial_state over time_grid.
         *
         * @param initial_state Compartment counts at time_grid.front().
         * @param r Latent progression rate.
         * @param gamma Recovery rate.
         * @param beta_scaled R0-scaled G x G transmission matrix.
         * @param time_grid Strictly increasing output times.
         * @return Trajectory with one state per grid point.
         * @throws InvalidParameterException for inconsistent or non-physical inputs.
         * @throws IntegrationDivergenceException if the solver gives up.
         * @throws PhysicalInvariantViolationException on persistent negativity or mass drift.
         */
        Trajectory integrate(const CompartmentState& initial_state,
                             double r,
                             double gamma,
                             const Eigen::MatrixXd& beta_scaled,
                             const std::vector<double>& time_grid) const;

        const SolverSettings& getSettings() const { return settings_; }
        const IOdeSolverStrategy& getSolver() const { return *solver_; }

    private:
        std::shared_ptr<IOdeSolverStrategy> solver_;
        SolverSettings settings_;

        void validateInitialState(const CompartmentState& state, int num_groups) const;
    };

    /**
     * @brief Convenience form using the default stiffness-switching solver.
     */
    Trajectory integrate(const CompartmentState& initial_state,
                         double r,
                         double gamma,
                         const Eigen::MatrixXd& beta_scaled,
                         const std::vector<double>& time_grid,
                         const SolverSettings& settings = SolverSettings());

} // namespace seroherd

#endif // SEROHERD_COMPARTMENTAL_INTEGRATOR_HPP
