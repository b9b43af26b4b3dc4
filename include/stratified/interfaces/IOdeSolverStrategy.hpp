#ifndef SEROHERD_I_ODE_SOLVER_STRATEGY_HPP
#define SEROHERD_I_ODE_SOLVER_STRATEGY_HPP

#include "stratified/SolverSettings.hpp"
#include <Eigen/Dense>
#include <functional>
#include <string>
#include <vector>

namespace seroherd {

    using state_type = std::vector<double>;

    /**
     * @brief ODE right-hand side plus an optional analytic Jacobian.
     */
    struct OdeSystem {
        std::function<void(const state_type&, state_type&, double)> derivatives;
        /** @brief Empty when the model has no Jacobian; implicit solvers then refuse to run. */
        std::function<void(const state_type&, Eigen::MatrixXd&, double)> jacobian;
    };

    /**
     * @brief Strategy interface for integrating an ODE system over an output grid.
     */
    class IOdeSolverStrategy {
    public:
        virtual ~IOdeSolverStrategy() = default;

        /**
         * @brief Integrates the system, calling observer at every time in times
         * (including times.front(), with the initial state).
         *
         * @param system ODE system.
         * @param initial_state State at times.front(); holds the state at times.back() on return.
         * @param times Strictly increasing output grid.
         * @param observer Called once per output time, in order.
         * @param settings Tolerances and give-up limits.
         * @throws IntegrationDivergenceException if the error tolerance cannot be met within
         *         the allowed step reductions, or the state becomes non-finite.
         * @throws SimulationException for other backend failures.
         */
        virtual void integrate(
            const OdeSystem& system,
            state_type& initial_state,
            const std::vector<double>& times,
            const std::function<void(const state_type&, double)>& observer,
            const SolverSettings& settings) const = 0;

        virtual std::string getName() const = 0;
    };

} // namespace seroherd

#endif // SEROHERD_I_ODE_SOLVER_STRATEGY_HPP
