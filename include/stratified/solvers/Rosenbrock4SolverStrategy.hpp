#ifndef SEROHERD_ROSENBROCK4_SOLVER_STRATEGY_HPP
#define SEROHERD_ROSENBROCK4_SOLVER_STRATEGY_HPP

#include "stratified/interfaces/IOdeSolverStrategy.hpp"

namespace seroherd {

/**
 * @brief Linearly implicit Rosenbrock 4(3) solver for stiff systems (Boost.Odeint + uBLAS).
 *
 * Needs the analytic Jacobian of the system; integrating a system without one throws
 * InvalidParameterException.
 */
class Rosenbrock4SolverStrategy final : public IOdeSolverStrategy {
public:
    Rosenbrock4SolverStrategy() = default;

    void integrate(
        const OdeSystem& system,
        state_type& initial_state,
        const std::vector<double>& times,
        const std::function<void(const state_type&, double)>& observer,
        const SolverSettings& settings) const override;

    std::string getName() const override { return "rosenbrock4"; }
};

} // namespace seroherd

#endif // SEROHERD_ROSENBROCK4_SOLVER_STRATEGY_HPP
