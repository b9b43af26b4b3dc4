#ifndef SEROHERD_STIFFNESS_SWITCHING_SOLVER_STRATEGY_HPP
#define SEROHERD_STIFFNESS_SWITCHING_SOLVER_STRATEGY_HPP

#include "stratified/interfaces/IOdeSolverStrategy.hpp"
#include "stratified/solvers/Dopri5SolverStrategy.hpp"
#include "stratified/solvers/Rosenbrock4SolverStrategy.hpp"

namespace seroherd {

/**
 * @brief Default solver: explicit Dopri5, falling back to Rosenbrock4 when Dopri5 diverges.
 *
 * Step-size collapse of the explicit method is the usual symptom of stiffness. On an
 * IntegrationDivergenceException the whole grid is re-integrated from the initial state
 * with the implicit method. The observer only sees the output of the run that succeeded.
 */
class StiffnessSwitchingSolverStrategy final : public IOdeSolverStrategy {
public:
    StiffnessSwitchingSolverStrategy() = default;

    void integrate(
        const OdeSystem& system,
        state_type& initial_state,
        const std::vector<double>& times,
        const std::function<void(const state_type&, double)>& observer,
        const SolverSettings& settings) const override;

    std::string getName() const override { return "dopri5+rosenbrock4"; }

private:
    Dopri5SolverStrategy explicit_solver_;
    Rosenbrock4SolverStrategy implicit_solver_;
};

} // namespace seroherd

#endif // SEROHERD_STIFFNESS_SWITCHING_SOLVER_STRATEGY_HPP
