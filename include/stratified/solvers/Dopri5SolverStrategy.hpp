#ifndef SEROHERD_DOPRI5_SOLVER_STRATEGY_HPP
#define SEROHERD_DOPRI5_SOLVER_STRATEGY_HPP

#include "stratified/interfaces/IOdeSolverStrategy.hpp"

namespace seroherd {

/**
 * @brief Explicit adaptive Dormand-Prince 5(4) solver using Boost.Odeint.
 * Marked final to encourage devirtualization.
 */
class Dopri5SolverStrategy final : public IOdeSolverStrategy {
public:
    Dopri5SolverStrategy() = default;

    void integrate(
        const OdeSystem& system,
        state_type& initial_state,
        const std::vector<double>& times,
        const std::function<void(const state_type&, double)>& observer,
        const SolverSettings& settings) const override;

    std::string getName() const override { return "dopri5"; }
};

} // namespace seroherd

#endif // SEROHERD_DOPRI5_SOLVER_STRATEGY_HPP
