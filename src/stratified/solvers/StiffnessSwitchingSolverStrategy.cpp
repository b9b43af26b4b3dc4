#include "stratified/solvers/StiffnessSwitchingSolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <utility>

namespace seroherd {

void StiffnessSwitchingSolverStrategy::integrate(
    const OdeSystem& system,
    state_type& initial_state,
    const std::vector<double>& times,
    const std::function<void(const state_type&, double)>& observer,
    const SolverSettings& settings) const
{
    const state_type start = initial_state;
    std::vector<std::pair<state_type, double>> buffered;
    buffered.reserve(times.size());
    auto record = [&buffered](const state_type& x, double t) { buffered.emplace_back(x, t); };

    try {
        explicit_solver_.integrate(system, initial_state, times, record, settings);
    } catch (const IntegrationDivergenceException& e) {
        if (!system.jacobian) throw;

        Logger::getInstance().warning("StiffnessSwitchingSolver",
            "Explicit solver diverged (last stable t=" + std::to_string(e.getLastStableTime()) +
            "); switching to Rosenbrock4.");
        buffered.clear();
        initial_state = start;
        implicit_solver_.integrate(system, initial_state, times, record, settings);
    }

    for (const auto& entry : buffered) {
        observer(entry.first, entry.second);
    }
}

} // namespace seroherd
