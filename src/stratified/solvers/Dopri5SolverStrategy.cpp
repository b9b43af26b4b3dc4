#include "stratified/solvers/Dopri5SolverStrategy.hpp"
#include "stratified/solvers/ControlledStepLoop.hpp"
#include "exceptions/Exceptions.hpp"
#include <boost/numeric/odeint/stepper/runge_kutta_dopri5.hpp>
#include <boost/numeric/odeint/stepper/generation.hpp>

namespace seroherd {

void Dopri5SolverStrategy::integrate(
    const OdeSystem& system,
    state_type& initial_state,
    const std::vector<double>& times,
    const std::function<void(const state_type&, double)>& observer,
    const SolverSettings& settings) const
{
    using namespace boost::numeric::odeint;
    const std::string src = "Dopri5SolverStrategy::integrate";

    if (!system.derivatives) THROW_INVALID_PARAM(src, "ODE system has no right-hand side.");
    validateTimeGrid(times, src);
    settings.validate();

    try {
        auto stepper = make_controlled<runge_kutta_dopri5<state_type>>(settings.abs_error, settings.rel_error);
        driveControlledStepper(stepper, system.derivatives, initial_state, times, observer, settings, src);
    } catch (const ModelException&) {
        throw;
    } catch (const std::exception& e) {
        throw SimulationException(src, "Boost.Odeint integration failed: " + std::string(e.what()));
    }
}

} // namespace seroherd
