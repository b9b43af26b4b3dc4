#ifndef SEROHERD_CONTROLLED_STEP_LOOP_HPP
#define SEROHERD_CONTROLLED_STEP_LOOP_HPP

#include "stratified/SolverSettings.hpp"
#include "exceptions/Exceptions.hpp"
#include <boost/numeric/odeint/stepper/controlled_step_result.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace seroherd {

    /**
     * @brief Drives a Boost.Odeint controlled stepper across an output grid.
     *
     * Mirrors integrate_times(), with two deterministic give-up conditions:
     * more than settings.max_step_reductions consecutive rejected steps, or more than
     * settings.max_steps_per_interval accepted steps between two output times.
     * Both raise IntegrationDivergenceException carrying the last accepted time.
     *
     * @param stepper Controlled stepper exposing try_step(system, x, t, dt).
     * @param system System argument forwarded to try_step.
     * @param state State at times.front(), advanced in place.
     * @param times Strictly increasing output grid.
     * @param observer Callable(const State&, double) invoked at each output time.
     */
    template <class Stepper, class System, class State, class Observer>
    void driveControlledStepper(Stepper& stepper, System system, State& state,
                                const std::vector<double>& times, Observer observer,
                                const SolverSettings& settings, const std::string& source) {
        namespace odeint = boost::numeric::odeint;

        double t = times.front();
        double dt = settings.dt_hint;
        observer(state, t);

        for (size_t k = 1; k < times.size(); ++k) {
            const double t_next = times[k];
            const double eps = 1e-12 * std::max(1.0, std::abs(t_next));
            int accepted = 0;
            int consecutive_rejections = 0;

            while (t_next - t > eps) {
                double dt_try = std::min(dt, t_next - t);
                const odeint::controlled_step_result res = stepper.try_step(system, state, t, dt_try);
                if (res == odeint::success) {
                    consecutive_rejections = 0;
                    dt = std::max(dt, dt_try);
                    for (const auto& v : state) {
                        if (!std::isfinite(v)) {
                            throw IntegrationDivergenceException(source,
                                "State became non-finite at t=" + std::to_string(t), times[k - 1]);
                        }
                    }
                    if (++accepted > settings.max_steps_per_interval) {
                        throw IntegrationDivergenceException(source,
                            "Exceeded " + std::to_string(settings.max_steps_per_interval) +
                            " steps before reaching t=" + std::to_string(t_next), t);
                    }
                } else {
                    dt = dt_try;
                    if (++consecutive_rejections > settings.max_step_reductions) {
                        throw IntegrationDivergenceException(source,
                            "Could not meet the error tolerance after " +
                            std::to_string(settings.max_step_reductions) +
                            " step-size reductions (dt=" + std::to_string(dt) + ")", t);
                    }
                }
            }
            t = t_next;
            observer(state, t);
        }
    }

} // namespace seroherd

#endif // SEROHERD_CONTROLLED_STEP_LOOP_HPP
