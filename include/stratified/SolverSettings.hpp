#ifndef SEROHERD_SOLVER_SETTINGS_HPP
#define SEROHERD_SOLVER_SETTINGS_HPP

#include <map>
#include <string>
#include <vector>

namespace seroherd {

    /**
     * @brief Numerical tolerances and give-up limits for one integration call.
     */
    struct SolverSettings {
        /** @brief Absolute error tolerance of the adaptive stepper (in individuals). */
        double abs_error = 1e-8;
        /** @brief Relative error tolerance of the adaptive stepper. */
        double rel_error = 1e-8;
        /** @brief Initial step size guess. */
        double dt_hint = 0.1;
        /** @brief Consecutive rejected steps tolerated before reporting divergence. */
        int max_step_reductions = 60;
        /** @brief Accepted steps tolerated between two output times. */
        int max_steps_per_interval = 200000;
        /** @brief Negative excursions down to -negativity_tolerance * max(1, N_i) are clamped. */
        double negativity_tolerance = 1e-6;
        /** @brief Allowed relative drift of S_i + E_i + I_i + R_i from N_i. */
        double mass_tolerance = 1e-3;

        /**
         * @throws InvalidParameterException if any value is not positive.
         */
        void validate() const;

        /**
         * @brief Overrides the defaults with the keys present in the map
         * ("abs_error", "rel_error", "dt_hint", "max_step_reductions",
         * "max_steps_per_interval", "negativity_tolerance", "mass_tolerance").
         * Unknown keys are ignored.
         */
        static SolverSettings fromMap(const std::map<std::string, double>& settings);
    };

    /**
     * @brief Checks that an output grid is non-empty, finite and strictly increasing.
     * @throws InvalidParameterException otherwise.
     */
    void validateTimeGrid(const std::vector<double>& times, const std::string& source);

    /**
     * @brief Output grid 0, step, 2*step, ... ending exactly at end_time.
     * @throws InvalidParameterException if end_time or step is not positive.
     */
    std::vector<double> buildTimeGrid(double end_time, double step);

} // namespace seroherd

#endif // SEROHERD_SOLVER_SETTINGS_HPP
