#ifndef SEROHERD_SCENARIO_TYPES_HPP
#define SEROHERD_SCENARIO_TYPES_HPP

#include "model/CompartmentState.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace seroherd {

    /**
     * @brief One demographic stratum of a scenario.
     */
    struct DemographicGroup {
        /** @brief Share of the total population, in (0,1). */
        double population_fraction = 0.0;
        /** @brief Relative contact multiplier, > 0. */
        double activity = 1.0;
        /** @brief Infectious individuals at t = 0 (absolute count). */
        double initial_infected = 0.0;
    };

    /**
     * @brief Total population and its demographic groups. Read-only once validated.
     */
    struct PopulationContext {
        double total_population = 0.0;
        std::vector<DemographicGroup> groups;

        int numGroups() const { return static_cast<int>(groups.size()); }

        /**
         * @brief Checks sizes, fractions (each in (0,1), summing to 1), activities and
         * initial infections.
         * @throws InvalidParameterException on the first violated condition.
         */
        void validate() const;

        Eigen::VectorXd fractions() const;
        Eigen::VectorXd activities() const;

        /** @brief N * population_fraction for each group. */
        Eigen::VectorXd groupSizes() const;

        /** @brief S = N_i - I0_i, E = 0, I = I0_i, R = 0. */
        CompartmentState initialState() const;
    };

    /**
     * @brief Serosurvey counts per group.
     */
    struct SeroObservation {
        std::vector<double> tested;
        std::vector<double> seropositive_fraction;

        /**
         * @throws InvalidParameterException if sizes differ from num_groups, a sample size
         * is negative, or a fraction lies outside [0,1].
         */
        void validate(int num_groups) const;

        /** @brief round(seropositive_fraction_i * tested_i). */
        Eigen::VectorXd positives() const;
    };

    /**
     * @brief Per-capita progression rates shared by all groups.
     */
    struct TransitionRates {
        /** @brief 1 / mean latent period. */
        double r = 0.0;
        /** @brief 1 / mean infectious period. */
        double gamma = 0.0;

        static TransitionRates fromPeriods(double latent_period, double infectious_period);

        void validate() const;
    };

    enum class CalibrationMode {
        Activity,
        Susceptibility
    };

    /**
     * @brief Maps "activity" / "susceptibility" (case-insensitive) to a mode.
     * @throws ModelNotRecognizedException for any other string.
     */
    CalibrationMode parseCalibrationMode(const std::string& mode);

    std::string calibrationModeToString(CalibrationMode mode);

} // namespace seroherd

#endif // SEROHERD_SCENARIO_TYPES_HPP
