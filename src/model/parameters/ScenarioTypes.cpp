#include "model/parameters/ScenarioTypes.hpp"
#include "model/ModelConstants.hpp"
#include "exceptions/Exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace seroherd {

void PopulationContext::validate() const {
    const std::string src = "PopulationContext::validate";
    if (groups.empty()) THROW_INVALID_PARAM(src, "Population context has no demographic groups.");
    if (!(total_population > 0.0) || !std::isfinite(total_population)) {
        THROW_INVALID_PARAM(src, "Total population must be positive, got " + std::to_string(total_population));
    }

    double fraction_sum = 0.0;
    for (size_t i = 0; i < groups.size(); ++i) {
        const DemographicGroup& g = groups[i];
        const std::string tag = "group " + std::to_string(i) + ": ";
        if (!(g.population_fraction > 0.0 && g.population_fraction <= 1.0)) {
            THROW_INVALID_PARAM(src, tag + "population fraction must lie in (0,1], got " + std::to_string(g.population_fraction));
        }
        if (!(g.activity > 0.0) || !std::isfinite(g.activity)) {
            THROW_INVALID_PARAM(src, tag + "activity must be positive, got " + std::to_string(g.activity));
        }
        const double group_size = total_population * g.population_fraction;
        if (g.initial_infected < 0.0 || g.initial_infected > group_size) {
            THROW_INVALID_PARAM(src, tag + "initial infected must lie in [0, " + std::to_string(group_size) + "]");
        }
        fraction_sum += g.population_fraction;
    }
    if (std::abs(fraction_sum - 1.0) > constants::FRACTION_SUM_TOLERANCE) {
        THROW_INVALID_PARAM(src, "Population fractions sum to " + std::to_string(fraction_sum) + ", expected 1.");
    }
}

Eigen::VectorXd PopulationContext::fractions() const {
    Eigen::VectorXd f(numGroups());
    for (int i = 0; i < numGroups(); ++i) f(i) = groups[i].population_fraction;
    return f;
}

Eigen::VectorXd PopulationContext::activities() const {
    Eigen::VectorXd a(numGroups());
    for (int i = 0; i < numGroups(); ++i) a(i) = groups[i].activity;
    return a;
}

Eigen::VectorXd PopulationContext::groupSizes() const {
    return total_population * fractions();
}

CompartmentState PopulationContext::initialState() const {
    const int n = numGroups();
    CompartmentState state(n);
    const Eigen::VectorXd sizes = groupSizes();
    for (int i = 0; i < n; ++i) {
        state.I(i) = groups[i].initial_infected;
        state.S(i) = sizes(i) - groups[i].initial_infected;
    }
    return state;
}

void SeroObservation::validate(int num_groups) const {
    const std::string src = "SeroObservation::validate";
    if (static_cast<int>(tested.size()) != num_groups || static_cast<int>(seropositive_fraction.size()) != num_groups) {
        THROW_INVALID_PARAM(src, "Expected " + std::to_string(num_groups) + " groups, got tested=" +
                            std::to_string(tested.size()) + ", fractions=" + std::to_string(seropositive_fraction.size()));
    }
    for (int i = 0; i < num_groups; ++i) {
        if (tested[i] < 0.0 || !std::isfinite(tested[i])) {
            THROW_INVALID_PARAM(src, "Sample size of group " + std::to_string(i) + " must be non-negative.");
        }
        if (seropositive_fraction[i] < 0.0 || seropositive_fraction[i] > 1.0) {
            THROW_INVALID_PARAM(src, "Seropositive fraction of group " + std::to_string(i) + " must lie in [0,1].");
        }
    }
}

Eigen::VectorXd SeroObservation::positives() const {
    Eigen::VectorXd k(static_cast<Eigen::Index>(tested.size()));
    for (size_t i = 0; i < tested.size(); ++i) {
        k(static_cast<Eigen::Index>(i)) = std::round(seropositive_fraction[i] * tested[i]);
    }
    return k;
}

TransitionRates TransitionRates::fromPeriods(double latent_period, double infectious_period) {
    if (!(latent_period > 0.0) || !(infectious_period > 0.0)) {
        THROW_INVALID_PARAM("TransitionRates::fromPeriods", "Latent and infectious periods must be positive.");
    }
    TransitionRates rates;
    rates.r = 1.0 / latent_period;
    rates.gamma = 1.0 / infectious_period;
    return rates;
}

void TransitionRates::validate() const {
    if (!(r > 0.0) || !std::isfinite(r)) {
        THROW_INVALID_PARAM("TransitionRates::validate", "Latent progression rate r must be positive.");
    }
    if (!(gamma > 0.0) || !std::isfinite(gamma)) {
        THROW_INVALID_PARAM("TransitionRates::validate", "Recovery rate gamma must be positive.");
    }
}

CalibrationMode parseCalibrationMode(const std::string& mode) {
    std::string lowered(mode);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "activity") return CalibrationMode::Activity;
    if (lowered == "susceptibility") return CalibrationMode::Susceptibility;
    throw ModelNotRecognizedException("parseCalibrationMode", mode);
}

std::string calibrationModeToString(CalibrationMode mode) {
    return mode == CalibrationMode::Activity ? "activity" : "susceptibility";
}

} // namespace seroherd
