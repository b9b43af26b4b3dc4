#include "stratified/SolverSettings.hpp"
#include "exceptions/Exceptions.hpp"

#include <cmath>

namespace seroherd {

void SolverSettings::validate() const {
    const std::string src = "SolverSettings::validate";
    if (!(abs_error > 0.0) || !(rel_error > 0.0)) THROW_INVALID_PARAM(src, "Error tolerances must be positive.");
    if (!(dt_hint > 0.0)) THROW_INVALID_PARAM(src, "dt_hint must be positive.");
    if (max_step_reductions <= 0) THROW_INVALID_PARAM(src, "max_step_reductions must be positive.");
    if (max_steps_per_interval <= 0) THROW_INVALID_PARAM(src, "max_steps_per_interval must be positive.");
    if (!(negativity_tolerance > 0.0)) THROW_INVALID_PARAM(src, "negativity_tolerance must be positive.");
    if (!(mass_tolerance > 0.0)) THROW_INVALID_PARAM(src, "mass_tolerance must be positive.");
}

SolverSettings SolverSettings::fromMap(const std::map<std::string, double>& settings) {
    SolverSettings s;
    auto get = [&](const std::string& key, double def) {
        auto it = settings.find(key);
        return (it != settings.end()) ? it->second : def;
    };
    s.abs_error = get("abs_error", s.abs_error);
    s.rel_error = get("rel_error", s.rel_error);
    s.dt_hint = get("dt_hint", s.dt_hint);
    s.max_step_reductions = static_cast<int>(get("max_step_reductions", s.max_step_reductions));
    s.max_steps_per_interval = static_cast<int>(get("max_steps_per_interval", s.max_steps_per_interval));
    s.negativity_tolerance = get("negativity_tolerance", s.negativity_tolerance);
    s.mass_tolerance = get("mass_tolerance", s.mass_tolerance);
    s.validate();
    return s;
}

void validateTimeGrid(const std::vector<double>& times, const std::string& source) {
    if (times.empty()) THROW_INVALID_PARAM(source, "Time grid is empty.");
    for (size_t k = 0; k < times.size(); ++k) {
        if (!std::isfinite(times[k])) THROW_INVALID_PARAM(source, "Time grid contains a non-finite value.");
        if (k > 0 && !(times[k] > times[k - 1])) {
            THROW_INVALID_PARAM(source, "Time grid must be strictly increasing (index " + std::to_string(k) + ").");
        }
    }
}

std::vector<double> buildTimeGrid(double end_time, double step) {
    if (!(end_time > 0.0) || !std::isfinite(end_time)) {
        THROW_INVALID_PARAM("buildTimeGrid", "End time must be positive, got " + std::to_string(end_time));
    }
    if (!(step > 0.0) || !std::isfinite(step)) {
        THROW_INVALID_PARAM("buildTimeGrid", "Grid step must be positive, got " + std::to_string(step));
    }
    std::vector<double> grid;
    const int intervals = static_cast<int>(std::floor(end_time / step));
    grid.reserve(intervals + 2);
    for (int k = 0; k <= intervals; ++k) {
        grid.push_back(k * step);
    }
    // Merge a sliver interval into the final point
    if (grid.size() == 1 || end_time - grid.back() > 1e-9 * step) {
        grid.push_back(end_time);
    } else {
        grid.back() = end_time;
    }
    return grid;
}

} // namespace seroherd
