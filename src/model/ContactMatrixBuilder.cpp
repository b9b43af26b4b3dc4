#include "model/ContactMatrixBuilder.hpp"
#include "exceptions/Exceptions.hpp"

#include <cmath>
#include <string>

namespace seroherd {

Eigen::MatrixXd buildContactMatrix(const Eigen::VectorXd& activities,
                                   const Eigen::VectorXd& population_fraction,
                                   double total_population,
                                   double epsilon) {
    const std::string src = "buildContactMatrix";
    const Eigen::Index n = activities.size();

    if (n == 0) THROW_INVALID_PARAM(src, "At least one group is required.");
    if (population_fraction.size() != n) {
        THROW_INVALID_PARAM(src, "activities has " + std::to_string(n) + " entries but population_fraction has " +
                            std::to_string(population_fraction.size()));
    }
    if (!(total_population > 0.0)) THROW_INVALID_PARAM(src, "Total population must be positive.");
    if (!(epsilon >= 0.0 && epsilon <= 1.0)) {
        THROW_INVALID_PARAM(src, "Assortativity epsilon must lie in [0,1], got " + std::to_string(epsilon));
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        if (!(population_fraction(i) > 0.0)) {
            THROW_INVALID_PARAM(src, "population_fraction[" + std::to_string(i) + "] must be positive.");
        }
        if (!(activities(i) >= 0.0) || !std::isfinite(activities(i))) {
            THROW_INVALID_PARAM(src, "activities[" + std::to_string(i) + "] must be finite and non-negative.");
        }
    }

    const Eigen::VectorXd group_sizes = total_population * population_fraction;
    const double activity_mass = group_sizes.dot(activities);

    Eigen::MatrixXd beta = Eigen::MatrixXd::Zero(n, n);
    if (epsilon < 1.0) {
        if (!(activity_mass > 0.0)) THROW_INVALID_PARAM(src, "All activities are zero.");
        beta.noalias() = ((1.0 - epsilon) / activity_mass) * (activities * activities.transpose());
    }
    if (epsilon > 0.0) {
        beta.diagonal().array() += epsilon * activities.array() / group_sizes.array();
    }
    return beta;
}

} // namespace seroherd
