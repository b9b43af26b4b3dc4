#ifndef SEROHERD_CONTACT_MATRIX_BUILDER_HPP
#define SEROHERD_CONTACT_MATRIX_BUILDER_HPP

#include <Eigen/Dense>

namespace seroherd {

    /**
     * @brief Builds the unscaled group-to-group transmission matrix.
     *
     * beta(i,j) = (1 - epsilon) * a_i * a_j / sum_k(N * f_k * a_k)
     *           + epsilon * a_i / (N * f_i) * [i == j]
     *
     * epsilon = 0 is proportionate mixing, epsilon = 1 confines contacts to the own group.
     * The result is nonnegative, and symmetric whenever epsilon = 0.
     *
     * @param activities Relative activity a_i of each group (G entries).
     * @param population_fraction Share f_i of each group (G entries).
     * @param total_population N.
     * @param epsilon Assortativity coefficient in [0,1].
     * @return G x G matrix.
     * @throws InvalidParameterException for size mismatches, f_i <= 0, N <= 0,
     *         epsilon outside [0,1], or negative activities.
     */
    Eigen::MatrixXd buildContactMatrix(const Eigen::VectorXd& activities,
                                       const Eigen::VectorXd& population_fraction,
                                       double total_population,
                                       double epsilon);

} // namespace seroherd

#endif // SEROHERD_CONTACT_MATRIX_BUILDER_HPP
