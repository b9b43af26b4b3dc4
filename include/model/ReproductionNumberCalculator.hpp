#ifndef SEROHERD_REPRODUCTION_NUMBER_CALCULATOR_HPP
#define SEROHERD_REPRODUCTION_NUMBER_CALCULATOR_HPP

#include <Eigen/Dense>

namespace seroherd {

    /**
     * @brief Calculates R0 and Rt of the stratified SEIR model with the next generation
     * matrix method.
     *
     * With a single infectious stage the next generation matrix reduces to
     * K(i,j) = S_i * beta(i,j) / (s * gamma), where S is the susceptible pool the matrix is
     * evaluated at (S = N_i for R0) and s the scaling factor applied to the unscaled matrix.
     * The reproduction number is its Perron-Frobenius eigenvalue: K is nonnegative, so its
     * spectral radius is itself a real, nonnegative eigenvalue.
     */
    class ReproductionNumberCalculator {
    public:
        /**
         * @param beta_unscaled G x G nonnegative transmission matrix.
         * @param gamma Recovery rate (1 / infectious period).
         * @param scaling_factor Divisor applied to beta_unscaled (1 for an already scaled matrix).
         * @throws InvalidParameterException if beta is not square or has negative or
         *         non-finite entries, or if gamma or scaling_factor is not positive.
         */
        ReproductionNumberCalculator(const Eigen::MatrixXd& beta_unscaled, double gamma, double scaling_factor = 1.0);

        int getNumGroups() const { return static_cast<int>(beta_.rows()); }

        /** @brief K = diag(susceptible) * beta / s / gamma. */
        Eigen::MatrixXd buildNextGenerationMatrix(const Eigen::VectorXd& susceptible) const;

        /**
         * @brief Dominant eigenvalue of the next generation matrix of a fully susceptible population.
         * @param group_sizes N_i for every group.
         * @throws DegenerateSpectrumException if the dominant eigenvalue is complex or not positive.
         */
        double calculateR0(const Eigen::VectorXd& group_sizes) const;

        /**
         * @brief Effective reproduction number for the current susceptible pool.
         * A pool exhausted in every group gives 0 rather than an error.
         * @throws DegenerateSpectrumException if the dominant eigenvalue is complex or negative.
         */
        double calculateRt(const Eigen::VectorXd& S_current) const;

        /**
         * @brief Selects the dominant eigenvalue of a general (non-symmetric) real matrix.
         *
         * The eigenvalue of largest magnitude is chosen; magnitudes equal to within
         * constants::EIGENVALUE_TIE_TOLERANCE are resolved in favour of the largest real part.
         * The solver's own ordering of eigenvalues is never relied on.
         *
         * @param matrix Square matrix.
         * @param require_positive Reject a dominant eigenvalue <= 0 (otherwise only < 0).
         * @return Real part of the dominant eigenvalue.
         * @throws DegenerateSpectrumException if the eigen-decomposition fails or the
         *         dominant eigenvalue has an imaginary part beyond tolerance, or fails the sign check.
         */
        static double dominantEigenvalue(const Eigen::MatrixXd& matrix, bool require_positive = true);

    private:
        Eigen::MatrixXd beta_;
        double gamma_;
        double scaling_factor_;
    };

    /**
     * @brief Scaling factor s such that beta / s has next-generation dominant eigenvalue r0_target.
     *
     * Computes M(i,j) = N * f_i * beta(i,j) / gamma, its dominant eigenvalue lambda_1, and
     * returns s = lambda_1 / r0_target. The matrix itself is never rescaled entry by entry.
     *
     * @throws InvalidParameterException for inconsistent sizes or non-positive N, gamma,
     *         fractions or r0_target.
     * @throws DegenerateSpectrumException if lambda_1 is complex or not positive.
     */
    double calibrateR0(const Eigen::MatrixXd& beta,
                       double gamma,
                       const Eigen::VectorXd& population_fraction,
                       double total_population,
                       double r0_target);

} // namespace seroherd

#endif // SEROHERD_REPRODUCTION_NUMBER_CALCULATOR_HPP
