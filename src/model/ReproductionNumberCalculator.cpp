#include "model/ReproductionNumberCalculator.hpp"
#include "model/ModelConstants.hpp"
#include "exceptions/Exceptions.hpp"

#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>
#include <string>

namespace seroherd {

ReproductionNumberCalculator::ReproductionNumberCalculator(const Eigen::MatrixXd& beta_unscaled,
                                                           double gamma,
                                                           double scaling_factor)
    : beta_(beta_unscaled), gamma_(gamma), scaling_factor_(scaling_factor)
{
    const std::string src = "ReproductionNumberCalculator::constructor";
    if (beta_.rows() == 0 || beta_.rows() != beta_.cols()) {
        THROW_INVALID_PARAM(src, "Transmission matrix must be square and non-empty.");
    }
    if (!beta_.allFinite() || (beta_.array() < 0.0).any()) {
        THROW_INVALID_PARAM(src, "Transmission matrix entries must be finite and non-negative.");
    }
    if (!(gamma_ > 0.0)) THROW_INVALID_PARAM(src, "Recovery rate gamma must be positive.");
    if (!(scaling_factor_ > 0.0) || !std::isfinite(scaling_factor_)) {
        THROW_INVALID_PARAM(src, "Scaling factor must be positive and finite.");
    }
}

Eigen::MatrixXd ReproductionNumberCalculator::buildNextGenerationMatrix(const Eigen::VectorXd& susceptible) const {
    if (susceptible.size() != beta_.rows()) {
        THROW_INVALID_PARAM("ReproductionNumberCalculator::buildNextGenerationMatrix",
                            "Susceptible vector has " + std::to_string(susceptible.size()) +
                            " entries, expected " + std::to_string(beta_.rows()));
    }
    // Roundoff-level negative S would make K slightly non-nonnegative.
    const Eigen::VectorXd S = susceptible.cwiseMax(0.0);
    return (S.asDiagonal() * beta_) / (scaling_factor_ * gamma_);
}

double ReproductionNumberCalculator::calculateR0(const Eigen::VectorXd& group_sizes) const {
    return dominantEigenvalue(buildNextGenerationMatrix(group_sizes), true);
}

double ReproductionNumberCalculator::calculateRt(const Eigen::VectorXd& S_current) const {
    const Eigen::MatrixXd K = buildNextGenerationMatrix(S_current);
    if (K.isZero(0.0)) return 0.0;
    return dominantEigenvalue(K, false);
}

double ReproductionNumberCalculator::dominantEigenvalue(const Eigen::MatrixXd& matrix, bool require_positive) {
    const std::string src = "ReproductionNumberCalculator::dominantEigenvalue";
    if (matrix.rows() == 0 || matrix.rows() != matrix.cols()) {
        THROW_INVALID_PARAM(src, "Matrix must be square and non-empty.");
    }
    if (!matrix.allFinite()) {
        throw DegenerateSpectrumException(src, "Matrix has non-finite entries.",
                                          std::numeric_limits<double>::quiet_NaN(), 0.0);
    }

    Eigen::EigenSolver<Eigen::MatrixXd> es(matrix, false);
    if (es.info() != Eigen::Success) {
        throw DegenerateSpectrumException(src, "Eigen-decomposition did not converge.",
                                          std::numeric_limits<double>::quiet_NaN(), 0.0);
    }

    const auto& eigenvalues = es.eigenvalues();
    std::complex<double> dominant = eigenvalues[0];
    for (Eigen::Index k = 1; k < eigenvalues.size(); ++k) {
        const std::complex<double> candidate = eigenvalues[k];
        const double mag_c = std::abs(candidate);
        const double mag_d = std::abs(dominant);
        const double tie = constants::EIGENVALUE_TIE_TOLERANCE * std::max(1.0, std::max(mag_c, mag_d));
        if (mag_c > mag_d + tie || (std::abs(mag_c - mag_d) <= tie && candidate.real() > dominant.real())) {
            dominant = candidate;
        }
    }

    const double scale = std::max(1.0, std::abs(dominant));
    if (std::abs(dominant.imag()) > constants::EIGENVALUE_IMAG_TOLERANCE * scale) {
        throw DegenerateSpectrumException(src,
            "Dominant eigenvalue is complex (" + std::to_string(dominant.real()) + " + " +
            std::to_string(dominant.imag()) + "i).", dominant.real(), dominant.imag());
    }
    const double lambda = dominant.real();
    if (require_positive ? !(lambda > 0.0) : (lambda < -constants::EIGENVALUE_IMAG_TOLERANCE * scale)) {
        throw DegenerateSpectrumException(src,
            "Dominant eigenvalue " + std::to_string(lambda) + " is not physical.", lambda, dominant.imag());
    }
    return std::max(lambda, 0.0);
}

double calibrateR0(const Eigen::MatrixXd& beta,
                   double gamma,
                   const Eigen::VectorXd& population_fraction,
                   double total_population,
                   double r0_target) {
    const std::string src = "calibrateR0";
    if (!(total_population > 0.0)) THROW_INVALID_PARAM(src, "Total population must be positive.");
    if (!(r0_target > 0.0) || !std::isfinite(r0_target)) THROW_INVALID_PARAM(src, "Target R0 must be positive.");
    if (population_fraction.size() != beta.rows()) {
        THROW_INVALID_PARAM(src, "population_fraction size does not match the transmission matrix.");
    }
    if ((population_fraction.array() <= 0.0).any()) {
        THROW_INVALID_PARAM(src, "Population fractions must be positive.");
    }

    ReproductionNumberCalculator calculator(beta, gamma, 1.0);
    const double lambda_1 = calculator.calculateR0(total_population * population_fraction);
    return lambda_1 / r0_target;
}

} // namespace seroherd
