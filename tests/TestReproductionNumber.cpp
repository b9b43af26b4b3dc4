#include <cmath>
#include <iostream>

#include "TestSupport.hpp"
#include "model/ContactMatrixBuilder.hpp"
#include "model/ReproductionNumberCalculator.hpp"
#include "exceptions/Exceptions.hpp"

using namespace seroherd;

namespace {

void testCalibrationHitsTarget() {
    const PopulationContext ctx = testing::longIslandContext();
    const TransitionRates rates = testing::longIslandRates();
    const double targets[] = {0.8, 1.5, 3.0, 12.0};
    const double epsilons[] = {0.0, 0.35, 1.0};

    for (double eps : epsilons) {
        const Eigen::MatrixXd beta = buildContactMatrix(ctx.activities(), ctx.fractions(), ctx.total_population, eps);
        for (double r0 : targets) {
            const double s = calibrateR0(beta, rates.gamma, ctx.fractions(), ctx.total_population, r0);
            REQUIRE(s > 0.0, "scaling factor must be positive");

            ReproductionNumberCalculator calc(beta, rates.gamma, s);
            REQUIRE_CLOSE(calc.calculateR0(ctx.groupSizes()), r0, 1e-6, "recomputed R0 (eps=" << eps << ")");

            // Same check on the explicitly scaled matrix
            const Eigen::MatrixXd K = ReproductionNumberCalculator(beta / s, rates.gamma).buildNextGenerationMatrix(ctx.groupSizes());
            REQUIRE_CLOSE(ReproductionNumberCalculator::dominantEigenvalue(K), r0, 1e-6, "scaled NGM eigenvalue");
        }
    }
    std::cout << "[PASS] R0 calibration\n";
}

void testProportionateMixingClosedForm() {
    // With epsilon = 0 the next generation matrix has rank one:
    // R0 = sum_i f_i a_i^2 / (sum_i f_i a_i * gamma)
    const PopulationContext ctx = testing::longIslandContext();
    const double gamma = 0.25;
    const Eigen::VectorXd a = ctx.activities();
    const Eigen::VectorXd f = ctx.fractions();
    const Eigen::MatrixXd beta = buildContactMatrix(a, f, ctx.total_population, 0.0);

    const double expected = f.dot(a.cwiseProduct(a)) / (f.dot(a) * gamma);
    ReproductionNumberCalculator calc(beta, gamma);
    REQUIRE_CLOSE(calc.calculateR0(ctx.groupSizes()), expected, 1e-10, "rank-one R0");
    REQUIRE_CLOSE(calibrateR0(beta, gamma, f, ctx.total_population, 3.0), expected / 3.0, 1e-10, "scaling factor");
    std::cout << "[PASS] proportionate mixing closed form\n";
}

void testRtFollowsSusceptiblePool() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::MatrixXd beta = buildContactMatrix(ctx.activities(), ctx.fractions(), ctx.total_population, 0.2);
    const double s = calibrateR0(beta, 0.25, ctx.fractions(), ctx.total_population, 3.0);
    ReproductionNumberCalculator calc(beta, 0.25, s);

    const Eigen::VectorXd sizes = ctx.groupSizes();
    REQUIRE_CLOSE(calc.calculateRt(sizes), 3.0, 1e-6, "Rt at full susceptibility equals R0");
    REQUIRE_CLOSE(calc.calculateRt(0.5 * sizes), 1.5, 1e-6, "Rt is linear in a uniformly scaled pool");
    REQUIRE(calc.calculateRt(Eigen::VectorXd::Zero(5)) == 0.0, "exhausted pool gives Rt = 0");
    std::cout << "[PASS] Rt evaluation\n";
}

void testDominantEigenvalueSelection() {
    Eigen::MatrixXd m(2, 2);
    m << 1.0, 2.0,
         3.0, 4.0;
    REQUIRE_CLOSE(ReproductionNumberCalculator::dominantEigenvalue(m), (5.0 + std::sqrt(33.0)) / 2.0, 1e-12,
                  "largest magnitude eigenvalue of a non-symmetric matrix");

    Eigen::MatrixXd d = Eigen::MatrixXd::Zero(3, 3);
    d.diagonal() << 1.0, 5.0, 2.0;
    REQUIRE_CLOSE(ReproductionNumberCalculator::dominantEigenvalue(d), 5.0, 1e-14, "selection ignores solver order");

    Eigen::MatrixXd swap(2, 2);
    swap << 0.0, 1.0,
            1.0, 0.0;
    REQUIRE_CLOSE(ReproductionNumberCalculator::dominantEigenvalue(swap), 1.0, 1e-12, "tie resolved to the positive root");

    Eigen::MatrixXd rotation(2, 2);
    rotation << 0.0, -1.0,
                1.0, 0.0;
    REQUIRE_THROWS(ReproductionNumberCalculator::dominantEigenvalue(rotation), DegenerateSpectrumException,
                   "complex dominant eigenvalue");

    Eigen::MatrixXd negative = Eigen::MatrixXd::Zero(2, 2);
    negative.diagonal() << -3.0, 2.0;
    REQUIRE_THROWS(ReproductionNumberCalculator::dominantEigenvalue(negative, false), DegenerateSpectrumException,
                   "negative dominant eigenvalue");

    try {
        ReproductionNumberCalculator::dominantEigenvalue(rotation);
    } catch (const DegenerateSpectrumException& e) {
        REQUIRE(std::abs(e.getImagPart()) > 0.5, "diagnostic carries the imaginary part");
    }
    std::cout << "[PASS] dominant eigenvalue selection\n";
}

void testDegenerateInputs() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::MatrixXd zero = Eigen::MatrixXd::Zero(5, 5);
    REQUIRE_THROWS(calibrateR0(zero, 0.25, ctx.fractions(), ctx.total_population, 3.0), DegenerateSpectrumException,
                   "zero transmission matrix");

    const Eigen::MatrixXd beta = buildContactMatrix(ctx.activities(), ctx.fractions(), ctx.total_population, 0.0);
    REQUIRE_THROWS(calibrateR0(beta, 0.0, ctx.fractions(), ctx.total_population, 3.0), InvalidParameterException,
                   "gamma = 0");
    REQUIRE_THROWS(calibrateR0(beta, 0.25, ctx.fractions(), ctx.total_population, -1.0), InvalidParameterException,
                   "negative target");
    REQUIRE_THROWS(calibrateR0(beta, 0.25, ctx.fractions().head(3), ctx.total_population, 3.0),
                   InvalidParameterException, "fraction size mismatch");
    REQUIRE_THROWS(ReproductionNumberCalculator(-beta, 0.25), InvalidParameterException, "negative matrix entries");
    std::cout << "[PASS] degenerate R0 inputs\n";
}

} // namespace

int main() {
    testing::quietLogs();
    testCalibrationHitsTarget();
    testProportionateMixingClosedForm();
    testRtFollowsSusceptiblePool();
    testDominantEigenvalueSelection();
    testDegenerateInputs();
    std::cout << "[PASS] TestReproductionNumber\n";
    return 0;
}
