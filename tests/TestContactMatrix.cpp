#include <cmath>
#include <iostream>

#include "TestSupport.hpp"
#include "model/ContactMatrixBuilder.hpp"
#include "exceptions/Exceptions.hpp"

using namespace seroherd;

namespace {

void testProportionateMixingIsSymmetric() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::MatrixXd beta = buildContactMatrix(ctx.activities(), ctx.fractions(), ctx.total_population, 0.0);

    REQUIRE(beta.rows() == 5 && beta.cols() == 5, "matrix must be G x G");
    REQUIRE((beta.array() >= 0.0).all(), "entries must be nonnegative");
    REQUIRE((beta - beta.transpose()).cwiseAbs().maxCoeff() <= 1e-15 * beta.cwiseAbs().maxCoeff(),
            "epsilon=0 matrix must be symmetric");

    // beta(i,j) = a_i a_j / sum_k N f_k a_k
    const Eigen::VectorXd a = ctx.activities();
    const double denom = (ctx.total_population * ctx.fractions().cwiseProduct(a)).sum();
    REQUIRE_CLOSE(beta(1, 4), a(1) * a(4) / denom, 1e-12, "proportionate entry");
    std::cout << "[PASS] proportionate mixing\n";
}

void testFullAssortativityIsDiagonal() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::MatrixXd beta = buildContactMatrix(ctx.activities(), ctx.fractions(), ctx.total_population, 1.0);
    const Eigen::VectorXd sizes = ctx.groupSizes();

    for (int i = 0; i < 5; ++i) {
        for (int j = 0; j < 5; ++j) {
            if (i == j) {
                REQUIRE_CLOSE(beta(i, i), ctx.groups[i].activity / sizes(i), 1e-12, "diagonal entry");
            } else {
                REQUIRE(beta(i, j) == 0.0, "off-diagonal entry must vanish at epsilon=1");
            }
        }
    }
    std::cout << "[PASS] within-group mixing\n";
}

void testPartialAssortativityBlends() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::VectorXd a = ctx.activities();
    const Eigen::VectorXd f = ctx.fractions();
    const double N = ctx.total_population;

    const Eigen::MatrixXd b0 = buildContactMatrix(a, f, N, 0.0);
    const Eigen::MatrixXd b1 = buildContactMatrix(a, f, N, 1.0);
    const Eigen::MatrixXd bh = buildContactMatrix(a, f, N, 0.3);
    REQUIRE((bh - (0.7 * b0 + 0.3 * b1)).cwiseAbs().maxCoeff() <= 1e-12 * b1.cwiseAbs().maxCoeff(),
            "epsilon blends the two mixing extremes linearly");
    std::cout << "[PASS] partial assortativity\n";
}

void testInvalidInputs() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::VectorXd a = ctx.activities();
    const Eigen::VectorXd f = ctx.fractions();
    const double N = ctx.total_population;

    REQUIRE_THROWS(buildContactMatrix(a, f, N, -0.1), InvalidParameterException, "epsilon < 0");
    REQUIRE_THROWS(buildContactMatrix(a, f, N, 1.5), InvalidParameterException, "epsilon > 1");
    REQUIRE_THROWS(buildContactMatrix(a, f, 0.0, 0.0), InvalidParameterException, "N = 0");
    REQUIRE_THROWS(buildContactMatrix(a, f.head(4), N, 0.0), InvalidParameterException, "size mismatch");

    Eigen::VectorXd bad_f = f;
    bad_f(2) = 0.0;
    REQUIRE_THROWS(buildContactMatrix(a, bad_f, N, 0.0), InvalidParameterException, "zero fraction");

    Eigen::VectorXd bad_a = a;
    bad_a(0) = -1.0;
    REQUIRE_THROWS(buildContactMatrix(bad_a, f, N, 0.0), InvalidParameterException, "negative activity");
    std::cout << "[PASS] invalid contact matrix inputs\n";
}

void testContextValidation() {
    PopulationContext ctx = testing::longIslandContext();
    ctx.validate();

    PopulationContext bad_sum = ctx;
    bad_sum.groups[0].population_fraction = 0.5;
    REQUIRE_THROWS(bad_sum.validate(), InvalidParameterException, "fractions not summing to 1");

    PopulationContext bad_n = ctx;
    bad_n.total_population = -5.0;
    REQUIRE_THROWS(bad_n.validate(), InvalidParameterException, "non-positive population");

    PopulationContext bad_i0 = ctx;
    bad_i0.groups[4].initial_infected = 1e9;
    REQUIRE_THROWS(bad_i0.validate(), InvalidParameterException, "initial infections above group size");

    const CompartmentState s0 = ctx.initialState();
    REQUIRE_CLOSE(s0.groupTotals().sum(), ctx.total_population * 1.001, 1e-12, "initial state carries every group");
    REQUIRE(s0.E.isZero() && s0.R.isZero(), "initial E and R are empty");
    std::cout << "[PASS] population context validation\n";
}

} // namespace

int main() {
    testing::quietLogs();
    testProportionateMixingIsSymmetric();
    testFullAssortativityIsDiagonal();
    testPartialAssortativityBlends();
    testInvalidInputs();
    testContextValidation();
    std::cout << "[PASS] TestContactMatrix\n";
    return 0;
}
