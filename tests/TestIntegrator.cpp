#include <cmath>
#include <iostream>
#include <memory>

#include "TestSupport.hpp"
#include "model/CompartmentalIntegrator.hpp"
#include "model/ContactMatrixBuilder.hpp"
#include "model/ReproductionNumberCalculator.hpp"
#include "model/StratifiedSEIRModel.hpp"
#include "stratified/solvers/Dopri5SolverStrategy.hpp"
#include "stratified/solvers/Rosenbrock4SolverStrategy.hpp"
#include "stratified/solvers/StiffnessSwitchingSolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"

using namespace seroherd;

namespace {

Eigen::MatrixXd longIslandScaledBeta() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::MatrixXd beta = buildContactMatrix(ctx.activities(), ctx.fractions(), ctx.total_population, 0.0);
    return beta / calibrateR0(beta, 0.25, ctx.fractions(), ctx.total_population, 3.0);
}

// Emits scripted states instead of integrating; exercises the integrator's invariant checks.
class ScriptedSolver : public IOdeSolverStrategy {
public:
    explicit ScriptedSolver(std::function<void(state_type&, double)> perturb) : perturb_(std::move(perturb)) {}

    void integrate(const OdeSystem&, state_type& initial_state, const std::vector<double>& times,
                   const std::function<void(const state_type&, double)>& observer,
                   const SolverSettings&) const override {
        for (double t : times) {
            state_type x = initial_state;
            perturb_(x, t);
            observer(x, t);
        }
    }

    std::string getName() const override { return "scripted"; }

private:
    std::function<void(state_type&, double)> perturb_;
};

std::vector<double> uniformGrid(double end, double step) {
    return buildTimeGrid(end, step);
}

void testMassConservationAndMonotonicity() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::VectorXd sizes = ctx.groupSizes();
    const Trajectory traj = integrate(ctx.initialState(), 1.0 / 3.0, 0.25, longIslandScaledBeta(), uniformGrid(250.0, 1.0));

    REQUIRE(traj.isValid() && traj.size() == 251, "one state per grid point");
    for (size_t k = 0; k < traj.size(); ++k) {
        const CompartmentState& s = traj.states[k];
        REQUIRE(std::abs(s.groupTotals().sum() - sizes.sum()) <= 1e-3 * sizes.sum(), "mass conserved at k=" << k);
        REQUIRE((s.S.array() >= 0.0).all() && (s.E.array() >= 0.0).all() &&
                (s.I.array() >= 0.0).all() && (s.R.array() >= 0.0).all(), "nonnegative at k=" << k);
        if (k > 0) {
            const CompartmentState& p = traj.states[k - 1];
            for (int i = 0; i < 5; ++i) {
                REQUIRE(s.R(i) >= p.R(i) - 1e-9 * sizes(i), "R non-decreasing, group " << i << " k=" << k);
                REQUIRE(s.S(i) <= p.S(i) + 1e-9 * sizes(i), "S non-increasing, group " << i << " k=" << k);
            }
        }
    }
    const double final_size = traj.back().R.sum() / ctx.total_population;
    REQUIRE(final_size > 0.6 && final_size < 0.75, "epidemic runs to completion (final size " << final_size << ")");
    std::cout << "[PASS] mass conservation and monotonicity\n";
}

void testSolversAgree() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::MatrixXd beta = longIslandScaledBeta();
    const std::vector<double> grid = uniformGrid(150.0, 5.0);
    SolverSettings settings;

    CompartmentalIntegrator explicit_run(std::make_shared<Dopri5SolverStrategy>(), settings);
    CompartmentalIntegrator implicit_run(std::make_shared<Rosenbrock4SolverStrategy>(), settings);
    const Trajectory a = explicit_run.integrate(ctx.initialState(), 1.0 / 3.0, 0.25, beta, grid);
    const Trajectory b = implicit_run.integrate(ctx.initialState(), 1.0 / 3.0, 0.25, beta, grid);

    REQUIRE(a.size() == b.size(), "same grid");
    for (size_t k = 0; k < a.size(); ++k) {
        REQUIRE(a.time_points[k] == grid[k] && b.time_points[k] == grid[k], "observer times follow the grid");
        const double diff = (a.states[k].R - b.states[k].R).cwiseAbs().maxCoeff();
        REQUIRE(diff <= 1e-4 * ctx.total_population, "Dopri5 and Rosenbrock4 agree at t=" << grid[k]);
    }
    std::cout << "[PASS] explicit and implicit solvers agree\n";
}

void testStiffSystemSwitchesSolver() {
    // x' = -1e6 x is far beyond the explicit stability limit; y' = -y is a slow reference.
    OdeSystem stiff;
    stiff.derivatives = [](const state_type& x, state_type& dxdt, double) {
        dxdt[0] = -1e6 * x[0];
        dxdt[1] = -x[1];
    };
    stiff.jacobian = [](const state_type&, Eigen::MatrixXd& J, double) {
        J.setZero(2, 2);
        J(0, 0) = -1e6;
        J(1, 1) = -1.0;
    };

    SolverSettings settings;
    settings.abs_error = 1e-10;
    settings.rel_error = 1e-10;
    settings.max_steps_per_interval = 1000;
    const std::vector<double> grid = {0.0, 0.5, 1.0};

    state_type x = {1.0, 1.0};
    bool diverged = false;
    try {
        Dopri5SolverStrategy().integrate(stiff, x, grid, [](const state_type&, double) {}, settings);
    } catch (const IntegrationDivergenceException& e) {
        diverged = true;
        REQUIRE(e.getLastStableTime() >= 0.0 && e.getLastStableTime() < 1.0, "divergence carries last stable time");
    }
    REQUIRE(diverged, "explicit solver must give up on the stiff system");

    x = {1.0, 1.0};
    std::vector<double> seen;
    StiffnessSwitchingSolverStrategy().integrate(stiff, x, grid,
        [&seen](const state_type&, double t) { seen.push_back(t); }, settings);
    REQUIRE(seen.size() == grid.size(), "observer replays exactly one state per grid point");
    REQUIRE(std::abs(x[0]) < 1e-6, "stiff component decayed");
    REQUIRE_CLOSE(x[1], std::exp(-1.0), 1e-6, "slow component accurate");

    OdeSystem no_jacobian;
    no_jacobian.derivatives = stiff.derivatives;
    x = {1.0, 1.0};
    REQUIRE_THROWS(StiffnessSwitchingSolverStrategy().integrate(no_jacobian, x, grid,
                       [](const state_type&, double) {}, settings),
                   IntegrationDivergenceException, "no implicit fallback without a Jacobian");
    x = {1.0, 1.0};
    REQUIRE_THROWS(Rosenbrock4SolverStrategy().integrate(no_jacobian, x, grid,
                       [](const state_type&, double) {}, settings),
                   InvalidParameterException, "Rosenbrock4 needs a Jacobian");
    std::cout << "[PASS] stiffness switching\n";
}

void testStepReductionCap() {
    const PopulationContext ctx = testing::longIslandContext();
    SolverSettings settings;
    settings.abs_error = 1e-14;
    settings.rel_error = 1e-14;
    settings.dt_hint = 50.0;
    settings.max_step_reductions = 1;

    CompartmentalIntegrator integrator(std::make_shared<Dopri5SolverStrategy>(), settings);
    REQUIRE_THROWS(integrator.integrate(ctx.initialState(), 1.0 / 3.0, 0.25, longIslandScaledBeta(), {0.0, 100.0}),
                   IntegrationDivergenceException, "step-size reduction cap");
    std::cout << "[PASS] step reduction cap\n";
}

void testAnalyticJacobian() {
    const Eigen::MatrixXd beta = longIslandScaledBeta();
    StratifiedSEIRModel model(beta, 1.0 / 3.0, 0.25);
    const PopulationContext ctx = testing::longIslandContext();
    CompartmentState s = ctx.initialState();
    s.E = 0.01 * s.S;
    s.I = 0.02 * s.S;
    s.S *= 0.9;
    const state_type x = s.toStateVector();
    const int size = model.getStateSize();

    Eigen::MatrixXd J;
    model.computeJacobian(x, J, 0.0);

    state_type f0(size), f1(size);
    model.computeDerivatives(x, f0, 0.0);
    for (int j = 0; j < size; ++j) {
        state_type xp = x;
        const double h = 1e-6 * std::max(1.0, std::abs(x[j]));
        xp[j] += h;
        model.computeDerivatives(xp, f1, 0.0);
        for (int i = 0; i < size; ++i) {
            const double fd = (f1[i] - f0[i]) / h;
            REQUIRE(std::abs(fd - J(i, j)) <= 1e-4 * std::max(1.0, std::abs(J(i, j))),
                    "Jacobian entry (" << i << "," << j << ")");
        }
    }
    REQUIRE(model.getStateNames()[2 * 5 + 3] == "I_3", "state names follow the flattened layout");
    std::cout << "[PASS] analytic Jacobian\n";
}

void testInvariantChecks() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::MatrixXd beta = longIslandScaledBeta();
    const std::vector<double> grid = {0.0, 1.0, 2.0};

    // Roundoff-level negativity is clamped
    CompartmentalIntegrator roundoff(std::make_shared<ScriptedSolver>([](state_type& x, double t) {
        if (t > 0.0) x[5 + 5 + 5 + 2] = -1e-7;
    }));
    const Trajectory traj = roundoff.integrate(ctx.initialState(), 1.0 / 3.0, 0.25, beta, grid);
    REQUIRE(traj.states[1].R(2) == 0.0, "tiny negative value clamped to zero");

    CompartmentalIntegrator negative(std::make_shared<ScriptedSolver>([](state_type& x, double t) {
        if (t > 0.5) x[0] = -1000.0;
    }));
    try {
        negative.integrate(ctx.initialState(), 1.0 / 3.0, 0.25, beta, grid);
        REQUIRE(false, "persistent negativity must throw");
    } catch (const PhysicalInvariantViolationException& e) {
        REQUIRE(e.getGroup() == 0, "violation names the group");
        REQUIRE(e.getTime() == 1.0, "violation names the time");
        REQUIRE(e.getLastStableTime() == 0.0, "violation carries the last stable time");
    }

    CompartmentalIntegrator drift(std::make_shared<ScriptedSolver>([](state_type& x, double t) {
        if (t > 1.5) x[15 + 1] += 0.1 * x[1];
    }));
    REQUIRE_THROWS(drift.integrate(ctx.initialState(), 1.0 / 3.0, 0.25, beta, grid),
                   PhysicalInvariantViolationException, "mass drift");
    std::cout << "[PASS] physical invariant checks\n";
}

void testInvalidInputs() {
    const PopulationContext ctx = testing::longIslandContext();
    const Eigen::MatrixXd beta = longIslandScaledBeta();
    const CompartmentState s0 = ctx.initialState();

    REQUIRE_THROWS(integrate(s0, 1.0 / 3.0, 0.25, beta, {0.0, 2.0, 1.0}), InvalidParameterException, "decreasing grid");
    REQUIRE_THROWS(integrate(s0, 1.0 / 3.0, 0.25, beta, {}), InvalidParameterException, "empty grid");
    REQUIRE_THROWS(integrate(s0, 0.0, 0.25, beta, {0.0, 1.0}), InvalidParameterException, "r = 0");
    REQUIRE_THROWS(integrate(s0, 1.0 / 3.0, 0.25, beta.topLeftCorner(4, 4), {0.0, 1.0}), InvalidParameterException,
                   "matrix/state size mismatch");

    CompartmentState bad = s0;
    bad.E(1) = -5.0;
    REQUIRE_THROWS(integrate(bad, 1.0 / 3.0, 0.25, beta, {0.0, 1.0}), InvalidParameterException, "negative initial state");

    SolverSettings settings;
    settings.rel_error = 0.0;
    REQUIRE_THROWS(integrate(s0, 1.0 / 3.0, 0.25, beta, {0.0, 1.0}, settings), InvalidParameterException,
                   "non-positive tolerance");

    const std::vector<double> grid = buildTimeGrid(10.0, 3.0);
    REQUIRE(grid.size() == 5 && grid.front() == 0.0 && grid.back() == 10.0, "grid ends exactly at the end time");
    REQUIRE_THROWS(buildTimeGrid(-1.0, 1.0), InvalidParameterException, "negative end time");
    std::cout << "[PASS] invalid integrator inputs\n";
}

} // namespace

int main() {
    testing::quietLogs();
    testMassConservationAndMonotonicity();
    testSolversAgree();
    testStiffSystemSwitchesSolver();
    testStepReductionCap();
    testAnalyticJacobian();
    testInvariantChecks();
    testInvalidInputs();
    std::cout << "[PASS] TestIntegrator\n";
    return 0;
}
