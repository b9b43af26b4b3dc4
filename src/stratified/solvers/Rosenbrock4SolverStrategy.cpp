#include "stratified/solvers/Rosenbrock4SolverStrategy.hpp"
#include "stratified/solvers/ControlledStepLoop.hpp"
#include "exceptions/Exceptions.hpp"
#include <boost/numeric/odeint/stepper/rosenbrock4.hpp>
#include <boost/numeric/odeint/stepper/rosenbrock4_controller.hpp>
#include <boost/numeric/ublas/matrix.hpp>
#include <boost/numeric/ublas/vector.hpp>
#include <algorithm>
#include <utility>

namespace seroherd {

void Rosenbrock4SolverStrategy::integrate(
    const OdeSystem& system,
    state_type& initial_state,
    const std::vector<double>& times,
    const std::function<void(const state_type&, double)>& observer,
    const SolverSettings& settings) const
{
    using namespace boost::numeric::odeint;
    using vector_type = boost::numeric::ublas::vector<double>;
    using matrix_type = boost::numeric::ublas::matrix<double>;
    const std::string src = "Rosenbrock4SolverStrategy::integrate";

    if (!system.derivatives) THROW_INVALID_PARAM(src, "ODE system has no right-hand side.");
    if (!system.jacobian) THROW_INVALID_PARAM(src, "Rosenbrock4 requires an analytic Jacobian.");
    validateTimeGrid(times, src);
    settings.validate();

    const size_t n = initial_state.size();

    // Scratch buffers shared by the wrappers below; the stepper calls them sequentially.
    state_type x_buf(n), dxdt_buf(n);
    Eigen::MatrixXd jac_buf(n, n);

    auto deriv = [&](const vector_type& x, vector_type& dxdt, double t) {
        std::copy(x.begin(), x.end(), x_buf.begin());
        system.derivatives(x_buf, dxdt_buf, t);
        std::copy(dxdt_buf.begin(), dxdt_buf.end(), dxdt.begin());
    };

    // Autonomous system: df/dt = 0.
    auto jacobi = [&](const vector_type& x, matrix_type& J, const double& t, vector_type& dfdt) {
        std::copy(x.begin(), x.end(), x_buf.begin());
        system.jacobian(x_buf, jac_buf, t);
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = 0; j < n; ++j) {
                J(i, j) = jac_buf(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
            }
            dfdt[i] = 0.0;
        }
    };

    vector_type x(n);
    std::copy(initial_state.begin(), initial_state.end(), x.begin());
    state_type out(n);
    auto forward = [&](const vector_type& s, double t) {
        std::copy(s.begin(), s.end(), out.begin());
        observer(out, t);
    };

    try {
        rosenbrock4_controller<rosenbrock4<double>> stepper(settings.abs_error, settings.rel_error);
        driveControlledStepper(stepper, std::make_pair(deriv, jacobi), x, times, forward, settings, src);
    } catch (const ModelException&) {
        throw;
    } catch (const std::exception& e) {
        throw SimulationException(src, "Boost.Odeint integration failed: " + std::string(e.what()));
    }

    std::copy(x.begin(), x.end(), initial_state.begin());
}

} // namespace seroherd
