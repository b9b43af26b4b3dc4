#include "stratified/EpidemicModel.hpp"
#include "exceptions/Exceptions.hpp"

namespace seroherd {

void EpidemicModel::computeJacobian(const state_type& /*state*/, Eigen::MatrixXd& /*jacobian*/, double /*time*/) {
    throw ModelException("EpidemicModel::computeJacobian", "This model does not provide an analytic Jacobian.");
}

OdeSystem EpidemicModel::asOdeSystem() {
    OdeSystem system;
    system.derivatives = [this](const state_type& x, state_type& dxdt, double t) {
        computeDerivatives(x, dxdt, t);
    };
    if (hasJacobian()) {
        system.jacobian = [this](const state_type& x, Eigen::MatrixXd& J, double t) {
            computeJacobian(x, J, t);
        };
    }
    return system;
}

} // namespace seroherd
