#ifndef SEROHERD_EPIDEMIC_MODEL_HPP
#define SEROHERD_EPIDEMIC_MODEL_HPP

#include "stratified/interfaces/IOdeSolverStrategy.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace seroherd {

    /**
     * @brief Base class for group-stratified compartmental models integrated by an
     * IOdeSolverStrategy.
     */
    class EpidemicModel {
    public:
        virtual ~EpidemicModel() = default;

        /**
         * @brief Right-hand side of the ODE system.
         * @param state Current state variables
         * @param derivatives Computed derivatives of the state variables
         * @param time Current time
         */
        virtual void computeDerivatives(const state_type& state, state_type& derivatives, double time) = 0;

        /**
         * @brief Jacobian d(derivatives)/d(state). Models without one return false from
         * hasJacobian() and throw here.
         */
        virtual void computeJacobian(const state_type& state, Eigen::MatrixXd& jacobian, double time);

        virtual bool hasJacobian() const { return false; }

        virtual int getStateSize() const = 0;

        virtual std::vector<std::string> getStateNames() const = 0;

        virtual int getNumGroups() const = 0;

        /** @brief Functor form expected by Boost.Odeint. */
        void operator()(const state_type& state, state_type& derivatives, double time) {
            computeDerivatives(state, derivatives, time);
        }

        /**
         * @brief Binds this model into the solver-facing system description.
         * The model must outlive the returned object.
         */
        OdeSystem asOdeSystem();
    };

} // namespace seroherd

#endif // SEROHERD_EPIDEMIC_MODEL_HPP
