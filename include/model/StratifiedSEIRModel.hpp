#ifndef SEROHERD_STRATIFIED_SEIR_MODEL_HPP
#define SEROHERD_STRATIFIED_SEIR_MODEL_HPP

#include "stratified/EpidemicModel.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace seroherd {

    /**
     * @brief Group-stratified SEIR model with a full transmission matrix.
     *
     * For each group i, with force of infection lambda_i = sum_j beta(i,j) * I_j:
     *   dS_i/dt = -lambda_i * S_i
     *   dE_i/dt =  lambda_i * S_i - r * E_i
     *   dI_i/dt =  r * E_i - gamma * I_i
     *   dR_i/dt =  gamma * I_i
     *
     * beta is the R0-scaled matrix, in per-capita-of-infectious units (no division by N_j).
     * State layout: [S_0..S_{G-1}, E_0.., I_0.., R_0..].
     */
    class StratifiedSEIRModel final : public EpidemicModel {
    public:
        /**
         * @param beta_scaled G x G nonnegative transmission matrix.
         * @param r Latent progression rate (1 / mean latent period).
         * @param gamma Recovery rate (1 / mean infectious period).
         * @throws InvalidParameterException if beta is not square, has negative or non-finite
         *         entries, or r / gamma are not positive.
         */
        StratifiedSEIRModel(const Eigen::MatrixXd& beta_scaled, double r, double gamma);

        /**
         * @brief Hot path derivative computation.
         * @param state Current state variables
         * @param derivatives Computed derivatives of the state variables
         * @param time Current time (unused, autonomous system)
         */
        void computeDerivatives(const state_type& state, state_type& derivatives, double time) override;

        /**
         * @brief Analytic Jacobian; the only state-dependent blocks are dS/dS, dS/dI,
         * dE/dS and dE/dI.
         */
        void computeJacobian(const state_type& state, Eigen::MatrixXd& jacobian, double time) override;

        bool hasJacobian() const override { return true; }

        int getStateSize() const override;

        std::vector<std::string> getStateNames() const override;

        int getNumGroups() const override { return num_groups_; }

        const Eigen::MatrixXd& getTransmissionMatrix() const { return beta_; }
        double getLatentRate() const { return r_; }
        double getRecoveryRate() const { return gamma_; }

    private:
        int num_groups_;
        Eigen::MatrixXd beta_;
        double r_;
        double gamma_;

        /** @brief Force of infection per group, reused across calls. */
        std::vector<double> lambda_;

        void computeForceOfInfection(const double* I_ptr);
    };

} // namespace seroherd

#endif // SEROHERD_STRATIFIED_SEIR_MODEL_HPP
