#include "model/StratifiedSEIRModel.hpp"
#include "model/ModelConstants.hpp"
#include "exceptions/Exceptions.hpp"

#include <cmath>

#if defined(_MSC_VER)
    #define RESTRICT __restrict
#elif defined(__GNUC__) || defined(__clang__)
    #define RESTRICT __restrict__
#else
    #define RESTRICT
#endif

namespace seroherd {

    StratifiedSEIRModel::StratifiedSEIRModel(const Eigen::MatrixXd& beta_scaled, double r, double gamma)
        : num_groups_(static_cast<int>(beta_scaled.rows())), beta_(beta_scaled), r_(r), gamma_(gamma),
          lambda_(static_cast<size_t>(beta_scaled.rows()), 0.0)
    {
        const std::string src = "StratifiedSEIRModel::constructor";
        if (num_groups_ == 0 || beta_.rows() != beta_.cols()) {
            THROW_INVALID_PARAM(src, "Transmission matrix must be square and non-empty.");
        }
        if (!beta_.allFinite() || (beta_.array() < 0.0).any()) {
            THROW_INVALID_PARAM(src, "Transmission matrix entries must be finite and non-negative.");
        }
        if (!(r_ > 0.0) || !std::isfinite(r_)) THROW_INVALID_PARAM(src, "Latent rate r must be positive.");
        if (!(gamma_ > 0.0) || !std::isfinite(gamma_)) THROW_INVALID_PARAM(src, "Recovery rate gamma must be positive.");
    }

    void StratifiedSEIRModel::computeForceOfInfection(const double* I_ptr) {
        const int n = num_groups_;
        const double* RESTRICT M_ptr = beta_.data();
        double* RESTRICT lambda_ptr = lambda_.data();

        #pragma omp simd
        for (int i = 0; i < n; ++i) {
            lambda_ptr[i] = 0.0;
        }

        // Column-major accumulation: lambda_i += beta(i,j) * I_j.
        for (int j = 0; j < n; ++j) {
            const double inf = (I_ptr[j] > 0.0) ? I_ptr[j] : 0.0;
            const double* RESTRICT col_ptr = &M_ptr[j * n];
            #pragma omp simd
            for (int i = 0; i < n; ++i) {
                lambda_ptr[i] += col_ptr[i] * inf;
            }
        }
    }

    void StratifiedSEIRModel::computeDerivatives(const state_type& state,
                                                 state_type& derivatives,
                                                 double /*time*/) {
        const int n = num_groups_;
        const int expected_size = constants::NUM_COMPARTMENTS_SEIR * n;

        if (static_cast<int>(state.size()) < expected_size) {
            THROW_INVALID_PARAM("StratifiedSEIRModel::computeDerivatives",
                "State vector too small: got " + std::to_string(state.size()) +
                ", expected " + std::to_string(expected_size));
        }
        if (static_cast<int>(derivatives.size()) != expected_size) {
            derivatives.resize(expected_size);
        }

        const double* RESTRICT S_ptr = &state[0 * n];
        const double* RESTRICT E_ptr = &state[1 * n];
        const double* RESTRICT I_ptr = &state[2 * n];

        double* RESTRICT dS_ptr = &derivatives[0 * n];
        double* RESTRICT dE_ptr = &derivatives[1 * n];
        double* RESTRICT dI_ptr = &derivatives[2 * n];
        double* RESTRICT dR_ptr = &derivatives[3 * n];

        computeForceOfInfection(I_ptr);
        const double* RESTRICT lambda_ptr = lambda_.data();
        const double local_r = r_;
        const double local_gamma = gamma_;

        #pragma omp simd
        for (int i = 0; i < n; ++i) {
            const double S_i = (S_ptr[i] > 0.0) ? S_ptr[i] : 0.0;
            const double new_infections = lambda_ptr[i] * S_i;
            const double progression = local_r * E_ptr[i];
            const double recovery = local_gamma * I_ptr[i];

            dS_ptr[i] = -new_infections;
            dE_ptr[i] = new_infections - progression;
            dI_ptr[i] = progression - recovery;
            dR_ptr[i] = recovery;
        }
    }

    void StratifiedSEIRModel::computeJacobian(const state_type& state,
                                              Eigen::MatrixXd& jacobian,
                                              double /*time*/) {
        const int n = num_groups_;
        const int size = constants::NUM_COMPARTMENTS_SEIR * n;
        if (static_cast<int>(state.size()) < size) {
            THROW_INVALID_PARAM("StratifiedSEIRModel::computeJacobian", "State vector too small.");
        }
        jacobian.setZero(size, size);

        const double* I_ptr = &state[2 * n];
        computeForceOfInfection(I_ptr);

        const int S0 = 0, E0 = n, I0 = 2 * n, R0 = 3 * n;
        for (int i = 0; i < n; ++i) {
            const double S_i = (state[S0 + i] > 0.0) ? state[S0 + i] : 0.0;
            const double lambda_i = lambda_[i];

            jacobian(S0 + i, S0 + i) = -lambda_i;
            jacobian(E0 + i, S0 + i) = lambda_i;
            for (int j = 0; j < n; ++j) {
                const double coupling = beta_(i, j) * S_i;
                jacobian(S0 + i, I0 + j) = -coupling;
                jacobian(E0 + i, I0 + j) = coupling;
            }
            jacobian(E0 + i, E0 + i) = -r_;
            jacobian(I0 + i, E0 + i) = r_;
            jacobian(I0 + i, I0 + i) = -gamma_;
            jacobian(R0 + i, I0 + i) = gamma_;
        }
    }

    int StratifiedSEIRModel::getStateSize() const {
        return constants::NUM_COMPARTMENTS_SEIR * num_groups_;
    }

    std::vector<std::string> StratifiedSEIRModel::getStateNames() const {
        std::vector<std::string> names;
        names.reserve(getStateSize());
        const char* compartments[] = {"S", "E", "I", "R"};
        for (const char* c : compartments) {
            for (int i = 0; i < num_groups_; ++i) {
                names.push_back(std::string(c) + "_" + std::to_string(i));
            }
        }
        return names;
    }

} // namespace seroherd
