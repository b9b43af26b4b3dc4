#ifndef SEROHERD_COMPARTMENT_STATE_HPP
#define SEROHERD_COMPARTMENT_STATE_HPP

#include <Eigen/Dense>
#include <vector>

namespace seroherd {

    /**
     * @brief S, E, I, R counts for every demographic group at one instant.
     *
     * The flattened layout used by the ODE solvers is [S_0..S_{G-1}, E_0.., I_0.., R_0..].
     */
    struct CompartmentState {
        Eigen::VectorXd S;
        Eigen::VectorXd E;
        Eigen::VectorXd I;
        Eigen::VectorXd R;

        CompartmentState() = default;

        explicit CompartmentState(int num_groups)
            : S(Eigen::VectorXd::Zero(num_groups)), E(Eigen::VectorXd::Zero(num_groups)),
              I(Eigen::VectorXd::Zero(num_groups)), R(Eigen::VectorXd::Zero(num_groups)) {}

        int numGroups() const { return static_cast<int>(S.size()); }

        /** @brief S_i + E_i + I_i + R_i per group. */
        Eigen::VectorXd groupTotals() const { return S + E + I + R; }

        std::vector<double> toStateVector() const {
            const int n = numGroups();
            std::vector<double> x(4 * n);
            for (int i = 0; i < n; ++i) {
                x[i] = S(i);
                x[n + i] = E(i);
                x[2 * n + i] = I(i);
                x[3 * n + i] = R(i);
            }
            return x;
        }

        static CompartmentState fromStateVector(const std::vector<double>& x, int num_groups) {
            CompartmentState state;
            state.S = Eigen::Map<const Eigen::VectorXd>(x.data(), num_groups);
            state.E = Eigen::Map<const Eigen::VectorXd>(x.data() + num_groups, num_groups);
            state.I = Eigen::Map<const Eigen::VectorXd>(x.data() + 2 * num_groups, num_groups);
            state.R = Eigen::Map<const Eigen::VectorXd>(x.data() + 3 * num_groups, num_groups);
            return state;
        }
    };

    /**
     * @brief Time-ordered sequence of compartment states on a strictly increasing grid.
     */
    struct Trajectory {
        std::vector<double> time_points;
        std::vector<CompartmentState> states;

        size_t size() const { return time_points.size(); }

        bool isValid() const { return !time_points.empty() && time_points.size() == states.size(); }

        int numGroups() const { return states.empty() ? 0 : states.front().numGroups(); }

        const CompartmentState& back() const { return states.back(); }
    };

} // namespace seroherd

#endif // SEROHERD_COMPARTMENT_STATE_HPP
