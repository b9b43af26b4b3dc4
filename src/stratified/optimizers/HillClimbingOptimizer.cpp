#include "stratified/optimizers/HillClimbingOptimizer.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <Eigen/Cholesky>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <limits>
#include <random>
#include <vector>

namespace seroherd {

    static Logger& logger = Logger::getInstance();
    static const std::string LOG_SOURCE = "HILL_CLIMBING";

    static const double FAILED_SCORE = std::numeric_limits<double>::lowest();

    // Maps NaN/Inf objective values to the failure score. Exceptions propagate.
    // IObjectiveFunction::calculate() and IParameterManager::applyConstraints() are const and thread-safe.
    static double safe_evaluate(const IObjectiveFunction& func, const Eigen::VectorXd& p) {
        double val = func.calculate(p);
        if (std::isnan(val) || std::isinf(val)) return FAILED_SCORE;
        return val;
    }

    // Phase 1: Backtracking - find any improvement with progressively smaller steps
    // Phase 2: Expansion - accelerate along the successful direction using a moving anchor
    static bool performRobustLineSearch(
        Eigen::VectorXd& current_params,
        double& current_logL,
        const Eigen::VectorXd& direction,
        const IObjectiveFunction& func,
        const IParameterManager& pm,
        int& evaluations)
    {
        const double shrinkage = 0.5;
        const double growth = 2.0;
        const int max_backtrack = 10;
        const int max_expansion = 12;

        double step = 1.0;
        Eigen::VectorXd improved_params = current_params;
        double improved_logL = current_logL;
        bool found_improvement = false;

        for (int i = 0; i < max_backtrack; ++i) {
            Eigen::VectorXd candidate = pm.applyConstraints(current_params + direction * step);

            // Step too small to make a difference
            if ((candidate - current_params).squaredNorm() < 1e-16) break;

            double candidate_logL = safe_evaluate(func, candidate);
            ++evaluations;

            if (candidate_logL > improved_logL) {
                improved_params = candidate;
                improved_logL = candidate_logL;
                found_improvement = true;
                break;
            }
            step *= shrinkage;
        }

        if (!found_improvement) return false;

        Eigen::VectorXd best_params = improved_params;
        double best_logL = improved_logL;

        // Effective step after projection onto the bounds
        Eigen::VectorXd current_step = (improved_params - current_params);

        for (int i = 0; i < max_expansion; ++i) {
            current_step *= growth;

            Eigen::VectorXd candidate = pm.applyConstraints(best_params + current_step);
            if ((candidate - best_params).squaredNorm() < 1e-16) break;

            double candidate_logL = safe_evaluate(func, candidate);
            ++evaluations;

            if (candidate_logL > best_logL) {
                best_params = candidate;
                best_logL = candidate_logL;
            } else {
                break;
            }
        }

        current_params = best_params;
        current_logL = best_logL;
        return true;
    }

    HillClimbingOptimizer::HillClimbingOptimizer() = default;

    void HillClimbingOptimizer::configure(const std::map<std::string, double>& settings) {
        auto get = [&](const std::string& key, double def) {
            auto it = settings.find(key);
            return (it != settings.end()) ? it->second : def;
        };

        iterations_ = std::max(1, static_cast<int>(get("iterations", 2000.0)));
        report_interval_ = std::max(1, static_cast<int>(get("report_interval", 100.0)));
        cloud_size_ = std::max(4, static_cast<int>(get("cloud_size", 32.0)));
        stall_iterations_ = std::max(1, static_cast<int>(get("stall_iterations", 150.0)));
        tolerance_f_ = get("tolerance_f", 1e-8);
        seed_ = static_cast<unsigned int>(get("seed", 42.0));

        if (!(tolerance_f_ >= 0.0)) {
            THROW_INVALID_PARAM("HillClimbingOptimizer::configure", "tolerance_f must be non-negative.");
        }

        logger.info(LOG_SOURCE, "Configured Parallel Hill Climber: Iterations=" + std::to_string(iterations_) +
                    ", CloudSize=" + std::to_string(cloud_size_) +
                    ", StallIterations=" + std::to_string(stall_iterations_));
    }

    OptimizationResult HillClimbingOptimizer::optimize(
        const Eigen::VectorXd& initialParameters,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager) {

        int n_params = static_cast<int>(initialParameters.size());
        if (n_params == 0 || static_cast<size_t>(n_params) != parameterManager.getParameterCount()) {
            THROW_INVALID_PARAM("HillClimbingOptimizer::optimize",
                "Initial parameter vector has " + std::to_string(n_params) + " entries, expected " +
                std::to_string(parameterManager.getParameterCount()));
        }

        OptimizationResult result;
        Eigen::VectorXd current_params = parameterManager.applyConstraints(initialParameters);
        double current_logL = safe_evaluate(objectiveFunction, current_params);
        result.bestParameters = current_params;
        result.bestObjectiveValue = current_logL;
        result.evaluations = 1;

        // --- 1. Adaptive Covariance Initialization ---
        Eigen::MatrixXd cov = Eigen::MatrixXd::Identity(n_params, n_params);
        for (int i = 0; i < n_params; ++i) {
            double s = parameterManager.getSigmaForParamIndex(i);
            cov(i, i) = (s > 0 ? s * s : 1e-4);
        }
        Eigen::MatrixXd L = cov.llt().matrixL();

        // --- 2. Candidate cloud setup ---
        // Candidate i of iteration k draws from a generator seeded by (seed, k, i).
        const int num_candidates = cloud_size_;

        logger.info(LOG_SOURCE, "Starting Parallel Search. Cloud Size: " + std::to_string(num_candidates) +
                                ", Initial LogL: " + std::to_string(current_logL));

        Eigen::VectorXd prev_params = current_params;

        std::vector<Eigen::VectorXd> candidates(num_candidates, Eigen::VectorXd(n_params));
        std::vector<Eigen::VectorXd> constrained_candidates(num_candidates, Eigen::VectorXd(n_params));
        std::vector<double> scores(num_candidates, FAILED_SCORE);
        std::vector<std::exception_ptr> failures(num_candidates);

        int stalled = 0;
        bool converged = false;

        for (int iter = 0; iter < iterations_; ++iter) {
            ++result.iterations;
            const double logL_before = result.bestObjectiveValue;

            // A. Candidate cloud: correlated global moves and axis-aligned local moves
            for (int i = 0; i < num_candidates; ++i) {
                std::seed_seq seq{static_cast<std::uint32_t>(seed_), static_cast<std::uint32_t>(iter),
                                  static_cast<std::uint32_t>(i)};
                std::mt19937 rng(seq);
                std::normal_distribution<double> norm(0.0, 1.0);

                if (i < num_candidates / 2) {
                    Eigen::VectorXd z(n_params);
                    for (int k = 0; k < n_params; ++k) z(k) = norm(rng);
                    candidates[i] = L * z;
                } else {
                    std::uniform_int_distribution<int> param_dist(0, n_params - 1);
                    int idx = param_dist(rng);
                    double sigma = std::sqrt(cov(idx, idx));
                    candidates[i] = Eigen::VectorXd::Zero(n_params);
                    candidates[i](idx) = sigma * norm(rng);
                }
            }

            // B. Parallel evaluation of the projected candidates. Exceptions must not leave
            // the parallel region; the first one (by candidate index) is rethrown after it.
            #pragma omp parallel for schedule(dynamic)
            for (int i = 0; i < num_candidates; ++i) {
                failures[i] = nullptr;
                scores[i] = FAILED_SCORE;
                try {
                    Eigen::VectorXd p_test = parameterManager.applyConstraints(current_params + candidates[i]);
                    constrained_candidates[i] = p_test;
                    scores[i] = safe_evaluate(objectiveFunction, p_test);
                } catch (...) {
                    failures[i] = std::current_exception();
                }
            }
            result.evaluations += num_candidates;
            for (int i = 0; i < num_candidates; ++i) {
                if (failures[i]) std::rethrow_exception(failures[i]);
            }

            // C. Winner selection
            int best_idx = -1;
            double best_val = FAILED_SCORE;
            for (int i = 0; i < num_candidates; ++i) {
                if (scores[i] > best_val) {
                    best_val = scores[i];
                    best_idx = i;
                }
            }

            // D. Early accept + line search along the projected direction
            bool moved = false;
            if (best_idx != -1 && best_val > FAILED_SCORE) {
                Eigen::VectorXd best_constrained_point = constrained_candidates[best_idx];
                Eigen::VectorXd constrained_direction = best_constrained_point - current_params;

                if (best_val > current_logL) {
                    current_params = best_constrained_point;
                    current_logL = best_val;
                    moved = true;
                }

                bool line_search_improved = performRobustLineSearch(
                    current_params, current_logL, constrained_direction,
                    objectiveFunction, parameterManager, result.evaluations);
                moved = moved || line_search_improved;
            }

            // E. Update & covariance adaptation
            if (moved) {
                if (current_logL > result.bestObjectiveValue) {
                    result.bestObjectiveValue = current_logL;
                    result.bestParameters = current_params;
                }

                Eigen::VectorXd actual_step = current_params - prev_params;
                double step_norm = actual_step.squaredNorm();

                if (step_norm > 1e-14) {
                    double alpha = 2.0 / (n_params + 2.0);
                    cov *= (1.0 - alpha);
                    cov += alpha * (actual_step * actual_step.transpose());
                    cov = 0.5 * (cov + cov.transpose());

                    double jitter = 1e-8 * cov.trace() / n_params;
                    cov += jitter * Eigen::MatrixXd::Identity(n_params, n_params);

                    // Diagonal floor at 1% of the initial variance
                    for (int i = 0; i < n_params; ++i) {
                        double min_var = parameterManager.getSigmaForParamIndex(i);
                        min_var = (min_var > 0 ? min_var * min_var * 0.01 : 1e-8);
                        if (cov(i, i) < min_var) cov(i, i) = min_var;
                    }
                }
                prev_params = current_params;
            }

            // F. Refresh Cholesky factor every 10 iterations
            if (iter > 0 && iter % 10 == 0) {
                Eigen::LLT<Eigen::MatrixXd> llt(cov);
                if (llt.info() == Eigen::Success) {
                    L = llt.matrixL();
                } else {
                    double lambda = 1e-6 * cov.trace() / n_params;
                    const int max_attempts = 5;
                    bool regularized = false;
                    for (int attempt = 0; attempt < max_attempts; ++attempt) {
                        cov += lambda * Eigen::MatrixXd::Identity(n_params, n_params);
                        Eigen::LLT<Eigen::MatrixXd> llt_retry(cov);
                        if (llt_retry.info() == Eigen::Success) {
                            L = llt_retry.matrixL();
                            regularized = true;
                            break;
                        }
                        lambda *= 10.0;
                    }
                    if (!regularized) {
                        cov = Eigen::MatrixXd(cov.diagonal().asDiagonal());
                        L = Eigen::MatrixXd(cov.diagonal().cwiseSqrt().asDiagonal());
                        logger.warning(LOG_SOURCE, "Covariance reset to diagonal due to instability");
                    }
                }
            }

            // G. Stall detection
            if (result.bestObjectiveValue - logL_before > tolerance_f_) {
                stalled = 0;
            } else if (++stalled >= stall_iterations_ && result.bestObjectiveValue > FAILED_SCORE) {
                converged = true;
            }

            if ((iter + 1) % report_interval_ == 0) {
                logger.info(LOG_SOURCE, "Iter " + std::to_string(iter + 1) +
                            " | Best LogL: " + std::to_string(result.bestObjectiveValue) +
                            " | Current LogL: " + std::to_string(current_logL));
            }

            if (converged) break;
        }

        result.converged = converged;
        if (converged) {
            logger.info(LOG_SOURCE, "Converged after " + std::to_string(result.iterations) +
                        " iterations. Best LogL: " + std::to_string(result.bestObjectiveValue));
        } else {
            logger.warning(LOG_SOURCE, "Iteration limit (" + std::to_string(iterations_) +
                           ") reached before the objective stalled.");
        }
        return result;
    }

} // namespace seroherd
