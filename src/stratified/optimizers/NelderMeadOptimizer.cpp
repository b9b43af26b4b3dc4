#include "stratified/optimizers/NelderMeadOptimizer.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace seroherd {

    static Logger& logger = Logger::getInstance();
    static const std::string LOG_SOURCE = "NELDER_MEAD";

    NelderMeadOptimizer::NelderMeadOptimizer(const NelderMeadOptions& options)
        : m_options(options)
    {
    }

    const NelderMeadOptions& NelderMeadOptimizer::getOptions() const {
        return m_options;
    }

    void NelderMeadOptimizer::configure(const std::map<std::string, double>& settings) {
        auto get = [&](const std::string& key, double def) {
            auto it = settings.find(key);
            return (it != settings.end()) ? it->second : def;
        };

        m_options.max_iter = std::max(1, static_cast<int>(get("iterations", m_options.max_iter)));
        m_options.max_evaluations = std::max(1, static_cast<int>(get("max_evaluations", m_options.max_evaluations)));
        m_options.restarts = std::max(0, static_cast<int>(get("restarts", m_options.restarts)));
        m_options.tol_f = get("tolerance_f", m_options.tol_f);
        m_options.tol_x = get("tolerance_x", m_options.tol_x);
        m_options.initial_step = get("initial_step", m_options.initial_step);
        m_options.log_transform = get("log_transform", m_options.log_transform ? 1.0 : 0.0) != 0.0;
        m_options.alpha = get("alpha", m_options.alpha);
        m_options.gamma = get("gamma", m_options.gamma);
        m_options.rho = get("rho", m_options.rho);
        m_options.sigma = get("sigma", m_options.sigma);
        m_options.report_interval = std::max(1, static_cast<int>(get("report_interval", m_options.report_interval)));

        if (!(m_options.initial_step > 0.0) || !(m_options.tol_f > 0.0) || !(m_options.tol_x > 0.0)) {
            THROW_INVALID_PARAM("NelderMeadOptimizer::configure", "initial_step and tolerances must be positive.");
        }

        logger.info(LOG_SOURCE, "Configured Nelder-Mead: Iterations=" + std::to_string(m_options.max_iter) +
                    ", MaxEvaluations=" + std::to_string(m_options.max_evaluations) +
                    ", Restarts=" + std::to_string(m_options.restarts) +
                    ", LogTransform=" + std::to_string(m_options.log_transform));
    }

    bool NelderMeadOptimizer::runSimplex(const std::function<double(const Eigen::VectorXd&)>& f,
                                         Eigen::VectorXd& best, double& best_value,
                                         const Eigen::VectorXd& lower, const Eigen::VectorXd& upper,
                                         int& evaluations, int& iterations) const {
        const int n = static_cast<int>(best.size());
        const NelderMeadOptions& o = m_options;

        auto clampToBounds = [&](const Eigen::VectorXd& p) -> Eigen::VectorXd {
            return p.cwiseMax(lower).cwiseMin(upper);
        };
        auto evaluate = [&](const Eigen::VectorXd& p) {
            ++evaluations;
            return f(p);
        };

        // Initialize simplex: x0 and one displaced vertex per coordinate
        std::vector<Eigen::VectorXd> x(n + 1);
        std::vector<double> fx(n + 1);
        x[0] = clampToBounds(best);
        fx[0] = best_value;
        for (int k = 0; k < n; ++k) {
            Eigen::VectorXd v = x[0];
            double step = o.initial_step * std::max(std::abs(v(k)), 1.0);
            if (v(k) + step > upper(k)) step = -step;
            v(k) += step;
            x[k + 1] = clampToBounds(v);
            fx[k + 1] = evaluate(x[k + 1]);
        }

        std::vector<int> idx(n + 1);
        auto sort_simplex = [&]() {
            std::iota(idx.begin(), idx.end(), 0);
            std::stable_sort(idx.begin(), idx.end(), [&](int i, int j) { return fx[i] < fx[j]; });
            std::vector<Eigen::VectorXd> x2(n + 1);
            std::vector<double> fx2(n + 1);
            for (int k = 0; k <= n; ++k) {
                x2[k] = x[idx[k]];
                fx2[k] = fx[idx[k]];
            }
            x.swap(x2);
            fx.swap(fx2);
        };

        sort_simplex();

        bool converged = false;
        for (int iter = 0; iter < o.max_iter; ++iter) {
            if (evaluations >= o.max_evaluations) break;
            ++iterations;

            // Check convergence
            const double fspan = std::abs(fx[n] - fx[0]);
            double xspan = 0.0;
            for (int k = 1; k <= n; ++k) xspan = std::max(xspan, (x[k] - x[0]).norm());
            if (fspan <= o.tol_f * (1.0 + std::abs(fx[0])) && xspan <= o.tol_x) {
                converged = fx[0] < std::numeric_limits<double>::max();
                break;
            }

            // Centroid of all but the worst vertex
            Eigen::VectorXd xc = Eigen::VectorXd::Zero(n);
            for (int k = 0; k < n; ++k) xc += x[k];
            xc /= static_cast<double>(n);

            // Reflection
            Eigen::VectorXd xr = clampToBounds(xc + o.alpha * (xc - x[n]));
            const double fr = evaluate(xr);

            if (fr < fx[0]) {
                // Try expansion
                Eigen::VectorXd xe = clampToBounds(xc + o.gamma * (xr - xc));
                const double fe = evaluate(xe);
                if (fe < fr) {
                    x[n] = xe;
                    fx[n] = fe;
                } else {
                    x[n] = xr;
                    fx[n] = fr;
                }
            } else if (fr < fx[n - 1]) {
                // Accept reflection
                x[n] = xr;
                fx[n] = fr;
            } else {
                // Contraction: outside if the reflection beat the worst vertex, inside otherwise
                Eigen::VectorXd xcand = (fr < fx[n])
                    ? clampToBounds(xc + o.rho * (xr - xc))
                    : clampToBounds(xc - o.rho * (xc - x[n]));
                const double fc = evaluate(xcand);

                if (fc < std::min(fr, fx[n])) {
                    x[n] = xcand;
                    fx[n] = fc;
                } else {
                    // Shrink toward best point
                    for (int k = 1; k <= n; ++k) {
                        x[k] = clampToBounds(x[0] + o.sigma * (x[k] - x[0]));
                        fx[k] = evaluate(x[k]);
                    }
                }
            }

            sort_simplex();

            if (iterations % o.report_interval == 0) {
                logger.debug(LOG_SOURCE, "Iter " + std::to_string(iterations) +
                             " | Best: " + std::to_string(-fx[0]) +
                             " | Spread: " + std::to_string(fspan));
            }
        }

        best = x[0];
        best_value = fx[0];
        return converged;
    }

    OptimizationResult NelderMeadOptimizer::optimize(
        const Eigen::VectorXd& initialParameters,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager) {

        const int n = static_cast<int>(initialParameters.size());
        if (n == 0 || static_cast<size_t>(n) != parameterManager.getParameterCount()) {
            THROW_INVALID_PARAM("NelderMeadOptimizer::optimize",
                "Initial parameter vector has " + std::to_string(n) + " entries, expected " +
                std::to_string(parameterManager.getParameterCount()));
        }

        Eigen::VectorXd lower(n), upper(n);
        for (int i = 0; i < n; ++i) {
            lower(i) = parameterManager.getLowerBoundForParamIndex(i);
            upper(i) = parameterManager.getUpperBoundForParamIndex(i);
        }

        bool use_log = m_options.log_transform;
        if (use_log && !(lower.array() > 0.0).all()) {
            logger.warning(LOG_SOURCE, "Log-space search needs positive lower bounds; searching in linear space.");
            use_log = false;
        }

        auto toSearch = [use_log](const Eigen::VectorXd& p) -> Eigen::VectorXd {
            return use_log ? Eigen::VectorXd(p.array().log()) : p;
        };
        auto fromSearch = [use_log](const Eigen::VectorXd& y) -> Eigen::VectorXd {
            return use_log ? Eigen::VectorXd(y.array().exp()) : y;
        };

        // Minimize the negated objective; failed evaluations become the largest finite value.
        auto f = [&](const Eigen::VectorXd& y) {
            const double v = objectiveFunction.calculate(parameterManager.applyConstraints(fromSearch(y)));
            if (std::isnan(v) || std::isinf(v)) return std::numeric_limits<double>::max();
            return -v;
        };

        OptimizationResult result;
        Eigen::VectorXd y = toSearch(parameterManager.applyConstraints(initialParameters));
        const Eigen::VectorXd lower_s = toSearch(lower);
        const Eigen::VectorXd upper_s = toSearch(upper);

        double best_value = f(y);
        result.evaluations = 1;

        logger.info(LOG_SOURCE, "Starting Nelder-Mead over " + std::to_string(n) +
                    " parameters. Initial objective: " + std::to_string(-best_value));

        bool converged = false;
        for (int attempt = 0; attempt <= m_options.restarts; ++attempt) {
            const double before = best_value;
            converged = runSimplex(f, y, best_value, lower_s, upper_s, result.evaluations, result.iterations);
            logger.info(LOG_SOURCE, "Simplex " + std::to_string(attempt + 1) +
                        (converged ? " converged" : " stopped") +
                        ". Best objective: " + std::to_string(-best_value) +
                        " after " + std::to_string(result.evaluations) + " evaluations");
            if (!converged) break;
            if (attempt > 0 && before - best_value <= m_options.tol_f) break;
        }

        result.bestParameters = parameterManager.applyConstraints(fromSearch(y));
        result.bestObjectiveValue = -best_value;
        result.converged = converged;

        if (!converged) {
            logger.warning(LOG_SOURCE, "Nelder-Mead did not converge within " +
                           std::to_string(m_options.max_iter) + " iterations / " +
                           std::to_string(m_options.max_evaluations) + " evaluations.");
        }
        return result;
    }

} // namespace seroherd
