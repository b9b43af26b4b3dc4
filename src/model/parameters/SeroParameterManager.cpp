#include "model/parameters/SeroParameterManager.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace seroherd {

    static Logger& logger = Logger::getInstance();
    static const std::string LOG_SOURCE = "SERO_PARAMETERS";

    static void checkBounds(const std::string& name, double lower, double upper) {
        if (!(lower > 0.0) || !(upper >= lower) || !std::isfinite(upper)) {
            THROW_INVALID_PARAM("SeroParameterManager",
                "Bounds for '" + name + "' must satisfy 0 < lower <= upper, got [" +
                std::to_string(lower) + ", " + std::to_string(upper) + "]");
        }
    }

    SeroParameterManager::SeroParameterManager(const std::string& prefix, int num_groups,
                                               double lower_bound, double upper_bound) {
        if (num_groups < 1) {
            THROW_INVALID_PARAM("SeroParameterManager", "At least one parameter is required.");
        }
        checkBounds(prefix, lower_bound, upper_bound);

        names_.reserve(num_groups);
        for (int i = 0; i < num_groups; ++i) {
            names_.push_back(prefix + "_" + std::to_string(i));
        }
        lower_ = Eigen::VectorXd::Constant(num_groups, lower_bound);
        upper_ = Eigen::VectorXd::Constant(num_groups, upper_bound);
    }

    void SeroParameterManager::setBounds(const std::map<std::string, std::pair<double, double>>& bounds) {
        for (const auto& entry : bounds) {
            bool found = false;
            for (size_t i = 0; i < names_.size(); ++i) {
                if (names_[i] == entry.first) {
                    checkBounds(entry.first, entry.second.first, entry.second.second);
                    lower_(i) = entry.second.first;
                    upper_(i) = entry.second.second;
                    found = true;
                    break;
                }
            }
            if (!found) {
                logger.warning(LOG_SOURCE, "Ignoring bounds for unknown parameter '" + entry.first + "'");
            }
        }
    }

    size_t SeroParameterManager::getParameterCount() const {
        return names_.size();
    }

    const std::vector<std::string>& SeroParameterManager::getParameterNames() const {
        return names_;
    }

    Eigen::VectorXd SeroParameterManager::applyConstraints(const Eigen::VectorXd& parameters) const {
        if (parameters.size() != lower_.size()) {
            THROW_INVALID_PARAM("SeroParameterManager::applyConstraints",
                "Expected " + std::to_string(lower_.size()) + " parameters, got " +
                std::to_string(parameters.size()));
        }
        Eigen::VectorXd constrained(parameters.size());
        for (int i = 0; i < parameters.size(); ++i) {
            const double v = parameters(i);
            constrained(i) = std::isnan(v) ? lower_(i) : std::min(std::max(v, lower_(i)), upper_(i));
        }
        return constrained;
    }

    double SeroParameterManager::getSigmaForParamIndex(int idx) const {
        checkIndex(idx);
        return 0.05 * (upper_(idx) - lower_(idx));
    }

    double SeroParameterManager::getLowerBoundForParamIndex(int idx) const {
        checkIndex(idx);
        return lower_(idx);
    }

    double SeroParameterManager::getUpperBoundForParamIndex(int idx) const {
        checkIndex(idx);
        return upper_(idx);
    }

    bool SeroParameterManager::isFeasible(const Eigen::VectorXd& parameters) const {
        if (parameters.size() != lower_.size()) return false;
        return (parameters.array() >= lower_.array()).all() && (parameters.array() <= upper_.array()).all();
    }

    void SeroParameterManager::checkIndex(int idx) const {
        if (idx < 0 || idx >= lower_.size()) {
            throw std::out_of_range("SeroParameterManager: parameter index " + std::to_string(idx) + " out of range");
        }
    }

} // namespace seroherd
