#ifndef SEROHERD_EXCEPTIONS_HPP
#define SEROHERD_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace seroherd {

    /**
     * @brief Base class for every error raised by the SeroHerd library.
     *
     * The message reported by what() is "[source] message", where source names the
     * function or component that detected the problem.
     */
    class ModelException : public std::runtime_error {
    public:
        ModelException(const std::string& source, const std::string& message)
            : std::runtime_error("[" + source + "] " + message), source_(source) {}

        const std::string& getSource() const { return source_; }

    private:
        std::string source_;
    };

    /**
     * @brief Malformed scenario inputs: bad fractions, non-positive populations,
     * out-of-range assortativity, inconsistent dimensions.
     */
    class InvalidParameterException : public ModelException {
    public:
        InvalidParameterException(const std::string& source, const std::string& message)
            : ModelException(source, message) {}
    };

    /**
     * @brief Generic failure of the numerical backend (odeint, linear algebra).
     */
    class SimulationException : public ModelException {
    public:
        SimulationException(const std::string& source, const std::string& message)
            : ModelException(source, message) {}
    };

    /**
     * @brief Settings text that cannot be parsed.
     */
    class DataFormatException : public ModelException {
    public:
        DataFormatException(const std::string& source, const std::string& message)
            : ModelException(source, message) {}
    };

    /**
     * @brief The eigen-analysis produced a non-physical dominant eigenvalue
     * (complex beyond tolerance, or not strictly positive).
     */
    class DegenerateSpectrumException : public ModelException {
    public:
        DegenerateSpectrumException(const std::string& source, const std::string& message,
                                    double real_part, double imag_part)
            : ModelException(source, message), real_part_(real_part), imag_part_(imag_part) {}

        double getRealPart() const { return real_part_; }
        double getImagPart() const { return imag_part_; }

    private:
        double real_part_;
        double imag_part_;
    };

    /**
     * @brief The ODE solver could not keep the requested error tolerance within the
     * allowed number of step-size reductions.
     */
    class IntegrationDivergenceException : public SimulationException {
    public:
        IntegrationDivergenceException(const std::string& source, const std::string& message,
                                       double last_stable_time)
            : SimulationException(source, message), last_stable_time_(last_stable_time) {}

        /** @brief Last time up to which the solution was accepted. */
        double getLastStableTime() const { return last_stable_time_; }

    private:
        double last_stable_time_;
    };

    /**
     * @brief A compartment went negative beyond roundoff, or group mass drifted
     * away from the group population.
     */
    class PhysicalInvariantViolationException : public SimulationException {
    public:
        PhysicalInvariantViolationException(const std::string& source, const std::string& message,
                                            double time, int group, double last_stable_time)
            : SimulationException(source, message),
              time_(time), group_(group), last_stable_time_(last_stable_time) {}

        double getTime() const { return time_; }
        int getGroup() const { return group_; }
        double getLastStableTime() const { return last_stable_time_; }

    private:
        double time_;
        int group_;
        double last_stable_time_;
    };

    /**
     * @brief No sampled point of the trajectory has Rt <= 1. Recoverable: extend the
     * time horizon and retry.
     */
    class ThresholdNotReachedException : public ModelException {
    public:
        ThresholdNotReachedException(const std::string& source, const std::string& message,
                                     double min_rt)
            : ModelException(source, message), min_rt_(min_rt) {}

        double getMinimumRt() const { return min_rt_; }

    private:
        double min_rt_;
    };

    /**
     * @brief Unknown calibration parameterization mode.
     */
    class ModelNotRecognizedException : public ModelException {
    public:
        ModelNotRecognizedException(const std::string& source, const std::string& mode)
            : ModelException(source, "Unrecognized parameterization mode '" + mode +
                                     "' (expected 'activity' or 'susceptibility')"),
              mode_(mode) {}

        const std::string& getMode() const { return mode_; }

    private:
        std::string mode_;
    };

} // namespace seroherd

#define THROW_INVALID_PARAM(source, msg) \
    throw ::seroherd::InvalidParameterException((source), (msg))

#endif // SEROHERD_EXCEPTIONS_HPP
