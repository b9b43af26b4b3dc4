#ifndef SEROHERD_MODEL_CONSTANTS_HPP
#define SEROHERD_MODEL_CONSTANTS_HPP

namespace seroherd {
namespace constants {

    /** @brief S, E, I, R blocks in the flattened state vector. */
    constexpr int NUM_COMPARTMENTS_SEIR = 4;

    /** @brief Accepted deviation of the population fractions' sum from 1. */
    constexpr double FRACTION_SUM_TOLERANCE = 5e-3;

    /** @brief Relative imaginary part above which a dominant eigenvalue is treated as complex. */
    constexpr double EIGENVALUE_IMAG_TOLERANCE = 1e-8;

    /** @brief Relative gap under which two eigenvalue magnitudes count as tied. */
    constexpr double EIGENVALUE_TIE_TOLERANCE = 1e-12;

    /** @brief Probabilities are clamped to [PROBABILITY_FLOOR, 1 - PROBABILITY_FLOOR] in likelihoods. */
    constexpr double PROBABILITY_FLOOR = 1e-12;

    /** @brief Default lower and upper bounds for fitted multipliers. */
    constexpr double DEFAULT_PARAM_LOWER_BOUND = 1e-4;
    constexpr double DEFAULT_PARAM_UPPER_BOUND = 20.0;

    /** @brief Output spacing (days) used when integrating up to the survey time. */
    constexpr double DEFAULT_SURVEY_GRID_STEP = 1.0;

    /** @brief Number of horizon doublings tried when the threshold is not reached. */
    constexpr int MAX_HORIZON_EXTENSIONS = 4;

} // namespace constants
} // namespace seroherd

#endif // SEROHERD_MODEL_CONSTANTS_HPP
