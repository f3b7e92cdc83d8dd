/**
 * @file StandardizationParams.hpp
 * @brief Frozen per-indicator standardization parameters.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>

namespace indexforge::domain {

/**
 * @enum StandardizationMethod
 * @brief Scale normalization applied after direction normalization.
 */
enum class StandardizationMethod {
    MinMax,
    ZScore
};

inline std::string StandardizationMethodToString(StandardizationMethod m) {
    return m == StandardizationMethod::MinMax ? "minmax" : "zscore";
}

inline std::optional<StandardizationMethod> StandardizationMethodFromString(const std::string& s) {
    if (s == "minmax") return StandardizationMethod::MinMax;
    if (s == "zscore") return StandardizationMethod::ZScore;
    return std::nullopt;
}

/// Observed range over the training population, after direction normalization.
struct MinMaxParams {
    double min = 0.0;
    double max = 0.0;
};

/// Observed mean and sample standard deviation, after direction normalization.
struct ZScoreParams {
    double mean = 0.0;
    double stddev = 0.0;
};

using StandardizationParams = std::variant<MinMaxParams, ZScoreParams>;

inline StandardizationMethod MethodOf(const StandardizationParams& params) {
    return std::holds_alternative<MinMaxParams>(params) ? StandardizationMethod::MinMax
                                                        : StandardizationMethod::ZScore;
}

} // namespace indexforge::domain
