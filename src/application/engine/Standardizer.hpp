/**
 * @file Standardizer.hpp
 * @brief Direction normalization plus min-max / z-score scaling with frozen parameters.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "application/engine/EngineTypes.hpp"
#include "domain/Indicator.hpp"
#include "domain/StandardizationParams.hpp"

namespace indexforge::application::engine {

/**
 * @class Standardizer
 * @brief Pure functions of (raw value, direction, params).
 *
 * Negative-direction indicators are negated before fitting and before applying,
 * so that after standardization higher is always better.
 */
class Standardizer {
public:
    /// Value every observation maps to when the frozen min-max range is empty.
    static constexpr double kMinMaxNeutral = 0.5;
    /// Value every observation maps to when the frozen stddev is zero.
    static constexpr double kZScoreNeutral = 0.0;

    static double applyDirection(double raw, domain::Direction direction);

    /**
     * @brief Fits parameters over the training population of one indicator.
     * @param indicatorKey Used in error messages.
     * @param raw Raw values; nullopt marks a missing or non-numeric cell.
     * @throws domain::MissingValueError if any value is missing or non-finite.
     * @throws domain::InsufficientDataError if fewer than two distinct values remain.
     */
    static domain::StandardizationParams fit(const std::string& indicatorKey,
                                             const std::vector<std::optional<double>>& raw,
                                             domain::Direction direction,
                                             domain::StandardizationMethod method);

    /**
     * @brief Maps a raw value with frozen parameters. Min-max output is clamped
     *        to [0, 1]; z-scores are not clamped.
     */
    static double apply(double raw, domain::Direction direction, const domain::StandardizationParams& params);

    /**
     * @brief Fits every column of a raw matrix and returns the standardized matrix.
     * @param params Receives one parameter set per column.
     */
    static Mat fitTransform(const ObservationMatrix& raw,
                            const std::vector<domain::Direction>& directions,
                            domain::StandardizationMethod method,
                            std::vector<domain::StandardizationParams>& params);
};

} // namespace indexforge::application::engine
