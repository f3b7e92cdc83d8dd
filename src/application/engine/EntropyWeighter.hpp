/**
 * @file EntropyWeighter.hpp
 * @brief Weights from the information entropy of min-max standardized columns.
 */

#pragma once

#include <string>
#include <vector>

#include "application/engine/EngineTypes.hpp"
#include "domain/WeightModel.hpp"

namespace indexforge::application::engine {

class EntropyWeighter {
public:
    struct Result {
        Vec weights;                          ///< Sums to 1, indicator order.
        domain::EntropyProvenance provenance;
    };

    /**
     * @brief Derives weights from a standardized matrix with values in [0, 1].
     * @param standardized Rows = observations, columns = indicators.
     * @param indicatorKeys Column names, used in error messages.
     * @throws domain::InsufficientDataError with fewer than 2 observations.
     * @throws domain::ValidationError if a value lies outside [0, 1].
     * @throws domain::DegenerateIndicatorError for a zero-sum or constant column.
     * @throws domain::AllIndicatorsUniformError when every divergence is 0.
     */
    static Result weigh(const Mat& standardized, const std::vector<std::string>& indicatorKeys);

    /**
     * @brief Rejects a raw column that is constant across all observations.
     * @throws domain::DegenerateIndicatorError
     */
    static void requireDispersion(const std::string& indicatorKey, const Vec& rawColumn);
};

} // namespace indexforge::application::engine
