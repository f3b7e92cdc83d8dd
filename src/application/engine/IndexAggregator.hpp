/**
 * @file IndexAggregator.hpp
 * @brief Applies a trained WeightModel to datasets to produce composite and sub-index scores.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "application/engine/ScoreScaler.hpp"
#include "domain/ColumnMapping.hpp"
#include "domain/Dataset.hpp"
#include "domain/ResultSet.hpp"
#include "domain/WeightModel.hpp"

namespace indexforge::application::engine {

/**
 * @struct DatasetSource
 * @brief A dataset paired with the mapping that resolves indicator keys to its columns.
 */
struct DatasetSource {
    const domain::Dataset* dataset = nullptr;
    domain::ColumnMapping mapping;
};

/**
 * @class IndexAggregator
 * @brief Read-only over the model; safe to share between concurrent runs.
 *
 * Row resolution failures (unmapped indicator, missing column, empty or non-numeric
 * cell, repeated entity/year) skip the row and are reported; they never abort the run.
 */
class IndexAggregator {
public:
    struct Output {
        std::vector<domain::ResultRow> rows;
        std::vector<domain::RowFailure> failures;
        domain::FailureSummary summary;
        std::vector<std::string> dimensionKeys;
    };

    explicit IndexAggregator(const domain::WeightModel& model);

    /** @brief Scores every row of every source, in source order then row order. */
    Output aggregate(const std::vector<DatasetSource>& sources) const;

    /**
     * @brief Scores a single observation whose raw values are already resolved.
     * @param rawValues indicatorKey -> raw value; must contain every model indicator.
     */
    domain::ResultRow scoreObservation(const std::string& datasetId,
                                       const std::string& entity,
                                       int year,
                                       const std::map<std::string, double>& rawValues) const;

private:
    const domain::WeightModel& m_model;
    CompositeScorer m_scorer;
};

} // namespace indexforge::application::engine
