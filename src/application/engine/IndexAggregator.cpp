/**
 * @file IndexAggregator.cpp
 * @brief Implementation of IndexAggregator.
 */

#include "application/engine/IndexAggregator.hpp"

#include <optional>
#include <set>
#include <utility>

#include "application/engine/Standardizer.hpp"
#include "domain/Errors.hpp"

namespace indexforge::application::engine {

using namespace indexforge::domain;

IndexAggregator::IndexAggregator(const WeightModel& model)
    : m_model(model),
      m_scorer(model.indicatorKeys, model.weights, model.dimensions, model.dimension2Weights) {}

ResultRow IndexAggregator::scoreObservation(const std::string& datasetId,
                                            const std::string& entity,
                                            int year,
                                            const std::map<std::string, double>& rawValues) const {
    const auto& keys = m_model.indicatorKeys;
    Vec standardized(static_cast<Eigen::Index>(keys.size()));
    for (size_t j = 0; j < keys.size(); ++j) {
        const auto& key = keys[j];
        auto params = m_model.standardizationParams.find(key);
        if (params == m_model.standardizationParams.end()) {
            throw ValidationError("Weight model " + m_model.id + " has no standardization parameters for '" + key + "'");
        }
        auto dir = m_model.directions.find(key);
        const Direction direction = dir == m_model.directions.end() ? Direction::Positive : dir->second;
        standardized(static_cast<Eigen::Index>(j)) = Standardizer::apply(rawValues.at(key), direction, params->second);
    }

    const auto scores = m_scorer.score(standardized);
    const auto& scaling = m_model.scaling;

    ResultRow row;
    row.entity = entity;
    row.year = year;
    row.datasetId = datasetId;
    row.scoreRaw = scores.scoreRaw;
    row.index0To100 = ScoreScaler::toIndex(scores.scoreRaw, scaling.scoreMin, scaling.scoreMax);
    for (const auto& [dim, value] : scores.subScoreRaw) {
        auto lo = scaling.subScoreMin.find(dim);
        auto hi = scaling.subScoreMax.find(dim);
        const double min = lo == scaling.subScoreMin.end() ? 0.0 : lo->second;
        const double max = hi == scaling.subScoreMax.end() ? 1.0 : hi->second;
        row.subScoreRaw[dim] = value;
        row.subindex[dim] = ScoreScaler::toIndex(value, min, max);
    }
    row.rawValues = rawValues;
    return row;
}

IndexAggregator::Output IndexAggregator::aggregate(const std::vector<DatasetSource>& sources) const {
    Output out;
    out.dimensionKeys = m_scorer.scoredDimensions();
    std::set<std::pair<std::string, int>> scored;

    for (const auto& source : sources) {
        if (!source.dataset) continue;
        const Dataset& dataset = *source.dataset;

        // Resolve columns once per dataset; unresolved keys fail every row of it.
        std::map<std::string, std::optional<std::string>> columnFor;
        std::map<std::string, std::string> mappingProblem;
        for (const auto& key : m_model.indicatorKeys) {
            auto column = source.mapping.columnFor(key);
            if (!column) {
                mappingProblem[key] = "is not mapped to any column";
            } else if (!dataset.hasColumn(*column)) {
                mappingProblem[key] = "is mapped to missing column '" + *column + "'";
                column.reset();
            }
            columnFor[key] = column;
        }

        for (const auto& row : dataset.rows) {
            RowFailure failure{dataset.id, row.entity, row.year, {}};

            // Only scored rows claim their (entity, year); a failed row leaves it open.
            if (scored.count({row.entity, row.year})) {
                failure.issues.push_back({"", RowFailureCause::DuplicateObservation,
                                          "(" + row.entity + ", " + std::to_string(row.year) + ") already scored"});
            }

            std::map<std::string, double> rawValues;
            for (const auto& key : m_model.indicatorKeys) {
                const auto& column = columnFor[key];
                if (!column) {
                    failure.issues.push_back({key, RowFailureCause::MissingMapping, mappingProblem[key]});
                    continue;
                }
                auto value = ParseNumericCell(row.cell(*column).value_or(""));
                if (!value) {
                    failure.issues.push_back({key, RowFailureCause::MissingValue,
                                              "column '" + *column + "' is empty or not numeric"});
                    continue;
                }
                rawValues[key] = *value;
            }

            if (!failure.issues.empty()) {
                std::set<RowFailureCause> causes;
                for (const auto& issue : failure.issues) causes.insert(issue.cause);
                for (auto cause : causes) out.summary.byCause[RowFailureCauseToString(cause)]++;
                out.summary.failedRows++;
                out.failures.push_back(std::move(failure));
                continue;
            }

            scored.insert({row.entity, row.year});
            out.rows.push_back(scoreObservation(dataset.id, row.entity, row.year, rawValues));
        }
    }
    return out;
}

} // namespace indexforge::application::engine
