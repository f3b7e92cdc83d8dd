/**
 * @file ObservationMatrixBuilder.cpp
 * @brief Implementation of ObservationMatrixBuilder.
 */

#include "application/ObservationMatrixBuilder.hpp"

#include <set>
#include <utility>

#include "domain/Errors.hpp"

namespace indexforge::application {

using namespace indexforge::domain;

ObservationMatrixBuilder::ObservationMatrixBuilder(std::shared_ptr<const DatasetRepository> datasets,
                                                   std::shared_ptr<const MappingRepository> mappings)
    : m_datasets(std::move(datasets)), m_mappings(std::move(mappings)) {}

engine::ObservationMatrix ObservationMatrixBuilder::build(const std::vector<std::string>& datasetIds,
                                                          const std::vector<std::string>& indicatorKeys) const {
    if (datasetIds.empty()) {
        throw ValidationError("At least one dataset is required");
    }

    engine::ObservationMatrix matrix;
    matrix.indicatorKeys = indicatorKeys;
    std::vector<std::vector<double>> values;
    std::set<std::pair<std::string, int>> seen;

    for (const auto& datasetId : datasetIds) {
        auto dataset = m_datasets->findById(datasetId);
        if (!dataset) {
            throw NotFoundError("Dataset", datasetId);
        }
        const ColumnMapping mapping = m_mappings->getMapping(datasetId);

        std::vector<std::string> columns;
        for (const auto& key : indicatorKeys) {
            auto column = mapping.columnFor(key);
            if (!column) {
                throw MissingMappingError(dataset->name, key, "is not mapped to any column");
            }
            if (!dataset->hasColumn(*column)) {
                throw MissingMappingError(dataset->name, key, "is mapped to missing column '" + *column + "'");
            }
            columns.push_back(*column);
        }

        for (const auto& row : dataset->rows) {
            if (!seen.insert({row.entity, row.year}).second) {
                throw ValidationError("Duplicate observation (" + row.entity + ", " + std::to_string(row.year) +
                                      ") across training datasets");
            }
            std::vector<double> rowValues;
            rowValues.reserve(columns.size());
            for (const auto& column : columns) {
                auto value = ParseNumericCell(row.cell(column).value_or(""));
                if (!value) {
                    throw MissingValueError("Dataset " + dataset->name + ": missing or non-numeric value for " +
                                            row.entity + "-" + std::to_string(row.year) + " in column '" + column + "'");
                }
                rowValues.push_back(*value);
            }
            matrix.rows.push_back({dataset->id, row.entity, row.year});
            values.push_back(std::move(rowValues));
        }
    }

    matrix.values.resize(static_cast<Eigen::Index>(values.size()), static_cast<Eigen::Index>(indicatorKeys.size()));
    for (size_t i = 0; i < values.size(); ++i) {
        for (size_t j = 0; j < indicatorKeys.size(); ++j) {
            matrix.values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = values[i][j];
        }
    }
    return matrix;
}

} // namespace indexforge::application
