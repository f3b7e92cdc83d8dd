/**
 * @file IndexComputationService.hpp
 * @brief Application Service for computeIndex: applies a frozen model to datasets.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/ResultSet.hpp"
#include "domain/repositories/DatasetRepository.hpp"
#include "domain/repositories/MappingRepository.hpp"
#include "domain/repositories/ResultSetRepository.hpp"
#include "domain/repositories/WeightModelRepository.hpp"

namespace indexforge::application {

class IndexComputationService {
public:
    IndexComputationService(std::shared_ptr<const domain::WeightModelRepository> models,
                            std::shared_ptr<const domain::DatasetRepository> datasets,
                            std::shared_ptr<const domain::MappingRepository> mappings,
                            std::shared_ptr<domain::ResultSetRepository> results);

    /**
     * @brief Scores every (entity, year) of the given datasets with the stored model.
     *
     * Rows that cannot be scored are recorded as failures in the returned ResultSet;
     * only an unknown model or dataset, or an empty dataset list, aborts the call.
     * @param name Optional display name; a timestamped default is used when absent.
     */
    domain::ResultSet computeIndex(const std::string& weightModelId,
                                   const std::vector<std::string>& datasetIds,
                                   const std::optional<std::string>& name = std::nullopt);

    std::vector<domain::ResultSet> listResults() const;
    std::optional<domain::ResultSet> getResult(const std::string& id) const;

private:
    std::shared_ptr<const domain::WeightModelRepository> m_models;
    std::shared_ptr<const domain::DatasetRepository> m_datasets;
    std::shared_ptr<const domain::MappingRepository> m_mappings;
    std::shared_ptr<domain::ResultSetRepository> m_results;
};

} // namespace indexforge::application
