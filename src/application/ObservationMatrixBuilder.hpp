/**
 * @file ObservationMatrixBuilder.hpp
 * @brief Resolves datasets through their column mappings into a training matrix.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/engine/EngineTypes.hpp"
#include "domain/repositories/DatasetRepository.hpp"
#include "domain/repositories/MappingRepository.hpp"

namespace indexforge::application {

/**
 * @class ObservationMatrixBuilder
 * @brief Strict resolution used for training: any gap fails the whole build.
 */
class ObservationMatrixBuilder {
public:
    ObservationMatrixBuilder(std::shared_ptr<const domain::DatasetRepository> datasets,
                             std::shared_ptr<const domain::MappingRepository> mappings);

    /**
     * @throws domain::ValidationError on an empty dataset list or a repeated (entity, year).
     * @throws domain::NotFoundError for an unknown dataset id.
     * @throws domain::MissingMappingError for an unmapped indicator or absent column.
     * @throws domain::MissingValueError for an empty or non-numeric cell.
     */
    engine::ObservationMatrix build(const std::vector<std::string>& datasetIds,
                                    const std::vector<std::string>& indicatorKeys) const;

private:
    std::shared_ptr<const domain::DatasetRepository> m_datasets;
    std::shared_ptr<const domain::MappingRepository> m_mappings;
};

} // namespace indexforge::application
