/**
 * @file DatasetService.hpp
 * @brief Application Service for importing and editing observation datasets.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/repositories/DatasetRepository.hpp"

namespace indexforge::application {

class DatasetService {
public:
    explicit DatasetService(std::shared_ptr<domain::DatasetRepository> datasets);

    /**
     * @brief Imports CSV text as a new dataset.
     * @param name Display name; "Pasted Dataset" when empty.
     * @param yearOverride Year used when the CSV has no year column or an empty year cell.
     * @param sourceType "paste" or "file".
     * @throws domain::ValidationError when the CSV is malformed.
     */
    domain::Dataset importText(const std::string& name,
                               const std::string& csvText,
                               std::optional<int> yearOverride = std::nullopt,
                               const std::string& sourceType = "paste");

    /** @brief Replaces all rows, applying the same normalization as an import. */
    domain::Dataset replaceRows(const std::string& datasetId,
                                const std::vector<std::string>& columns,
                                const std::vector<std::map<std::string, std::string>>& records);

    domain::Dataset rename(const std::string& datasetId, const std::string& name);

    std::vector<domain::Dataset> listDatasets() const;
    domain::Dataset getDataset(const std::string& datasetId) const;

private:
    std::shared_ptr<domain::DatasetRepository> m_datasets;
};

} // namespace indexforge::application
