/**
 * @file DatasetService.cpp
 * @brief Implementation of DatasetService.
 */

#include "application/DatasetService.hpp"

#include <iostream>
#include <utility>

#include "application/Identifiers.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CsvCodec.hpp"

namespace indexforge::application {

using namespace indexforge::domain;
using infrastructure::CsvCodec;
using infrastructure::CsvTable;

DatasetService::DatasetService(std::shared_ptr<DatasetRepository> datasets)
    : m_datasets(std::move(datasets)) {}

Dataset DatasetService::importText(const std::string& name,
                                   const std::string& csvText,
                                   std::optional<int> yearOverride,
                                   const std::string& sourceType) {
    Dataset dataset = CsvCodec::normalize(CsvCodec::parse(csvText), yearOverride);
    dataset.id = GenerateId();
    dataset.name = name.empty() ? "Pasted Dataset" : name;
    dataset.createdAt = NowIso();
    dataset.sourceType = sourceType;
    m_datasets->save(dataset);

    std::cout << "[DatasetService] Imported " << dataset.name << " (" << dataset.rows.size() << " rows, "
              << dataset.columns.size() << " columns) as " << dataset.id << std::endl;
    return dataset;
}

Dataset DatasetService::replaceRows(const std::string& datasetId,
                                    const std::vector<std::string>& columns,
                                    const std::vector<std::map<std::string, std::string>>& records) {
    Dataset existing = getDataset(datasetId);
    // Round-trip through the CSV text so edited rows obey the import rules.
    Dataset updated = CsvCodec::normalize(CsvCodec::parse(CsvCodec::write(columns, records)), std::nullopt);
    updated.id = existing.id;
    updated.name = existing.name;
    updated.createdAt = existing.createdAt;
    updated.sourceType = existing.sourceType;
    updated.isSample = existing.isSample;
    m_datasets->save(updated);
    return updated;
}

Dataset DatasetService::rename(const std::string& datasetId, const std::string& name) {
    if (name.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ValidationError("Dataset name must not be empty");
    }
    Dataset dataset = getDataset(datasetId);
    dataset.name = name;
    m_datasets->save(dataset);
    return dataset;
}

std::vector<Dataset> DatasetService::listDatasets() const {
    return m_datasets->findAll();
}

Dataset DatasetService::getDataset(const std::string& datasetId) const {
    auto dataset = m_datasets->findById(datasetId);
    if (!dataset) {
        throw NotFoundError("Dataset", datasetId);
    }
    return *dataset;
}

} // namespace indexforge::application
