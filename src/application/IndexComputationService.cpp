/**
 * @file IndexComputationService.cpp
 * @brief Implementation of IndexComputationService.
 */

#include "application/IndexComputationService.hpp"

#include <iostream>
#include <utility>

#include "application/Identifiers.hpp"
#include "application/engine/IndexAggregator.hpp"
#include "domain/Errors.hpp"

namespace indexforge::application {

using namespace indexforge::domain;

IndexComputationService::IndexComputationService(std::shared_ptr<const WeightModelRepository> models,
                                                 std::shared_ptr<const DatasetRepository> datasets,
                                                 std::shared_ptr<const MappingRepository> mappings,
                                                 std::shared_ptr<ResultSetRepository> results)
    : m_models(std::move(models)),
      m_datasets(std::move(datasets)),
      m_mappings(std::move(mappings)),
      m_results(std::move(results)) {}

ResultSet IndexComputationService::computeIndex(const std::string& weightModelId,
                                                const std::vector<std::string>& datasetIds,
                                                const std::optional<std::string>& name) {
    if (datasetIds.empty()) {
        throw ValidationError("At least one dataset is required");
    }
    auto model = m_models->findById(weightModelId);
    if (!model) {
        throw NotFoundError("Weight model", weightModelId);
    }

    // Snapshot every dataset first so an unknown id aborts before any scoring.
    std::vector<Dataset> datasets;
    datasets.reserve(datasetIds.size());
    for (const auto& id : datasetIds) {
        auto dataset = m_datasets->findById(id);
        if (!dataset) {
            throw NotFoundError("Dataset", id);
        }
        datasets.push_back(std::move(*dataset));
    }

    std::vector<engine::DatasetSource> sources;
    sources.reserve(datasets.size());
    for (const auto& dataset : datasets) {
        sources.push_back({&dataset, m_mappings->getMapping(dataset.id)});
    }

    engine::IndexAggregator aggregator(*model);
    auto output = aggregator.aggregate(sources);

    ResultSet result;
    result.id = GenerateId();
    result.createdAt = NowIso();
    result.name = name && !name->empty() ? *name : "Result / " + model->name + " / " + result.createdAt;
    result.datasetIds = datasetIds;
    result.weightModelId = model->id;
    result.indicatorKeys = model->indicatorKeys;
    result.dimensionKeys = std::move(output.dimensionKeys);
    result.rows = std::move(output.rows);
    result.failures = std::move(output.failures);
    result.failureSummary = std::move(output.summary);

    m_results->save(result);

    std::cout << "[IndexComputationService] Result " << result.id << ": " << result.rows.size()
              << " rows scored with model " << model->id << std::endl;
    if (result.failureSummary.failedRows > 0) {
        std::cerr << "[IndexComputationService] " << result.failureSummary.failedRows << " rows skipped (";
        bool first = true;
        for (const auto& [cause, count] : result.failureSummary.byCause) {
            std::cerr << (first ? "" : ", ") << cause << "=" << count;
            first = false;
        }
        std::cerr << ")" << std::endl;
    }
    return result;
}

std::vector<ResultSet> IndexComputationService::listResults() const {
    return m_results->findAll();
}

std::optional<ResultSet> IndexComputationService::getResult(const std::string& id) const {
    return m_results->findById(id);
}

} // namespace indexforge::application
