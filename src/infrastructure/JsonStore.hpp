/**
 * @file JsonStore.hpp
 * @brief File-backed store: db.json plus per-dataset CSV and per-result documents.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/ColumnMapping.hpp"
#include "domain/Dataset.hpp"
#include "domain/Indicator.hpp"
#include "domain/ResultSet.hpp"
#include "domain/WeightModel.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace indexforge::infrastructure {

/**
 * @class JsonStore
 * @brief In-memory copy of every record, written through PersistenceService.
 *
 * Layout under the data directory:
 *  - db.json                    metadata of all records
 *  - datasets/<id>/data.csv     dataset rows
 *  - results/<id>/result.json   full result set
 *  - results/<id>/result.csv    CSV export
 *
 * All accessors return copies taken under the store mutex.
 */
class JsonStore {
public:
    JsonStore(std::string dataDir, std::shared_ptr<PersistenceService> persistence);

    /**
     * @brief Reads db.json and the per-record files. A missing db.json yields an
     *        empty store; unreadable records are reported and skipped.
     */
    void load();

    const std::string& dataDir() const { return m_dataDir; }
    std::string resultCsvPath(const std::string& resultId) const;

    // --- Datasets ---
    void saveDataset(const domain::Dataset& dataset);
    std::optional<domain::Dataset> findDataset(const std::string& id) const;
    std::vector<domain::Dataset> listDatasets() const;

    // --- Indicators ---
    std::vector<domain::Indicator> listIndicators() const;
    std::optional<domain::Indicator> findIndicator(const std::string& key) const;
    void upsertIndicator(const domain::Indicator& indicator);
    void removeIndicator(const std::string& key);

    // --- Mappings ---
    domain::ColumnMapping getMapping(const std::string& datasetId) const;
    void putMapping(const domain::ColumnMapping& mapping);

    // --- Mapping templates ---
    std::vector<domain::MappingTemplate> listTemplates() const;
    std::optional<domain::MappingTemplate> findTemplate(const std::string& name) const;
    domain::MappingTemplate upsertTemplate(const std::string& name, const std::map<std::string, std::string>& map);
    void removeTemplate(const std::string& name);

    // --- Weight models ---
    void saveModel(const domain::WeightModel& model);
    std::optional<domain::WeightModel> findModel(const std::string& id) const;
    std::vector<domain::WeightModel> listModels() const;

    // --- Results ---
    void saveResult(const domain::ResultSet& result);
    std::optional<domain::ResultSet> findResult(const std::string& id) const;
    std::vector<domain::ResultSet> listResults() const;

private:
    std::string dbPath() const;
    std::string datasetCsvPath(const std::string& datasetId) const;
    std::string resultJsonPath(const std::string& resultId) const;

    /** @brief Queues a db.json snapshot. Caller holds m_mutex. */
    void persistDbLocked();

    std::string m_dataDir;
    std::shared_ptr<PersistenceService> m_persistence;

    mutable std::mutex m_mutex;
    // Insertion-ordered records; listings reverse them (newest first).
    std::vector<domain::Dataset> m_datasets;
    std::map<std::string, domain::Indicator> m_indicators;
    std::map<std::string, domain::ColumnMapping> m_mappings;
    std::vector<domain::MappingTemplate> m_templates;
    std::vector<domain::WeightModel> m_models;
    std::vector<domain::ResultSet> m_results;
};

} // namespace indexforge::infrastructure
