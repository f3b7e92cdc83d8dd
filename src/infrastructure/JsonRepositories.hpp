/**
 * @file JsonRepositories.hpp
 * @brief Repository interface implementations delegating to a shared JsonStore.
 */

#pragma once

#include <memory>
#include <utility>

#include "domain/repositories/DatasetRepository.hpp"
#include "domain/repositories/IndicatorCatalog.hpp"
#include "domain/repositories/MappingRepository.hpp"
#include "domain/repositories/ResultSetRepository.hpp"
#include "domain/repositories/WeightModelRepository.hpp"
#include "infrastructure/JsonStore.hpp"

namespace indexforge::infrastructure {

class JsonDatasetRepository : public domain::DatasetRepository {
public:
    explicit JsonDatasetRepository(std::shared_ptr<JsonStore> store) : m_store(std::move(store)) {}

    void save(const domain::Dataset& dataset) override { m_store->saveDataset(dataset); }
    std::optional<domain::Dataset> findById(const std::string& id) const override { return m_store->findDataset(id); }
    std::vector<domain::Dataset> findAll() const override { return m_store->listDatasets(); }

private:
    std::shared_ptr<JsonStore> m_store;
};

class JsonIndicatorCatalog : public domain::IndicatorCatalog {
public:
    explicit JsonIndicatorCatalog(std::shared_ptr<JsonStore> store) : m_store(std::move(store)) {}

    std::vector<domain::Indicator> findAll() const override { return m_store->listIndicators(); }
    std::optional<domain::Indicator> findByKey(const std::string& key) const override { return m_store->findIndicator(key); }
    void upsert(const domain::Indicator& indicator) override { m_store->upsertIndicator(indicator); }
    void remove(const std::string& key) override { m_store->removeIndicator(key); }

private:
    std::shared_ptr<JsonStore> m_store;
};

class JsonMappingRepository : public domain::MappingRepository {
public:
    explicit JsonMappingRepository(std::shared_ptr<JsonStore> store) : m_store(std::move(store)) {}

    domain::ColumnMapping getMapping(const std::string& datasetId) const override { return m_store->getMapping(datasetId); }
    void putMapping(const domain::ColumnMapping& mapping) override { m_store->putMapping(mapping); }

private:
    std::shared_ptr<JsonStore> m_store;
};

class JsonMappingTemplateRepository : public domain::MappingTemplateRepository {
public:
    explicit JsonMappingTemplateRepository(std::shared_ptr<JsonStore> store) : m_store(std::move(store)) {}

    std::vector<domain::MappingTemplate> findAll() const override { return m_store->listTemplates(); }
    std::optional<domain::MappingTemplate> findByName(const std::string& name) const override {
        return m_store->findTemplate(name);
    }
    domain::MappingTemplate upsert(const std::string& name, const std::map<std::string, std::string>& map) override {
        return m_store->upsertTemplate(name, map);
    }
    void remove(const std::string& name) override { m_store->removeTemplate(name); }

private:
    std::shared_ptr<JsonStore> m_store;
};

class JsonWeightModelRepository : public domain::WeightModelRepository {
public:
    explicit JsonWeightModelRepository(std::shared_ptr<JsonStore> store) : m_store(std::move(store)) {}

    void save(const domain::WeightModel& model) override { m_store->saveModel(model); }
    std::optional<domain::WeightModel> findById(const std::string& id) const override { return m_store->findModel(id); }
    std::vector<domain::WeightModel> findAll() const override { return m_store->listModels(); }

private:
    std::shared_ptr<JsonStore> m_store;
};

class JsonResultSetRepository : public domain::ResultSetRepository {
public:
    explicit JsonResultSetRepository(std::shared_ptr<JsonStore> store) : m_store(std::move(store)) {}

    void save(const domain::ResultSet& result) override { m_store->saveResult(result); }
    std::optional<domain::ResultSet> findById(const std::string& id) const override { return m_store->findResult(id); }
    std::vector<domain::ResultSet> findAll() const override { return m_store->listResults(); }

private:
    std::shared_ptr<JsonStore> m_store;
};

} // namespace indexforge::infrastructure
