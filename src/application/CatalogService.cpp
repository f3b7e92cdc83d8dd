/**
 * @file CatalogService.cpp
 * @brief Implementation of CatalogService.
 */

#include "application/CatalogService.hpp"

#include <iostream>
#include <utility>

#include "domain/Errors.hpp"

namespace indexforge::application {

using namespace indexforge::domain;

namespace {

std::string Trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

CatalogService::CatalogService(std::shared_ptr<IndicatorCatalog> indicators,
                               std::shared_ptr<MappingRepository> mappings,
                               std::shared_ptr<MappingTemplateRepository> templates,
                               std::shared_ptr<const DatasetRepository> datasets)
    : m_indicators(std::move(indicators)),
      m_mappings(std::move(mappings)),
      m_templates(std::move(templates)),
      m_datasets(std::move(datasets)) {}

std::vector<Indicator> CatalogService::listIndicators() const {
    return m_indicators->findAll();
}

Indicator CatalogService::upsertIndicator(const Indicator& indicator) {
    Indicator cleaned = indicator;
    cleaned.key = Trim(indicator.key);
    cleaned.name = Trim(indicator.name);
    cleaned.dimension2Key = Trim(indicator.dimension2Key);
    if (cleaned.key.empty()) {
        throw ValidationError("Indicator key must not be empty");
    }
    if (cleaned.name.empty()) {
        throw ValidationError("Indicator '" + cleaned.key + "' needs a name");
    }
    if (cleaned.unit && Trim(*cleaned.unit).empty()) {
        cleaned.unit.reset();
    }
    m_indicators->upsert(cleaned);
    return cleaned;
}

void CatalogService::deleteIndicator(const std::string& key) {
    if (!m_indicators->findByKey(key)) {
        throw NotFoundError("Indicator", key);
    }
    m_indicators->remove(key);

    for (const auto& dataset : m_datasets->findAll()) {
        auto mapping = m_mappings->getMapping(dataset.id);
        if (mapping.map.erase(key) > 0) {
            m_mappings->putMapping(mapping);
        }
    }
    std::cout << "[CatalogService] Deleted indicator " << key << std::endl;
}

Dataset CatalogService::requireDataset(const std::string& datasetId) const {
    auto dataset = m_datasets->findById(datasetId);
    if (!dataset) {
        throw NotFoundError("Dataset", datasetId);
    }
    return *dataset;
}

ColumnMapping CatalogService::getMapping(const std::string& datasetId) const {
    requireDataset(datasetId);
    return m_mappings->getMapping(datasetId);
}

ColumnMapping CatalogService::putMapping(const std::string& datasetId, const std::map<std::string, std::string>& map) {
    const Dataset dataset = requireDataset(datasetId);

    ColumnMapping mapping;
    mapping.datasetId = datasetId;
    for (const auto& [key, column] : map) {
        if (column.empty()) continue;
        if (!m_indicators->findByKey(key)) {
            throw ValidationError("Unknown indicator in mapping: " + key);
        }
        if (!dataset.hasColumn(column)) {
            throw ValidationError("Dataset " + dataset.name + " has no column '" + column + "' (mapped from " + key + ")");
        }
        mapping.map[key] = column;
    }
    m_mappings->putMapping(mapping);
    return mapping;
}

std::vector<MappingTemplate> CatalogService::listTemplates() const {
    return m_templates->findAll();
}

MappingTemplate CatalogService::upsertTemplate(const std::string& name, const std::map<std::string, std::string>& map) {
    const std::string cleanName = Trim(name);
    if (cleanName.empty()) {
        throw ValidationError("Template name must not be empty");
    }
    std::map<std::string, std::string> cleaned;
    for (const auto& [key, column] : map) {
        if (!key.empty() && !column.empty()) cleaned[key] = column;
    }
    return m_templates->upsert(cleanName, cleaned);
}

void CatalogService::deleteTemplate(const std::string& name) {
    if (!m_templates->findByName(name)) {
        throw NotFoundError("Mapping template", name);
    }
    m_templates->remove(name);
}

ColumnMapping CatalogService::applyTemplate(const std::string& templateName, const std::string& datasetId) {
    auto tmpl = m_templates->findByName(templateName);
    if (!tmpl) {
        throw NotFoundError("Mapping template", templateName);
    }
    const Dataset dataset = requireDataset(datasetId);

    ColumnMapping mapping = m_mappings->getMapping(datasetId);
    mapping.datasetId = datasetId;
    size_t applied = 0;
    for (const auto& [key, column] : tmpl->map) {
        if (!dataset.hasColumn(column) || !m_indicators->findByKey(key)) continue;
        mapping.map[key] = column;
        ++applied;
    }
    m_mappings->putMapping(mapping);
    std::cout << "[CatalogService] Applied template '" << templateName << "' to " << dataset.name
              << " (" << applied << "/" << tmpl->map.size() << " entries)" << std::endl;
    return mapping;
}

} // namespace indexforge::application
