/**
 * @file CatalogService.hpp
 * @brief Application Service managing the indicator catalog, column mappings and mapping templates.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "domain/repositories/DatasetRepository.hpp"
#include "domain/repositories/IndicatorCatalog.hpp"
#include "domain/repositories/MappingRepository.hpp"

namespace indexforge::application {

class CatalogService {
public:
    CatalogService(std::shared_ptr<domain::IndicatorCatalog> indicators,
                   std::shared_ptr<domain::MappingRepository> mappings,
                   std::shared_ptr<domain::MappingTemplateRepository> templates,
                   std::shared_ptr<const domain::DatasetRepository> datasets);

    // --- Indicators ---
    std::vector<domain::Indicator> listIndicators() const;

    /**
     * @brief Creates or replaces an indicator. Existing models are unaffected:
     *        direction and grouping are frozen into each model at training time.
     * @throws ValidationError on an empty key or name.
     */
    domain::Indicator upsertIndicator(const domain::Indicator& indicator);

    /** @brief Removes the indicator and unmaps it from every dataset. */
    void deleteIndicator(const std::string& key);

    // --- Mappings ---
    domain::ColumnMapping getMapping(const std::string& datasetId) const;

    /**
     * @brief Replaces the mapping of a dataset. Entries with an empty column are
     *        dropped; unknown indicators or columns are a ValidationError.
     */
    domain::ColumnMapping putMapping(const std::string& datasetId, const std::map<std::string, std::string>& map);

    // --- Templates ---
    std::vector<domain::MappingTemplate> listTemplates() const;
    domain::MappingTemplate upsertTemplate(const std::string& name, const std::map<std::string, std::string>& map);
    void deleteTemplate(const std::string& name);

    /**
     * @brief Copies a template's entries onto a dataset mapping, keeping only the
     *        entries whose column exists in that dataset.
     */
    domain::ColumnMapping applyTemplate(const std::string& templateName, const std::string& datasetId);

private:
    domain::Dataset requireDataset(const std::string& datasetId) const;

    std::shared_ptr<domain::IndicatorCatalog> m_indicators;
    std::shared_ptr<domain::MappingRepository> m_mappings;
    std::shared_ptr<domain::MappingTemplateRepository> m_templates;
    std::shared_ptr<const domain::DatasetRepository> m_datasets;
};

} // namespace indexforge::application
