/**
 * @file MappingRepository.hpp
 * @brief Interfaces for per-dataset column mappings and named mapping templates.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/ColumnMapping.hpp"

namespace indexforge::domain {

class MappingRepository {
public:
    virtual ~MappingRepository() = default;

    /** @brief Mapping of a dataset; an empty map when none was stored. */
    virtual ColumnMapping getMapping(const std::string& datasetId) const = 0;

    virtual void putMapping(const ColumnMapping& mapping) = 0;
};

class MappingTemplateRepository {
public:
    virtual ~MappingTemplateRepository() = default;

    /** @brief All templates, newest first. */
    virtual std::vector<MappingTemplate> findAll() const = 0;

    virtual std::optional<MappingTemplate> findByName(const std::string& name) const = 0;

    /** @brief Creates or replaces a template, keeping the original createdAt on replace. */
    virtual MappingTemplate upsert(const std::string& name, const std::map<std::string, std::string>& map) = 0;

    virtual void remove(const std::string& name) = 0;
};

} // namespace indexforge::domain
