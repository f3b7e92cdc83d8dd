/**
 * @file ColumnMapping.hpp
 * @brief Per-dataset mapping from indicator key to source column, and reusable templates.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace indexforge::domain {

/**
 * @struct ColumnMapping
 * @brief indicatorKey -> columnName for one dataset.
 */
struct ColumnMapping {
    std::string datasetId;
    std::map<std::string, std::string> map;

    std::optional<std::string> columnFor(const std::string& indicatorKey) const {
        auto it = map.find(indicatorKey);
        if (it == map.end() || it->second.empty()) return std::nullopt;
        return it->second;
    }
};

/**
 * @struct MappingTemplate
 * @brief A named mapping that can be applied to datasets sharing the same layout.
 */
struct MappingTemplate {
    std::string name;
    std::string createdAt;
    std::map<std::string, std::string> map;
};

} // namespace indexforge::domain
