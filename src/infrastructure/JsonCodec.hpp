/**
 * @file JsonCodec.hpp
 * @brief Manual JSON mapping of the domain types (store documents and API bodies).
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/ColumnMapping.hpp"
#include "domain/Dataset.hpp"
#include "domain/Indicator.hpp"
#include "domain/ResultSet.hpp"
#include "domain/WeightModel.hpp"

namespace indexforge::infrastructure {

/**
 * @class JsonCodec
 * @brief Static converters between domain structs and nlohmann::json.
 *
 * Decoders throw nlohmann::json::exception on missing or mistyped fields and
 * domain::ValidationError on unknown enum names.
 */
class JsonCodec {
public:
    static nlohmann::json toJson(const domain::Indicator& indicator);
    static domain::Indicator indicatorFromJson(const nlohmann::json& j);

    /** @brief Dataset metadata only (rows live in the dataset's CSV file). */
    static nlohmann::json datasetMetaToJson(const domain::Dataset& dataset);
    static domain::Dataset datasetMetaFromJson(const nlohmann::json& j);

    static nlohmann::json toJson(const domain::ColumnMapping& mapping);
    static domain::ColumnMapping mappingFromJson(const nlohmann::json& j);

    static nlohmann::json toJson(const domain::MappingTemplate& tmpl);
    static domain::MappingTemplate templateFromJson(const nlohmann::json& j);

    static nlohmann::json toJson(const domain::WeightModel& model);
    static domain::WeightModel weightModelFromJson(const nlohmann::json& j);

    static nlohmann::json toJson(const domain::ResultRow& row);
    static domain::ResultRow resultRowFromJson(const nlohmann::json& j);

    /** @brief Full result set including rows and failures. */
    static nlohmann::json toJson(const domain::ResultSet& result);
    static domain::ResultSet resultSetFromJson(const nlohmann::json& j);

    /** @brief Result set header without rows (listing / db.json). */
    static nlohmann::json resultSummaryToJson(const domain::ResultSet& result);
};

} // namespace indexforge::infrastructure
