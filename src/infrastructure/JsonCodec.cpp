/**
 * @file JsonCodec.cpp
 * @brief Implementation of JsonCodec.
 */

#include "infrastructure/JsonCodec.hpp"

#include <type_traits>
#include <variant>

#include "domain/Errors.hpp"

namespace indexforge::infrastructure {

using json = nlohmann::json;
using namespace indexforge::domain;

namespace {

Direction ParseDirection(const std::string& s) {
    auto d = DirectionFromString(s);
    if (!d) throw ValidationError("Unknown direction: " + s);
    return *d;
}

StandardizationMethod ParseStandardization(const std::string& s) {
    auto m = StandardizationMethodFromString(s);
    if (!m) throw ValidationError("Unknown standardization method: " + s);
    return *m;
}

} // namespace

// --- Indicator --------------------------------------------------------------

json JsonCodec::toJson(const Indicator& indicator) {
    json j = {
        {"key", indicator.key},
        {"name", indicator.name},
        {"dimension2Key", indicator.dimension2Key},
        {"direction", DirectionToString(indicator.direction)}
    };
    j["unit"] = indicator.unit ? json(*indicator.unit) : json(nullptr);
    return j;
}

Indicator JsonCodec::indicatorFromJson(const json& j) {
    Indicator indicator;
    indicator.key = j.at("key").get<std::string>();
    indicator.name = j.value("name", indicator.key);
    indicator.dimension2Key = j.value("dimension2Key", "");
    indicator.direction = ParseDirection(j.value("direction", "positive"));
    if (j.contains("unit") && j["unit"].is_string()) {
        indicator.unit = j["unit"].get<std::string>();
    }
    return indicator;
}

// --- Dataset ----------------------------------------------------------------

json JsonCodec::datasetMetaToJson(const Dataset& dataset) {
    return {
        {"id", dataset.id},
        {"name", dataset.name},
        {"createdAt", dataset.createdAt},
        {"sourceType", dataset.sourceType},
        {"isSample", dataset.isSample},
        {"rowCount", dataset.rows.size()},
        {"columns", dataset.columns},
        {"columnTypes", dataset.columnTypes}
    };
}

Dataset JsonCodec::datasetMetaFromJson(const json& j) {
    Dataset dataset;
    dataset.id = j.at("id").get<std::string>();
    dataset.name = j.value("name", "");
    dataset.createdAt = j.value("createdAt", "");
    dataset.sourceType = j.value("sourceType", "paste");
    dataset.isSample = j.value("isSample", false);
    dataset.columns = j.value("columns", std::vector<std::string>{});
    dataset.columnTypes = j.value("columnTypes", std::map<std::string, std::string>{});
    return dataset;
}

// --- Mappings ---------------------------------------------------------------

json JsonCodec::toJson(const ColumnMapping& mapping) {
    return {{"datasetId", mapping.datasetId}, {"map", mapping.map}};
}

ColumnMapping JsonCodec::mappingFromJson(const json& j) {
    ColumnMapping mapping;
    mapping.datasetId = j.value("datasetId", "");
    mapping.map = j.value("map", std::map<std::string, std::string>{});
    return mapping;
}

json JsonCodec::toJson(const MappingTemplate& tmpl) {
    return {{"name", tmpl.name}, {"createdAt", tmpl.createdAt}, {"map", tmpl.map}};
}

MappingTemplate JsonCodec::templateFromJson(const json& j) {
    MappingTemplate tmpl;
    tmpl.name = j.at("name").get<std::string>();
    tmpl.createdAt = j.value("createdAt", "");
    tmpl.map = j.value("map", std::map<std::string, std::string>{});
    return tmpl;
}

// --- WeightModel ------------------------------------------------------------

json JsonCodec::toJson(const WeightModel& model) {
    json directions = json::object();
    for (const auto& [key, dir] : model.directions) directions[key] = DirectionToString(dir);

    json params = json::object();
    for (const auto& [key, p] : model.standardizationParams) {
        std::visit([&](auto&& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, MinMaxParams>) {
                params[key] = {{"min", v.min}, {"max", v.max}};
            } else if constexpr (std::is_same_v<T, ZScoreParams>) {
                params[key] = {{"mean", v.mean}, {"std", v.stddev}};
            }
        }, p);
    }

    json provenance;
    std::visit([&](auto&& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, EntropyProvenance>) {
            provenance = {{"entropy", p.entropy}, {"divergence", p.divergence}};
        } else if constexpr (std::is_same_v<T, PcaProvenance>) {
            provenance = {
                {"eigenvalues", p.eigenvalues},
                {"explainedVarianceRatio", p.explainedVarianceRatio},
                {"cumulativeVariance", p.cumulativeVariance},
                {"loadings", p.loadings},
                {"componentsRetained", p.componentsRetained},
                {"threshold", p.threshold}
            };
        } else if constexpr (std::is_same_v<T, AhpProvenance>) {
            provenance = {
                {"order", p.order},
                {"matrix", p.matrix},
                {"priorityVector", p.priorityVector},
                {"lambdaMax", p.lambdaMax},
                {"consistencyIndex", p.consistencyIndex},
                {"randomIndex", p.randomIndex},
                {"consistencyRatio", p.consistencyRatio},
                {"acceptable", p.acceptable}
            };
        }
    }, model.provenance);

    return {
        {"id", model.id},
        {"name", model.name},
        {"createdAt", model.createdAt},
        {"method", WeightMethodToString(model.method)},
        {"indicatorKeys", model.indicatorKeys},
        {"weights", model.weights},
        {"dimension2Weights", model.dimension2Weights},
        {"dimensions", model.dimensions},
        {"directions", directions},
        {"standardization", {
            {"kind", StandardizationMethodToString(model.standardizationMethod)},
            {"params", params}
        }},
        {"scaling", {
            {"scoreMin", model.scaling.scoreMin},
            {"scoreMax", model.scaling.scoreMax},
            {"subScoreMin", model.scaling.subScoreMin},
            {"subScoreMax", model.scaling.subScoreMax}
        }},
        {"trainedOnDatasetIds", model.trainedOnDatasetIds},
        {"provenance", provenance}
    };
}

WeightModel JsonCodec::weightModelFromJson(const json& j) {
    WeightModel model;
    model.id = j.at("id").get<std::string>();
    model.name = j.value("name", "");
    model.createdAt = j.value("createdAt", "");
    const std::string method = j.at("method").get<std::string>();
    auto parsedMethod = WeightMethodFromString(method);
    if (!parsedMethod) throw ValidationError("Unknown weight method: " + method);
    model.method = *parsedMethod;
    model.indicatorKeys = j.at("indicatorKeys").get<std::vector<std::string>>();
    model.weights = j.at("weights").get<std::map<std::string, double>>();
    model.dimension2Weights = j.at("dimension2Weights").get<std::map<std::string, double>>();
    model.dimensions = j.value("dimensions", std::map<std::string, std::string>{});
    const json directions = j.value("directions", json::object());
    for (const auto& [key, dir] : directions.items()) {
        model.directions[key] = ParseDirection(dir.get<std::string>());
    }

    const auto& standardization = j.at("standardization");
    model.standardizationMethod = ParseStandardization(standardization.at("kind").get<std::string>());
    for (const auto& [key, p] : standardization.at("params").items()) {
        if (model.standardizationMethod == StandardizationMethod::MinMax) {
            model.standardizationParams[key] = MinMaxParams{p.at("min").get<double>(), p.at("max").get<double>()};
        } else {
            model.standardizationParams[key] = ZScoreParams{p.at("mean").get<double>(), p.at("std").get<double>()};
        }
    }

    const auto& scaling = j.at("scaling");
    model.scaling.scoreMin = scaling.at("scoreMin").get<double>();
    model.scaling.scoreMax = scaling.at("scoreMax").get<double>();
    model.scaling.subScoreMin = scaling.value("subScoreMin", std::map<std::string, double>{});
    model.scaling.subScoreMax = scaling.value("subScoreMax", std::map<std::string, double>{});
    model.trainedOnDatasetIds = j.value("trainedOnDatasetIds", std::vector<std::string>{});

    const json provenance = j.value("provenance", json::object());
    switch (model.method) {
        case WeightMethod::Entropy: {
            EntropyProvenance p;
            p.entropy = provenance.value("entropy", std::vector<double>{});
            p.divergence = provenance.value("divergence", std::vector<double>{});
            model.provenance = p;
            break;
        }
        case WeightMethod::Pca: {
            PcaProvenance p;
            p.eigenvalues = provenance.value("eigenvalues", std::vector<double>{});
            p.explainedVarianceRatio = provenance.value("explainedVarianceRatio", std::vector<double>{});
            p.cumulativeVariance = provenance.value("cumulativeVariance", std::vector<double>{});
            p.loadings = provenance.value("loadings", std::vector<std::vector<double>>{});
            p.componentsRetained = provenance.value("componentsRetained", 0);
            p.threshold = provenance.value("threshold", 0.85);
            model.provenance = p;
            break;
        }
        case WeightMethod::Ahp: {
            AhpProvenance p;
            p.order = provenance.value("order", model.indicatorKeys);
            p.matrix = provenance.value("matrix", std::vector<std::vector<double>>{});
            p.priorityVector = provenance.value("priorityVector", std::vector<double>{});
            p.lambdaMax = provenance.value("lambdaMax", 0.0);
            p.consistencyIndex = provenance.value("consistencyIndex", 0.0);
            p.randomIndex = provenance.value("randomIndex", 0.0);
            p.consistencyRatio = provenance.value("consistencyRatio", 0.0);
            p.acceptable = provenance.value("acceptable", true);
            model.provenance = p;
            break;
        }
    }
    return model;
}

// --- ResultSet --------------------------------------------------------------

json JsonCodec::toJson(const ResultRow& row) {
    return {
        {"entity", row.entity},
        {"year", row.year},
        {"datasetId", row.datasetId},
        {"score_raw", row.scoreRaw},
        {"index_0_100", row.index0To100},
        {"sub_score_raw", row.subScoreRaw},
        {"subindex", row.subindex},
        {"raw", row.rawValues}
    };
}

ResultRow JsonCodec::resultRowFromJson(const json& j) {
    ResultRow row;
    row.entity = j.at("entity").get<std::string>();
    row.year = j.at("year").get<int>();
    row.datasetId = j.value("datasetId", "");
    row.scoreRaw = j.at("score_raw").get<double>();
    row.index0To100 = j.at("index_0_100").get<double>();
    row.subScoreRaw = j.value("sub_score_raw", std::map<std::string, double>{});
    row.subindex = j.value("subindex", std::map<std::string, double>{});
    row.rawValues = j.value("raw", std::map<std::string, double>{});
    return row;
}

json JsonCodec::resultSummaryToJson(const ResultSet& result) {
    return {
        {"id", result.id},
        {"name", result.name},
        {"createdAt", result.createdAt},
        {"datasetIds", result.datasetIds},
        {"weightModelId", result.weightModelId},
        {"dimensionKeys", result.dimensionKeys},
        {"indicatorKeys", result.indicatorKeys},
        {"rowCount", result.rows.size()},
        {"failureSummary", {
            {"failedRows", result.failureSummary.failedRows},
            {"byCause", result.failureSummary.byCause}
        }}
    };
}

json JsonCodec::toJson(const ResultSet& result) {
    json j = resultSummaryToJson(result);

    json rows = json::array();
    for (const auto& row : result.rows) rows.push_back(toJson(row));
    j["rows"] = rows;

    json failures = json::array();
    for (const auto& f : result.failures) {
        json issues = json::array();
        for (const auto& issue : f.issues) {
            issues.push_back({
                {"indicatorKey", issue.indicatorKey},
                {"cause", RowFailureCauseToString(issue.cause)},
                {"detail", issue.detail}
            });
        }
        failures.push_back({{"datasetId", f.datasetId}, {"entity", f.entity}, {"year", f.year}, {"issues", issues}});
    }
    j["failures"] = failures;
    return j;
}

ResultSet JsonCodec::resultSetFromJson(const json& j) {
    ResultSet result;
    result.id = j.at("id").get<std::string>();
    result.name = j.value("name", "");
    result.createdAt = j.value("createdAt", "");
    result.datasetIds = j.value("datasetIds", std::vector<std::string>{});
    result.weightModelId = j.value("weightModelId", "");
    result.dimensionKeys = j.value("dimensionKeys", std::vector<std::string>{});
    result.indicatorKeys = j.value("indicatorKeys", std::vector<std::string>{});

    if (j.contains("failureSummary")) {
        const auto& s = j["failureSummary"];
        result.failureSummary.failedRows = s.value("failedRows", size_t{0});
        result.failureSummary.byCause = s.value("byCause", std::map<std::string, size_t>{});
    }
    const json rows = j.value("rows", json::array());
    for (const auto& r : rows) {
        result.rows.push_back(resultRowFromJson(r));
    }
    const json failures = j.value("failures", json::array());
    for (const auto& f : failures) {
        RowFailure failure;
        failure.datasetId = f.value("datasetId", "");
        failure.entity = f.value("entity", "");
        failure.year = f.value("year", 0);
        const json issues = f.value("issues", json::array());
        for (const auto& issue : issues) {
            const std::string cause = issue.value("cause", "");
            auto parsed = RowFailureCauseFromString(cause);
            if (!parsed) throw ValidationError("Unknown row failure cause: " + cause);
            failure.issues.push_back({issue.value("indicatorKey", ""), *parsed, issue.value("detail", "")});
        }
        result.failures.push_back(std::move(failure));
    }
    return result;
}

} // namespace indexforge::infrastructure
