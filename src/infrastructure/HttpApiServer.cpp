/**
 * @file HttpApiServer.cpp
 * @brief Implementation of HttpApiServer.
 */

#include "infrastructure/HttpApiServer.hpp"

#include <httplib.h>

#include <algorithm>
#include <iostream>
#include <utility>

#include "domain/Errors.hpp"
#include "infrastructure/CsvCodec.hpp"
#include "infrastructure/JsonCodec.hpp"

namespace indexforge::infrastructure {

using json = nlohmann::json;
using namespace indexforge::domain;
using application::engine::PairwiseJudgment;
using application::engine::PairwiseMatrix;

namespace {

constexpr const char* kJsonType = "application/json";

void SendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), kJsonType);
}

void SendError(httplib::Response& res, int status, const std::string& kind, const std::string& detail) {
    SendJson(res, status, {{"error", kind}, {"detail", detail}});
}

json ParseBody(const httplib::Request& req) {
    if (req.body.empty()) return json::object();
    return json::parse(req.body);
}

std::vector<std::string> StringList(const json& body, const char* key) {
    if (!body.contains(key)) {
        throw ValidationError(std::string("Missing field: ") + key);
    }
    return body.at(key).get<std::vector<std::string>>();
}

std::optional<std::string> OptionalString(const json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) return std::nullopt;
    return body[key].get<std::string>();
}

json RowToJson(const DatasetRow& row, const std::vector<std::string>& columns) {
    json out = json::object();
    for (const auto& c : columns) {
        if (c == CsvCodec::kEntityColumn) {
            out[c] = row.entity;
        } else if (c == CsvCodec::kYearColumn) {
            out[c] = std::to_string(row.year);
        } else {
            out[c] = row.cell(c).value_or("");
        }
    }
    return out;
}

std::vector<PairwiseJudgment> JudgmentsFromJson(const json& body, const std::vector<std::string>& keys) {
    if (body.contains("matrix")) {
        return PairwiseMatrix::fromDense(keys, body.at("matrix").get<std::vector<std::vector<double>>>());
    }
    std::vector<PairwiseJudgment> judgments;
    const json list = body.value("judgments", json::array());
    for (const auto& j : list) {
        judgments.push_back({j.at("rowKey").get<std::string>(), j.at("colKey").get<std::string>(),
                             j.at("value").get<double>()});
    }
    return judgments;
}

} // namespace

HttpApiServer::HttpApiServer(application::AppServices& services, AppConfig config)
    : m_services(services), m_config(std::move(config)), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

HttpApiServer::~HttpApiServer() {
    stop();
}

bool HttpApiServer::listen() {
    std::cout << "[HttpApiServer] Listening on http://" << m_config.host << ":" << m_config.port << std::endl;
    if (!m_server->listen(m_config.host.c_str(), m_config.port)) {
        std::cerr << "[HttpApiServer] Failed to bind " << m_config.host << ":" << m_config.port << std::endl;
        return false;
    }
    return true;
}

int HttpApiServer::bindToAnyPort(const std::string& host) {
    return m_server->bind_to_any_port(host.c_str());
}

bool HttpApiServer::listenAfterBind() {
    return m_server->listen_after_bind();
}

void HttpApiServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

bool HttpApiServer::authorized(const httplib::Request& req) const {
    if (!m_config.token) return true;
    return req.get_header_value("Authorization") == "Bearer " + *m_config.token;
}

void HttpApiServer::guarded(const httplib::Request& req, httplib::Response& res, const std::function<void()>& action) {
    if (!authorized(req)) {
        SendError(res, 401, "Unauthorized", "Missing or invalid bearer token");
        return;
    }
    try {
        action();
    } catch (const NotFoundError& e) {
        SendError(res, 404, e.kind(), e.what());
    } catch (const ValidationError& e) {
        SendError(res, 400, e.kind(), e.what());
    } catch (const DataQualityError& e) {
        SendError(res, 400, e.kind(), e.what());
    } catch (const NumericalError& e) {
        SendError(res, 400, e.kind(), e.what());
    } catch (const json::exception& e) {
        SendError(res, 400, "ValidationError", std::string("Malformed request body: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "[HttpApiServer] " << req.method << " " << req.path << " failed: " << e.what() << std::endl;
        SendError(res, 500, "InternalError", e.what());
    }
}

void HttpApiServer::get(const std::string& pattern, JsonHandler handler) {
    m_server->Get(pattern, [this, handler](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] { SendJson(res, 200, handler(req)); });
    });
}

void HttpApiServer::post(const std::string& pattern, JsonHandler handler) {
    m_server->Post(pattern, [this, handler](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] { SendJson(res, 200, handler(req)); });
    });
}

void HttpApiServer::put(const std::string& pattern, JsonHandler handler) {
    m_server->Put(pattern, [this, handler](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] { SendJson(res, 200, handler(req)); });
    });
}

void HttpApiServer::del(const std::string& pattern, JsonHandler handler) {
    m_server->Delete(pattern, [this, handler](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] { SendJson(res, 200, handler(req)); });
    });
}

json HttpApiServer::datasetDetail(const std::string& datasetId) const {
    const Dataset dataset = m_services.datasetService->getDataset(datasetId);
    json out = JsonCodec::datasetMetaToJson(dataset);
    json preview = json::array();
    const size_t limit = std::min(m_config.previewRowLimit, dataset.rows.size());
    for (size_t i = 0; i < limit; ++i) {
        preview.push_back(RowToJson(dataset.rows[i], dataset.columns));
    }
    out["previewRows"] = preview;
    return out;
}

void HttpApiServer::registerRoutes() {
    auto& catalog = *m_services.catalogService;
    auto& datasets = *m_services.datasetService;
    auto& models = *m_services.weightModelService;
    auto& compute = *m_services.indexComputationService;

    m_server->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, {{"ok", true}});
    });

    get("/api/health", [this](const httplib::Request&) {
        return json{{"ok", true}, {"dataDir", m_config.dataDir}};
    });

    // --- Indicators ---
    get("/api/indicators", [&catalog](const httplib::Request&) {
        json out = json::array();
        for (const auto& ind : catalog.listIndicators()) out.push_back(JsonCodec::toJson(ind));
        return out;
    });
    post("/api/indicators", [&catalog](const httplib::Request& req) {
        return JsonCodec::toJson(catalog.upsertIndicator(JsonCodec::indicatorFromJson(ParseBody(req))));
    });
    del(R"(/api/indicators/([^/]+))", [&catalog](const httplib::Request& req) {
        catalog.deleteIndicator(req.matches[1]);
        return json{{"ok", true}};
    });

    // --- Datasets ---
    get("/api/datasets", [&datasets](const httplib::Request&) {
        json out = json::array();
        for (const auto& d : datasets.listDatasets()) out.push_back(JsonCodec::datasetMetaToJson(d));
        return out;
    });
    post("/api/datasets/import-text", [&datasets](const httplib::Request& req) {
        const json body = ParseBody(req);
        std::optional<int> yearOverride;
        if (body.contains("yearOverride") && !body["yearOverride"].is_null()) {
            yearOverride = body["yearOverride"].get<int>();
        }
        const auto dataset = datasets.importText(body.value("name", ""), body.at("csvText").get<std::string>(),
                                                 yearOverride, body.value("sourceType", "paste"));
        return json{{"datasetId", dataset.id}};
    });
    get(R"(/api/datasets/([^/]+)/data)", [&datasets](const httplib::Request& req) {
        const Dataset dataset = datasets.getDataset(req.matches[1]);
        json rows = json::array();
        for (const auto& row : dataset.rows) rows.push_back(RowToJson(row, dataset.columns));
        return json{{"columns", dataset.columns}, {"rows", rows}};
    });
    put(R"(/api/datasets/([^/]+)/data)", [&datasets](const httplib::Request& req) {
        const json body = ParseBody(req);
        std::vector<std::map<std::string, std::string>> records;
        for (const auto& r : body.at("rows")) {
            std::map<std::string, std::string> record;
            for (const auto& [column, value] : r.items()) {
                record[column] = value.is_string() ? value.get<std::string>() : value.dump();
            }
            records.push_back(std::move(record));
        }
        datasets.replaceRows(req.matches[1], StringList(body, "columns"), records);
        return json{{"ok", true}};
    });
    put(R"(/api/datasets/([^/]+)/name)", [&datasets](const httplib::Request& req) {
        datasets.rename(req.matches[1], ParseBody(req).at("name").get<std::string>());
        return json{{"ok", true}};
    });
    get(R"(/api/datasets/([^/]+))", [this](const httplib::Request& req) {
        return datasetDetail(req.matches[1]);
    });

    // --- Mappings ---
    get(R"(/api/mappings/([^/]+))", [&catalog](const httplib::Request& req) {
        return JsonCodec::toJson(catalog.getMapping(req.matches[1]));
    });
    put(R"(/api/mappings/([^/]+))", [&catalog](const httplib::Request& req) {
        const auto map = ParseBody(req).at("map").get<std::map<std::string, std::string>>();
        return JsonCodec::toJson(catalog.putMapping(req.matches[1], map));
    });

    // --- Mapping templates ---
    get("/api/mapping-templates", [&catalog](const httplib::Request&) {
        json out = json::array();
        for (const auto& t : catalog.listTemplates()) out.push_back(JsonCodec::toJson(t));
        return out;
    });
    post("/api/mapping-templates", [&catalog](const httplib::Request& req) {
        const json body = ParseBody(req);
        return JsonCodec::toJson(catalog.upsertTemplate(body.at("name").get<std::string>(),
                                                        body.at("map").get<std::map<std::string, std::string>>()));
    });
    post(R"(/api/mapping-templates/([^/]+)/apply)", [&catalog](const httplib::Request& req) {
        const json body = ParseBody(req);
        return JsonCodec::toJson(catalog.applyTemplate(req.matches[1], body.at("datasetId").get<std::string>()));
    });
    del(R"(/api/mapping-templates/([^/]+))", [&catalog](const httplib::Request& req) {
        catalog.deleteTemplate(req.matches[1]);
        return json{{"ok", true}};
    });

    // --- Weight models ---
    get("/api/weight-models", [&models](const httplib::Request&) {
        json out = json::array();
        for (const auto& m : models.listModels()) out.push_back(JsonCodec::toJson(m));
        return out;
    });
    post("/api/weight-models/train", [this, &models](const httplib::Request& req) {
        const json body = ParseBody(req);
        const std::string method = body.at("method").get<std::string>();
        const auto keys = StringList(body, "indicatorKeys");
        const auto datasetIds = StringList(body, "datasetIds");
        const std::string name = body.value("name", "");
        if (method == "entropy") {
            return JsonCodec::toJson(models.trainEntropy(keys, datasetIds, name));
        }
        if (method == "pca") {
            const double threshold = body.value("pcaCumVarThreshold", m_config.pcaCumVarThreshold);
            return JsonCodec::toJson(models.trainPCA(keys, datasetIds, threshold, name));
        }
        throw ValidationError("Unsupported training method: " + method + " (use entropy or pca)");
    });
    post("/api/weight-models/ahp", [&models](const httplib::Request& req) {
        const json body = ParseBody(req);
        const auto keys = StringList(body, "indicatorKeys");
        const auto datasetIds = StringList(body, "datasetIds");
        const std::string standardization = body.value("standardization", "zscore");
        auto method = StandardizationMethodFromString(standardization);
        if (!method) throw ValidationError("Unknown standardization method: " + standardization);
        return JsonCodec::toJson(models.trainAHP(keys, datasetIds, JudgmentsFromJson(body, keys),
                                                 body.value("name", ""), *method));
    });
    get(R"(/api/weight-models/([^/]+))", [&models](const httplib::Request& req) {
        auto model = models.getModel(req.matches[1]);
        if (!model) throw NotFoundError("Weight model", req.matches[1]);
        return JsonCodec::toJson(*model);
    });

    // --- Compute / results ---
    post("/api/compute", [&compute](const httplib::Request& req) {
        const json body = ParseBody(req);
        const auto result = compute.computeIndex(body.at("weightModelId").get<std::string>(),
                                                 StringList(body, "datasetIds"), OptionalString(body, "name"));
        json out = JsonCodec::resultSummaryToJson(result);
        out["resultSetId"] = result.id;
        return out;
    });
    get("/api/results", [&compute](const httplib::Request&) {
        json out = json::array();
        for (const auto& r : compute.listResults()) out.push_back(JsonCodec::resultSummaryToJson(r));
        return out;
    });
    get(R"(/api/results/([^/]+)/rows)", [&compute](const httplib::Request& req) {
        auto result = compute.getResult(req.matches[1]);
        if (!result) throw NotFoundError("Result set", req.matches[1]);
        json rows = json::array();
        for (const auto& row : result->rows) rows.push_back(JsonCodec::toJson(row));
        return json{{"rows", rows}};
    });
    m_server->Get(R"(/api/results/([^/]+)/download)", [this, &compute](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&] {
            auto result = compute.getResult(req.matches[1]);
            if (!result) throw NotFoundError("Result set", req.matches[1]);
            res.set_header("Content-Disposition", "attachment; filename=\"result-" + result->id + ".csv\"");
            res.set_content(CsvCodec::resultToCsv(*result), "text/csv");
        });
    });
    get(R"(/api/results/([^/]+))", [&compute](const httplib::Request& req) {
        auto result = compute.getResult(req.matches[1]);
        if (!result) throw NotFoundError("Result set", req.matches[1]);
        json out = JsonCodec::toJson(*result);
        out.erase("rows");
        return out;
    });
}

} // namespace indexforge::infrastructure
