/**
 * @file JsonStore.cpp
 * @brief Implementation of JsonStore.
 */

#include "infrastructure/JsonStore.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

#include "application/Identifiers.hpp"
#include "infrastructure/CsvCodec.hpp"
#include "infrastructure/JsonCodec.hpp"

namespace indexforge::infrastructure {

using json = nlohmann::json;
using namespace indexforge::domain;
namespace fs = std::filesystem;

namespace {

constexpr int kDbVersion = 1;

std::optional<std::string> ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

template <typename T, typename Key>
auto FindBy(std::vector<T>& items, const std::string& id, Key key) {
    return std::find_if(items.begin(), items.end(), [&](const T& item) { return key(item) == id; });
}

template <typename T>
std::vector<T> NewestFirst(const std::vector<T>& items) {
    return std::vector<T>(items.rbegin(), items.rend());
}

} // namespace

JsonStore::JsonStore(std::string dataDir, std::shared_ptr<PersistenceService> persistence)
    : m_dataDir(std::move(dataDir)), m_persistence(std::move(persistence)) {}

std::string JsonStore::dbPath() const {
    return (fs::path(m_dataDir) / "db.json").string();
}

std::string JsonStore::datasetCsvPath(const std::string& datasetId) const {
    return (fs::path(m_dataDir) / "datasets" / datasetId / "data.csv").string();
}

std::string JsonStore::resultJsonPath(const std::string& resultId) const {
    return (fs::path(m_dataDir) / "results" / resultId / "result.json").string();
}

std::string JsonStore::resultCsvPath(const std::string& resultId) const {
    return (fs::path(m_dataDir) / "results" / resultId / "result.csv").string();
}

void JsonStore::load() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_datasets.clear();
    m_indicators.clear();
    m_mappings.clear();
    m_templates.clear();
    m_models.clear();
    m_results.clear();

    auto text = ReadFile(dbPath());
    if (!text) {
        std::cout << "[JsonStore] No db.json in " << m_dataDir << ", starting empty" << std::endl;
        return;
    }

    json db;
    try {
        db = json::parse(*text);
    } catch (const json::exception& e) {
        std::cerr << "[JsonStore] Failed to parse db.json: " << e.what() << std::endl;
        return;
    }

    for (const auto& j : db.value("indicators", json::array())) {
        try {
            auto indicator = JsonCodec::indicatorFromJson(j);
            m_indicators[indicator.key] = indicator;
        } catch (const std::exception& e) {
            std::cerr << "[JsonStore] Skipping corrupt indicator: " << e.what() << std::endl;
        }
    }

    for (const auto& j : db.value("datasets", json::array())) {
        try {
            Dataset meta = JsonCodec::datasetMetaFromJson(j);
            auto csv = ReadFile(datasetCsvPath(meta.id));
            if (!csv) {
                std::cerr << "[JsonStore] Dataset " << meta.id << " has no data.csv, skipping" << std::endl;
                continue;
            }
            Dataset loaded = CsvCodec::normalize(CsvCodec::parse(*csv), std::nullopt);
            loaded.id = meta.id;
            loaded.name = meta.name;
            loaded.createdAt = meta.createdAt;
            loaded.sourceType = meta.sourceType;
            loaded.isSample = meta.isSample;
            m_datasets.push_back(std::move(loaded));
        } catch (const std::exception& e) {
            std::cerr << "[JsonStore] Skipping corrupt dataset: " << e.what() << std::endl;
        }
    }

    const json mappings = db.value("mappings", json::object());
    for (const auto& [datasetId, j] : mappings.items()) {
        try {
            auto mapping = JsonCodec::mappingFromJson(j);
            mapping.datasetId = datasetId;
            m_mappings[datasetId] = mapping;
        } catch (const std::exception& e) {
            std::cerr << "[JsonStore] Skipping corrupt mapping of " << datasetId << ": " << e.what() << std::endl;
        }
    }

    for (const auto& j : db.value("mappingTemplates", json::array())) {
        try {
            m_templates.push_back(JsonCodec::templateFromJson(j));
        } catch (const std::exception& e) {
            std::cerr << "[JsonStore] Skipping corrupt mapping template: " << e.what() << std::endl;
        }
    }

    for (const auto& j : db.value("weightModels", json::array())) {
        try {
            m_models.push_back(JsonCodec::weightModelFromJson(j));
        } catch (const std::exception& e) {
            std::cerr << "[JsonStore] Skipping corrupt weight model: " << e.what() << std::endl;
        }
    }

    for (const auto& j : db.value("results", json::array())) {
        const std::string id = j.value("id", "");
        auto doc = ReadFile(resultJsonPath(id));
        if (id.empty() || !doc) {
            std::cerr << "[JsonStore] Result " << id << " has no result.json, skipping" << std::endl;
            continue;
        }
        try {
            m_results.push_back(JsonCodec::resultSetFromJson(json::parse(*doc)));
        } catch (const std::exception& e) {
            std::cerr << "[JsonStore] Skipping corrupt result " << id << ": " << e.what() << std::endl;
        }
    }

    std::cout << "[JsonStore] Loaded " << m_datasets.size() << " datasets, " << m_indicators.size()
              << " indicators, " << m_models.size() << " models, " << m_results.size() << " results" << std::endl;
}

void JsonStore::persistDbLocked() {
    json datasets = json::array();
    for (const auto& d : m_datasets) datasets.push_back(JsonCodec::datasetMetaToJson(d));

    json indicators = json::array();
    for (const auto& [key, ind] : m_indicators) indicators.push_back(JsonCodec::toJson(ind));

    json mappings = json::object();
    for (const auto& [datasetId, m] : m_mappings) mappings[datasetId] = JsonCodec::toJson(m);

    json templates = json::array();
    for (const auto& t : m_templates) templates.push_back(JsonCodec::toJson(t));

    json models = json::array();
    for (const auto& m : m_models) models.push_back(JsonCodec::toJson(m));

    json results = json::array();
    for (const auto& r : m_results) results.push_back(JsonCodec::resultSummaryToJson(r));

    json db = {
        {"version", kDbVersion},
        {"datasets", datasets},
        {"indicators", indicators},
        {"mappings", mappings},
        {"mappingTemplates", templates},
        {"weightModels", models},
        {"results", results}
    };
    m_persistence->saveTextAsync(dbPath(), db.dump(2));
}

// --- Datasets ---------------------------------------------------------------

void JsonStore::saveDataset(const Dataset& dataset) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = FindBy(m_datasets, dataset.id, [](const Dataset& d) { return d.id; });
    if (it == m_datasets.end()) {
        m_datasets.push_back(dataset);
    } else {
        *it = dataset;
    }
    m_persistence->saveTextAsync(datasetCsvPath(dataset.id), CsvCodec::datasetToCsv(dataset));
    persistDbLocked();
}

std::optional<Dataset> JsonStore::findDataset(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& d : m_datasets) {
        if (d.id == id) return d;
    }
    return std::nullopt;
}

std::vector<Dataset> JsonStore::listDatasets() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return NewestFirst(m_datasets);
}

// --- Indicators -------------------------------------------------------------

std::vector<Indicator> JsonStore::listIndicators() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Indicator> out;
    for (const auto& [key, ind] : m_indicators) out.push_back(ind);
    return out;
}

std::optional<Indicator> JsonStore::findIndicator(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_indicators.find(key);
    if (it == m_indicators.end()) return std::nullopt;
    return it->second;
}

void JsonStore::upsertIndicator(const Indicator& indicator) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_indicators[indicator.key] = indicator;
    persistDbLocked();
}

void JsonStore::removeIndicator(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_indicators.erase(key);
    persistDbLocked();
}

// --- Mappings ---------------------------------------------------------------

ColumnMapping JsonStore::getMapping(const std::string& datasetId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_mappings.find(datasetId);
    if (it == m_mappings.end()) return ColumnMapping{datasetId, {}};
    return it->second;
}

void JsonStore::putMapping(const ColumnMapping& mapping) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_mappings[mapping.datasetId] = mapping;
    persistDbLocked();
}

// --- Mapping templates ------------------------------------------------------

std::vector<MappingTemplate> JsonStore::listTemplates() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return NewestFirst(m_templates);
}

std::optional<MappingTemplate> JsonStore::findTemplate(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& t : m_templates) {
        if (t.name == name) return t;
    }
    return std::nullopt;
}

MappingTemplate JsonStore::upsertTemplate(const std::string& name, const std::map<std::string, std::string>& map) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = FindBy(m_templates, name, [](const MappingTemplate& t) { return t.name; });
    MappingTemplate tmpl;
    if (it == m_templates.end()) {
        tmpl = MappingTemplate{name, application::NowIso(), map};
        m_templates.push_back(tmpl);
    } else {
        it->map = map;
        tmpl = *it;
    }
    persistDbLocked();
    return tmpl;
}

void JsonStore::removeTemplate(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = FindBy(m_templates, name, [](const MappingTemplate& t) { return t.name; });
    if (it == m_templates.end()) return;
    m_templates.erase(it);
    persistDbLocked();
}

// --- Weight models ----------------------------------------------------------

void JsonStore::saveModel(const WeightModel& model) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = FindBy(m_models, model.id, [](const WeightModel& m) { return m.id; });
    if (it != m_models.end()) {
        std::cerr << "[JsonStore] Weight model " << model.id << " already stored, keeping the original" << std::endl;
        return;
    }
    m_models.push_back(model);
    persistDbLocked();
}

std::optional<WeightModel> JsonStore::findModel(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& m : m_models) {
        if (m.id == id) return m;
    }
    return std::nullopt;
}

std::vector<WeightModel> JsonStore::listModels() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return NewestFirst(m_models);
}

// --- Results ----------------------------------------------------------------

void JsonStore::saveResult(const ResultSet& result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = FindBy(m_results, result.id, [](const ResultSet& r) { return r.id; });
    if (it == m_results.end()) {
        m_results.push_back(result);
    } else {
        *it = result;
    }
    m_persistence->saveTextAsync(resultJsonPath(result.id), JsonCodec::toJson(result).dump(2));
    m_persistence->saveTextAsync(resultCsvPath(result.id), CsvCodec::resultToCsv(result));
    persistDbLocked();
}

std::optional<ResultSet> JsonStore::findResult(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& r : m_results) {
        if (r.id == id) return r;
    }
    return std::nullopt;
}

std::vector<ResultSet> JsonStore::listResults() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return NewestFirst(m_results);
}

} // namespace indexforge::infrastructure
