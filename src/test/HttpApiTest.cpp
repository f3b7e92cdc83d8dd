/**
 * @file HttpApiTest.cpp
 * @brief Drives the JSON API end to end over a loopback socket.
 */

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "app/IndexForgeApp.hpp"
#include "application/Identifiers.hpp"
#include "infrastructure/HttpApiServer.hpp"

using json = nlohmann::json;
using namespace indexforge::application;
using namespace indexforge::infrastructure;

namespace {

const char* kToken = "let-me-in";

httplib::Headers Auth() {
    return {{"Authorization", std::string("Bearer ") + kToken}};
}

json Body(const httplib::Result& res) {
    assert(res);
    return json::parse(res->body);
}

} // namespace

int main() {
    std::cout << "[Test] Starting HTTP API Test..." << std::endl;

    AppConfig config;
    config.dataDir = (std::filesystem::temp_directory_path() / ("indexforge_http_" + GenerateId())).string();
    config.token = kToken;
    std::filesystem::create_directories(config.dataDir);

    AppServices services = indexforge::app::IndexForgeApp::BuildServices(config);
    HttpApiServer server(services, config);
    const int port = server.bindToAnyPort("127.0.0.1");
    assert(port > 0);
    std::thread serving([&server] { server.listenAfterBind(); });

    httplib::Client client("127.0.0.1", port);
    bool up = false;
    for (int attempt = 0; attempt < 100 && !up; ++attempt) {
        auto res = client.Get("/health");
        up = res && res->status == 200;
        if (!up) std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(up);
    std::cout << "[PASS] Server answers /health on port " << port << std::endl;

    {
        auto res = client.Get("/api/indicators");
        assert(res && res->status == 401);
        assert(Body(res)["error"] == "Unauthorized");
        auto wrong = client.Get("/api/indicators", httplib::Headers{{"Authorization", "Bearer nope"}});
        assert(wrong && wrong->status == 401);
    }
    std::cout << "[PASS] Missing or wrong bearer token is rejected." << std::endl;

    const json indicators = json::array({
        {{"key", "gdp"}, {"name", "GDP"}, {"dimension2Key", "econ"}, {"direction", "positive"}},
        {{"key", "lit"}, {"name", "Literacy"}, {"dimension2Key", "social"}, {"direction", "positive"}},
        {{"key", "pm25"}, {"name", "PM2.5"}, {"dimension2Key", "env"}, {"direction", "negative"}, {"unit", "ug/m3"}}
    });
    for (const auto& ind : indicators) {
        auto res = client.Post("/api/indicators", Auth(), ind.dump(), "application/json");
        assert(res && res->status == 200);
    }
    assert(Body(client.Get("/api/indicators", Auth())).size() == 3);

    const json import = {
        {"name", "Provinces"},
        {"csvText", "entity,gdp,lit,pm25\nA,1,2,5\nB,2,1,3\nC,3,4,4\nD,4,3,1\nE,5,6,2\n"},
        {"yearOverride", 2020}
    };
    auto imported = client.Post("/api/datasets/import-text", Auth(), import.dump(), "application/json");
    assert(imported && imported->status == 200);
    const std::string datasetId = Body(imported)["datasetId"];

    auto detail = Body(client.Get("/api/datasets/" + datasetId, Auth()));
    assert(detail["rowCount"] == 5);
    assert(detail["columns"][1] == "year");
    assert(detail["previewRows"].size() == 5);
    assert(detail["previewRows"][0]["year"] == "2020");

    const json mapping = {{"map", {{"gdp", "gdp"}, {"lit", "lit"}, {"pm25", "pm25"}}}};
    auto mapped = client.Put("/api/mappings/" + datasetId, Auth(), mapping.dump(), "application/json");
    assert(mapped && mapped->status == 200);
    assert(Body(mapped)["map"]["gdp"] == "gdp");
    std::cout << "[PASS] Indicators, dataset import and mapping over HTTP." << std::endl;

    const json train = {
        {"method", "entropy"},
        {"indicatorKeys", {"gdp", "lit", "pm25"}},
        {"datasetIds", json::array({datasetId})},
        {"name", "HTTP entropy"}
    };
    auto trained = client.Post("/api/weight-models/train", Auth(), train.dump(), "application/json");
    assert(trained && trained->status == 200);
    const json model = Body(trained);
    assert(model["method"] == "entropy");
    const std::string modelId = model["id"];
    double total = 0.0;
    for (const auto& [key, w] : model["weights"].items()) total += w.get<double>();
    assert(std::abs(total - 1.0) < 1e-9);

    const json ahp = {
        {"indicatorKeys", {"gdp", "lit", "pm25"}},
        {"datasetIds", json::array({datasetId})},
        {"standardization", "minmax"},
        {"matrix", {{1, 2, 4}, {0.5, 1, 2}, {0.25, 0.5, 1}}}
    };
    auto ahpRes = client.Post("/api/weight-models/ahp", Auth(), ahp.dump(), "application/json");
    assert(ahpRes && ahpRes->status == 200);
    const json ahpModel = Body(ahpRes);
    assert(std::abs(ahpModel["weights"]["gdp"].get<double>() - 4.0 / 7.0) < 1e-9);
    assert(ahpModel["provenance"]["acceptable"] == true);
    std::cout << "[PASS] Entropy and AHP models trained over HTTP." << std::endl;

    const json computeBody = {{"weightModelId", modelId}, {"datasetIds", json::array({datasetId})}, {"name", "HTTP run"}};
    auto computed = client.Post("/api/compute", Auth(), computeBody.dump(), "application/json");
    assert(computed && computed->status == 200);
    const json summary = Body(computed);
    const std::string resultId = summary["resultSetId"];
    assert(summary["rowCount"] == 5);
    assert(summary["failureSummary"]["failedRows"] == 0);

    auto rows = Body(client.Get("/api/results/" + resultId + "/rows", Auth()))["rows"];
    assert(rows.size() == 5);
    for (const auto& row : rows) {
        const double idx = row["index_0_100"];
        assert(idx >= 0.0 && idx <= 100.0);
    }

    auto download = client.Get("/api/results/" + resultId + "/download", Auth());
    assert(download && download->status == 200);
    assert(download->get_header_value("Content-Type").find("text/csv") == 0);
    assert(download->body.rfind("entity,year,score_raw,index_0_100", 0) == 0);
    assert(Body(client.Get("/api/results", Auth())).size() == 1);
    std::cout << "[PASS] Compute, rows and CSV download." << std::endl;

    {
        auto missing = client.Get("/api/weight-models/does-not-exist", Auth());
        assert(missing && missing->status == 404);
        assert(Body(missing)["error"] == "NotFoundError");

        const json bad = {{"method", "magic"}, {"indicatorKeys", json::array({"gdp"})}, {"datasetIds", json::array({datasetId})}};
        auto unsupported = client.Post("/api/weight-models/train", Auth(), bad.dump(), "application/json");
        assert(unsupported && unsupported->status == 400);
        assert(Body(unsupported)["error"] == "ValidationError");

        auto malformed = client.Post("/api/compute", Auth(), "{ nope", "application/json");
        assert(malformed && malformed->status == 400);

        const json unknownModel = {{"weightModelId", "ghost"}, {"datasetIds", json::array({datasetId})}};
        auto ghost = client.Post("/api/compute", Auth(), unknownModel.dump(), "application/json");
        assert(ghost && ghost->status == 404);
    }
    std::cout << "[PASS] Errors map to 400/404 with a JSON body." << std::endl;

    server.stop();
    serving.join();
    services.persistenceService->stop();

    std::error_code ec;
    std::filesystem::remove_all(config.dataDir, ec);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
