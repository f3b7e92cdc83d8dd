#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include <cstring>
#include <filesystem>
#include <mutex>
#include "app/IndexForgeApp.hpp"
#include "application/Identifiers.hpp"

using namespace indexforge::domain;
using namespace indexforge::application;
using namespace indexforge::infrastructure;

namespace {

bool SameBits(double a, double b) {
    return std::memcmp(&a, &b, sizeof(double)) == 0;
}

bool SameRows(const ResultSet& a, const ResultSet& b) {
    if (a.rows.size() != b.rows.size()) return false;
    for (size_t i = 0; i < a.rows.size(); ++i) {
        const auto& x = a.rows[i];
        const auto& y = b.rows[i];
        if (x.entity != y.entity || x.year != y.year) return false;
        if (!SameBits(x.scoreRaw, y.scoreRaw) || !SameBits(x.index0To100, y.index0To100)) return false;
        for (const auto& [dim, value] : x.subindex) {
            if (!SameBits(value, y.subindex.at(dim))) return false;
        }
    }
    return a.failures.size() == b.failures.size();
}

} // namespace

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    // Use a throwaway data directory to avoid cluttering real user data
    AppConfig config;
    config.dataDir = (std::filesystem::temp_directory_path() / ("indexforge_concurrency_" + GenerateId())).string();
    std::filesystem::create_directories(config.dataDir);

    AppServices services = indexforge::app::IndexForgeApp::BuildServices(config);

    std::string csv = "entity,year,gdp,lit,pm25\n";
    for (int e = 0; e < 20; ++e) {
        for (int year = 2015; year <= 2020; ++year) {
            csv += "E" + std::to_string(e) + "," + std::to_string(year) + "," +
                   std::to_string(100 + e * 7 + year % 5) + "," +
                   std::to_string(50 + (e * 13) % 17 + year % 3) + "," +
                   std::to_string(30 - (e * 5) % 11 + year % 4) + "\n";
        }
    }

    services.catalogService->upsertIndicator(Indicator{"gdp", "GDP", "econ", Direction::Positive, std::nullopt});
    services.catalogService->upsertIndicator(Indicator{"lit", "Literacy", "social", Direction::Positive, std::nullopt});
    services.catalogService->upsertIndicator(Indicator{"pm25", "PM2.5", "env", Direction::Negative, std::nullopt});
    const std::string datasetId = services.datasetService->importText("Panel", csv).id;
    services.catalogService->putMapping(datasetId, {{"gdp", "gdp"}, {"lit", "lit"}, {"pm25", "pm25"}});

    const std::vector<std::string> keys = {"gdp", "lit", "pm25"};
    const std::string modelId = services.weightModelService->trainPCA(keys, {datasetId}).id;
    const ResultSet reference = services.indexComputationService->computeIndex(modelId, {datasetId});
    assert(reference.rows.size() == 120);

    // Stress Test: aggregation runs racing each other and a training run on the same store
    const int NUM_RUNS = 32;
    std::vector<std::thread> threads;
    std::vector<ResultSet> results(NUM_RUNS);
    std::atomic<int> completedRuns{0};
    std::atomic<int> trainedModels{0};

    std::cout << "[Test] Spawning " << NUM_RUNS << " threads computing the index..." << std::endl;

    auto startTime = std::chrono::steady_clock::now();

    for (int i = 0; i < NUM_RUNS; ++i) {
        threads.emplace_back([&services, &results, &completedRuns, &modelId, &datasetId, i]() {
            results[i] = services.indexComputationService->computeIndex(modelId, {datasetId},
                                                                         std::string("Run ") + std::to_string(i));
            completedRuns++;
        });
    }
    threads.emplace_back([&services, &keys, &datasetId, &trainedModels]() {
        services.weightModelService->trainEntropy(keys, {datasetId});
        trainedModels++;
    });

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();
    std::cout << "[Test] " << completedRuns.load() << " runs finished in " << elapsedMs << " ms" << std::endl;

    assert(completedRuns == NUM_RUNS);
    assert(trainedModels == 1);

    // Validation
    std::vector<std::string> ids;
    for (const auto& result : results) {
        assert(SameRows(result, reference));
        for (const auto& id : ids) assert(id != result.id);
        ids.push_back(result.id);
    }
    std::cout << "[PASS] Concurrent runs are bit-identical to the sequential run." << std::endl;

    assert(services.indexComputationService->listResults().size() == NUM_RUNS + 1);
    assert(services.weightModelService->listModels().size() == 2);
    std::cout << "[PASS] Every run and model was stored exactly once." << std::endl;

    services.persistenceService->flush();
    assert(services.persistenceService->failedWrites() == 0);
    for (const auto& id : ids) {
        assert(std::filesystem::exists(services.store->resultCsvPath(id)));
    }
    std::cout << "[PASS] Result files written: " << ids.size() << std::endl;

    // Clean up
    services.persistenceService->stop();
    std::error_code ec;
    std::filesystem::remove_all(config.dataDir, ec);
    std::cout << "[Test] Completed." << std::endl;

    return 0;
}
