/**
 * @file IndexForgeApp.cpp
 * @brief Implementation of the IndexForgeApp class.
 */

#include "app/IndexForgeApp.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

#include "infrastructure/HttpApiServer.hpp"
#include "infrastructure/JsonRepositories.hpp"

namespace indexforge::app {

IndexForgeApp::IndexForgeApp(infrastructure::AppConfig config) : m_config(std::move(config)) {}

IndexForgeApp::~IndexForgeApp() {
    Shutdown();
}

application::AppServices IndexForgeApp::BuildServices(const infrastructure::AppConfig& config) {
    application::AppServices services;
    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    services.store = std::make_shared<infrastructure::JsonStore>(config.dataDir, services.persistenceService);
    services.store->load();

    auto datasets = std::make_shared<infrastructure::JsonDatasetRepository>(services.store);
    auto indicators = std::make_shared<infrastructure::JsonIndicatorCatalog>(services.store);
    auto mappings = std::make_shared<infrastructure::JsonMappingRepository>(services.store);
    auto templates = std::make_shared<infrastructure::JsonMappingTemplateRepository>(services.store);
    auto models = std::make_shared<infrastructure::JsonWeightModelRepository>(services.store);
    auto results = std::make_shared<infrastructure::JsonResultSetRepository>(services.store);

    services.catalogService = std::make_unique<application::CatalogService>(indicators, mappings, templates, datasets);
    services.datasetService = std::make_unique<application::DatasetService>(datasets);
    services.weightModelService = std::make_unique<application::WeightModelService>(
        indicators, datasets, mappings, models, config.ahpConsistencyThreshold);
    services.indexComputationService = std::make_unique<application::IndexComputationService>(
        models, datasets, mappings, results);
    return services;
}

bool IndexForgeApp::Init() {
    std::error_code ec;
    std::filesystem::create_directories(m_config.dataDir, ec);
    if (ec) {
        std::cerr << "[IndexForgeApp] Cannot create data directory " << m_config.dataDir << ": " << ec.message() << std::endl;
        return false;
    }

    m_services = BuildServices(m_config);
    m_server = std::make_unique<infrastructure::HttpApiServer>(m_services, m_config);
    if (m_config.token) {
        std::cout << "[IndexForgeApp] API requires a bearer token" << std::endl;
    }
    return true;
}

int IndexForgeApp::Run() {
    if (!Init()) {
        return 1;
    }
    const bool ok = m_server->listen();
    Shutdown();
    return ok ? 0 : 1;
}

void IndexForgeApp::RequestStop() {
    if (m_server) {
        m_server->stop();
    }
}

void IndexForgeApp::Shutdown() {
    if (m_server) {
        m_server->stop();
        m_server.reset();
    }
    if (m_services.persistenceService) {
        // Drain pending writes before exit.
        m_services.persistenceService->stop();
        if (m_services.persistenceService->failedWrites() > 0) {
            std::cerr << "[IndexForgeApp] " << m_services.persistenceService->failedWrites()
                      << " store writes failed during this session" << std::endl;
        }
        m_services.persistenceService.reset();
    }
}

} // namespace indexforge::app
