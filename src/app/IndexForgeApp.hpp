/**
 * @file IndexForgeApp.hpp
 * @brief Main application class for IndexForge.
 */

#pragma once

#include <memory>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace indexforge::infrastructure {
class HttpApiServer;
}

namespace indexforge::app {

/**
 * @class IndexForgeApp
 * @brief Orchestrates the server lifecycle: store loading, service wiring, HTTP loop and shutdown.
 */
class IndexForgeApp {
public:
    explicit IndexForgeApp(infrastructure::AppConfig config);
    ~IndexForgeApp();

    /**
     * @brief Initializes the services and blocks serving the HTTP API.
     * @return Exit code (0 for success).
     */
    int Run();

    /** @brief Requests the HTTP loop to return (safe to call from another thread). */
    void RequestStop();

    /**
     * @brief Composition root: store, repositories and services over @p config.dataDir.
     *        The store is loaded before returning.
     */
    static application::AppServices BuildServices(const infrastructure::AppConfig& config);

private:
    bool Init();
    void Shutdown();

    infrastructure::AppConfig m_config;
    application::AppServices m_services;
    std::unique_ptr<infrastructure::HttpApiServer> m_server;
};

} // namespace indexforge::app
