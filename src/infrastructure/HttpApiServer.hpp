/**
 * @file HttpApiServer.hpp
 * @brief JSON HTTP API over the application services (cpp-httplib).
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace indexforge::infrastructure {

/**
 * @class HttpApiServer
 * @brief Routes /api/... requests to the services and maps engine errors to status codes.
 *
 * ValidationError, DataQualityError and NumericalError answer 400, NotFoundError 404,
 * anything else 500. Error bodies are {"error": <kind>, "detail": <message>}.
 * When a token is configured every /api route requires "Authorization: Bearer <token>".
 */
class HttpApiServer {
public:
    HttpApiServer(application::AppServices& services, AppConfig config);
    ~HttpApiServer();

    HttpApiServer(const HttpApiServer&) = delete;
    HttpApiServer& operator=(const HttpApiServer&) = delete;

    /** @brief Blocks serving on the configured host/port. Returns false if binding failed. */
    bool listen();

    /** @brief Binds an ephemeral port on @p host and returns it (-1 on failure). */
    int bindToAnyPort(const std::string& host);

    /** @brief Serves on a socket bound by bindToAnyPort. Blocks. */
    bool listenAfterBind();

    void stop();

private:
    using JsonHandler = std::function<nlohmann::json(const httplib::Request&)>;

    void registerRoutes();
    void get(const std::string& pattern, JsonHandler handler);
    void post(const std::string& pattern, JsonHandler handler);
    void put(const std::string& pattern, JsonHandler handler);
    void del(const std::string& pattern, JsonHandler handler);

    /** @brief Runs @p action with auth check and error mapping applied. */
    void guarded(const httplib::Request& req, httplib::Response& res, const std::function<void()>& action);
    bool authorized(const httplib::Request& req) const;

    nlohmann::json datasetDetail(const std::string& datasetId) const;

    application::AppServices& m_services;
    AppConfig m_config;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace indexforge::infrastructure
