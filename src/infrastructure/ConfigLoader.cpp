/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace indexforge::infrastructure {

namespace {

std::optional<std::string> Env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

std::optional<int> ParsePort(const std::string& text) {
    try {
        size_t consumed = 0;
        int port = std::stoi(text, &consumed);
        if (consumed != text.size() || port <= 0 || port > 65535) return std::nullopt;
        return port;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

void ConfigLoader::ApplySettingsFile(const std::string& dataDir, AppConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(dataDir) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        config.host = j.value("host", config.host);
        config.port = j.value("port", config.port);
        if (j.contains("token") && j["token"].is_string() && !j["token"].get<std::string>().empty()) {
            config.token = j["token"].get<std::string>();
        }
        config.pcaCumVarThreshold = j.value("pcaCumVarThreshold", config.pcaCumVarThreshold);
        config.ahpConsistencyThreshold = j.value("ahpConsistencyThreshold", config.ahpConsistencyThreshold);
        config.previewRowLimit = j.value("previewRowLimit", config.previewRowLimit);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }
}

AppConfig ConfigLoader::Load(const ConfigOverrides& cli) {
    AppConfig config;

    if (auto dir = Env("INDEXFORGE_DATA_DIR")) config.dataDir = *dir;
    if (cli.dataDir) config.dataDir = *cli.dataDir;

    ApplySettingsFile(config.dataDir, config);

    if (auto token = Env("INDEXFORGE_TOKEN")) config.token = *token;
    if (auto portText = Env("INDEXFORGE_PORT")) {
        if (auto port = ParsePort(*portText)) {
            config.port = *port;
        } else {
            std::cerr << "[ConfigLoader] Ignoring invalid INDEXFORGE_PORT: " << *portText << std::endl;
        }
    }

    if (cli.host) config.host = *cli.host;
    if (cli.port) config.port = *cli.port;

    if (!(config.pcaCumVarThreshold > 0.0 && config.pcaCumVarThreshold <= 1.0)) {
        std::cerr << "[ConfigLoader] pcaCumVarThreshold out of (0, 1], using 0.85" << std::endl;
        config.pcaCumVarThreshold = 0.85;
    }
    return config;
}

void ConfigLoader::SaveSettings(const AppConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(config.dataDir) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["host"] = config.host;
    j["port"] = config.port;
    j["pcaCumVarThreshold"] = config.pcaCumVarThreshold;
    j["ahpConsistencyThreshold"] = config.ahpConsistencyThreshold;
    j["previewRowLimit"] = config.previewRowLimit;

    try {
        std::filesystem::create_directories(configPath.parent_path());
        std::ofstream f(configPath);
        f << j.dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
    }
}

} // namespace indexforge::infrastructure
