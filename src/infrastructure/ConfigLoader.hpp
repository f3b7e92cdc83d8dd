/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to resolve the server configuration without
 * scattering JSON parsing and environment lookups throughout the codebase.
 */

#pragma once

#include <optional>
#include <string>

namespace indexforge::infrastructure {

/**
 * @struct AppConfig
 * @brief Resolved runtime configuration.
 */
struct AppConfig {
    std::string dataDir = "./.localdata";
    std::string host = "127.0.0.1";
    int port = 8765;
    std::optional<std::string> token;       ///< Bearer token required by the API when set.
    double pcaCumVarThreshold = 0.85;
    double ahpConsistencyThreshold = 0.10;
    size_t previewRowLimit = 50;
};

/// Values given on the command line; unset fields leave the lower layers in place.
struct ConfigOverrides {
    std::optional<std::string> dataDir;
    std::optional<std::string> host;
    std::optional<int> port;
};

class ConfigLoader {
public:
    /**
     * @brief Resolves the configuration: defaults, then <dataDir>/settings.json,
     *        then INDEXFORGE_DATA_DIR / INDEXFORGE_TOKEN / INDEXFORGE_PORT, then @p cli.
     *
     * The data directory is resolved first (env, then CLI) so the right
     * settings.json is read.
     */
    static AppConfig Load(const ConfigOverrides& cli = {});

    /**
     * @brief Applies the keys of settings.json in @p dataDir onto @p config.
     *        A malformed file is reported and ignored.
     */
    static void ApplySettingsFile(const std::string& dataDir, AppConfig& config);

    /**
     * @brief Writes the tunable keys of @p config to <dataDir>/settings.json,
     *        preserving other keys if possible.
     */
    static void SaveSettings(const AppConfig& config);
};

} // namespace indexforge::infrastructure
