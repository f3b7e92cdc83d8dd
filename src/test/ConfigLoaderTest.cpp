#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "application/Identifiers.hpp"
#include "infrastructure/ConfigLoader.hpp"

using indexforge::infrastructure::AppConfig;
using indexforge::infrastructure::ConfigLoader;
using indexforge::infrastructure::ConfigOverrides;

namespace fs = std::filesystem;

namespace {

void WriteText(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

void ClearEnv() {
    unsetenv("INDEXFORGE_DATA_DIR");
    unsetenv("INDEXFORGE_TOKEN");
    unsetenv("INDEXFORGE_PORT");
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    ClearEnv();

    const fs::path dir = fs::temp_directory_path() / ("indexforge_config_" + indexforge::application::GenerateId());
    fs::create_directories(dir);

    ConfigOverrides cli;
    cli.dataDir = dir.string();

    AppConfig defaults = ConfigLoader::Load(cli);
    assert(defaults.dataDir == dir.string());
    assert(defaults.host == "127.0.0.1");
    assert(defaults.port == 8765);
    assert(!defaults.token);
    assert(defaults.previewRowLimit == 50);
    std::cout << "[PASS] Defaults without settings.json." << std::endl;

    WriteText(dir / "settings.json",
              R"({"host": "0.0.0.0", "port": 9000, "token": "secret", "pcaCumVarThreshold": 1.5,
                  "ahpConsistencyThreshold": 0.2, "previewRowLimit": 10, "theme": "dark"})");
    AppConfig fromFile = ConfigLoader::Load(cli);
    assert(fromFile.host == "0.0.0.0");
    assert(fromFile.port == 9000);
    assert(fromFile.token && *fromFile.token == "secret");
    assert(fromFile.pcaCumVarThreshold == 0.85);
    assert(fromFile.ahpConsistencyThreshold == 0.2);
    assert(fromFile.previewRowLimit == 10);
    std::cout << "[PASS] settings.json applied, out-of-range threshold reset." << std::endl;

    setenv("INDEXFORGE_PORT", "9100", 1);
    setenv("INDEXFORGE_TOKEN", "from-env", 1);
    AppConfig fromEnv = ConfigLoader::Load(cli);
    assert(fromEnv.port == 9100);
    assert(*fromEnv.token == "from-env");

    ConfigOverrides cliPort = cli;
    cliPort.port = 9200;
    cliPort.host = "localhost";
    AppConfig fromCli = ConfigLoader::Load(cliPort);
    assert(fromCli.port == 9200);
    assert(fromCli.host == "localhost");

    setenv("INDEXFORGE_PORT", "http", 1);
    assert(ConfigLoader::Load(cli).port == 9000);
    std::cout << "[PASS] Environment overrides the file, command line overrides both." << std::endl;

    // Data directory from the environment when the command line leaves it unset.
    ClearEnv();
    setenv("INDEXFORGE_DATA_DIR", dir.string().c_str(), 1);
    AppConfig envDir = ConfigLoader::Load();
    assert(envDir.dataDir == dir.string());
    assert(envDir.port == 9000);
    ClearEnv();

    // SaveSettings keeps keys it does not own.
    AppConfig toSave = fromFile;
    toSave.port = 9300;
    toSave.pcaCumVarThreshold = 0.9;
    ConfigLoader::SaveSettings(toSave);
    {
        std::ifstream in(dir / "settings.json");
        nlohmann::json saved;
        in >> saved;
        assert(saved.value("theme", "") == "dark");
        assert(saved.value("port", 0) == 9300);
        assert(saved.value("pcaCumVarThreshold", 0.0) == 0.9);
    }
    assert(ConfigLoader::Load(cli).port == 9300);
    std::cout << "[PASS] SaveSettings round-trips and preserves unknown keys." << std::endl;

    WriteText(dir / "settings.json", "{ not json");
    AppConfig broken = ConfigLoader::Load(cli);
    assert(broken.port == 8765);
    std::cout << "[PASS] Malformed settings.json is ignored." << std::endl;

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
