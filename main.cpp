/**
 * @file main.cpp
 * @brief Command-line entry point of the IndexForge server.
 */

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include "app/IndexForgeApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace indexforge;

namespace {

app::IndexForgeApp* g_app = nullptr;

void HandleSignal(int) {
    if (g_app) g_app->RequestStop();
}

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [serve] [options]\n"
              << "\n"
              << "Composite index engine (entropy / PCA / AHP weighting) served over HTTP.\n"
              << "\n"
              << "Options:\n"
              << "  --data-dir <dir>   Store directory (default ./.localdata, env INDEXFORGE_DATA_DIR)\n"
              << "  --host <addr>      Bind address (default 127.0.0.1)\n"
              << "  --port <n>         Bind port (default 8765, env INDEXFORGE_PORT)\n"
              << "  --help             Show this message\n"
              << "\n"
              << "Set INDEXFORGE_TOKEN to require 'Authorization: Bearer <token>' on /api routes.\n";
}

} // namespace

int main(int argc, char** argv) {
    infrastructure::ConfigOverrides overrides;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << std::endl;
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "serve") {
            continue;
        } else if (arg == "--data-dir") {
            overrides.dataDir = next("--data-dir");
        } else if (arg == "--host") {
            overrides.host = next("--host");
        } else if (arg == "--port") {
            const std::string value = next("--port");
            char* end = nullptr;
            long port = std::strtol(value.c_str(), &end, 10);
            if (*end != '\0' || port <= 0 || port > 65535) {
                std::cerr << "Invalid port: " << value << std::endl;
                return 2;
            }
            overrides.port = static_cast<int>(port);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    app::IndexForgeApp application(infrastructure::ConfigLoader::Load(overrides));
    g_app = &application;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const int code = application.Run();
    g_app = nullptr;
    return code;
}
