/**
 * @file Identifiers.cpp
 * @brief Implementation of the id and timestamp helpers.
 */

#include "application/Identifiers.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace indexforge::application {

std::string GenerateId() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};
    static const char hex[] = "0123456789abcdef";

    std::lock_guard<std::mutex> lock(mutex);
    std::uniform_int_distribution<int> digit(0, 15);
    std::string id;
    id.reserve(32);
    for (int i = 0; i < 32; ++i) {
        id += hex[digit(engine)];
    }
    return id;
}

std::string NowIso() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace indexforge::application
