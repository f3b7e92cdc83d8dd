/**
 * @file Identifiers.hpp
 * @brief Id and timestamp helpers for newly created entities.
 */

#pragma once

#include <string>

namespace indexforge::application {

/** @brief Random 32-character lowercase hex id. */
std::string GenerateId();

/** @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ". */
std::string NowIso();

} // namespace indexforge::application
