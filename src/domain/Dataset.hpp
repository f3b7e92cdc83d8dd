/**
 * @file Dataset.hpp
 * @brief Entity×year observation table as imported by the analyst.
 */

#pragma once

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace indexforge::domain {

/**
 * @brief Parses a decimal numeric cell. Empty, non-numeric, partially numeric,
 *        hexadecimal, overflowing and non-finite text all yield nullopt.
 *        Underflow to a subnormal or zero is accepted.
 */
inline std::optional<double> ParseNumericCell(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::nullopt;
    size_t end = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(begin, end - begin + 1);

    // strtod also reads hex integers and hex floats ("0x10", "0x1p3").
    size_t digits = (trimmed[0] == '+' || trimmed[0] == '-') ? 1 : 0;
    if (trimmed.size() > digits + 1 && trimmed[digits] == '0' &&
        (trimmed[digits + 1] == 'x' || trimmed[digits + 1] == 'X')) {
        return std::nullopt;
    }

    errno = 0;
    char* parseEnd = nullptr;
    double value = std::strtod(trimmed.c_str(), &parseEnd);
    if (parseEnd == trimmed.c_str() || *parseEnd != '\0') return std::nullopt;
    if (errno == ERANGE && std::fabs(value) == HUGE_VAL) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

/**
 * @struct DatasetRow
 * @brief One observation keyed by (entity, year). Cells keep their raw text.
 */
struct DatasetRow {
    std::string entity;
    int year = 0;
    std::map<std::string, std::string> cells; ///< column name -> raw text (entity/year excluded).

    /** @brief Looks up a column; nullopt when the row has no such cell. */
    std::optional<std::string> cell(const std::string& column) const {
        auto it = cells.find(column);
        if (it == cells.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * @struct Dataset
 * @brief Rectangular table of observations plus its declared column list.
 */
struct Dataset {
    std::string id;
    std::string name;
    std::string createdAt;
    std::string sourceType = "paste";          ///< "file", "paste", "manual" or "sample".
    bool isSample = false;
    std::vector<std::string> columns;           ///< Declared columns, including entity and year.
    std::map<std::string, std::string> columnTypes; ///< Inferred: "int", "number" or "string".
    std::vector<DatasetRow> rows;

    bool hasColumn(const std::string& column) const {
        for (const auto& c : columns) {
            if (c == column) return true;
        }
        return false;
    }
};

} // namespace indexforge::domain
