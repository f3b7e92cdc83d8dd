/**
 * @file CsvCodec.hpp
 * @brief CSV parsing/emission and normalization of imported observation tables.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/Dataset.hpp"
#include "domain/ResultSet.hpp"

namespace indexforge::infrastructure {

/**
 * @struct CsvTable
 * @brief Header plus records keyed by column. Header names and cells are trimmed.
 */
struct CsvTable {
    std::vector<std::string> columns;
    std::vector<std::map<std::string, std::string>> records;
};

class CsvCodec {
public:
    static constexpr const char* kEntityColumn = "entity";
    static constexpr const char* kYearColumn = "year";

    /**
     * @brief Parses comma-separated text with RFC 4180 quoting.
     *
     * A leading UTF-8 BOM is stripped, blank lines are skipped, and columns with an
     * empty header are dropped. Short records are padded with empty cells.
     * @throws domain::ValidationError on empty input or an unterminated quote.
     */
    static CsvTable parse(const std::string& text);

    /** @brief Emits a header line and one line per record, quoting where needed. */
    static std::string write(const std::vector<std::string>& columns,
                             const std::vector<std::map<std::string, std::string>>& records);

    /**
     * @brief Turns a parsed table into dataset columns, rows and inferred types.
     *
     * Requires an `entity` column. A missing `year` column, or an empty year cell, is
     * filled from @p yearOverride; years are normalized to integers. Duplicate
     * (entity, year) pairs are rejected.
     * @throws domain::ValidationError
     */
    static domain::Dataset normalize(const CsvTable& table, std::optional<int> yearOverride);

    /** @brief Serializes dataset rows back to CSV in declared column order. */
    static std::string datasetToCsv(const domain::Dataset& dataset);

    /**
     * @brief CSV export of a result set: entity, year, score_raw, index_0_100, then
     *        per-dimension sub-scores and sub-indexes, then raw indicator values.
     */
    static std::string resultToCsv(const domain::ResultSet& result);

    /** @brief Formats a double with 12 significant digits. */
    static std::string formatNumber(double value);

private:
    static std::map<std::string, std::string> inferTypes(const std::vector<std::string>& columns,
                                                         const std::vector<std::map<std::string, std::string>>& records);
};

} // namespace indexforge::infrastructure
