/**
 * @file ResultSet.hpp
 * @brief Output of one aggregation run: scored rows plus row-level failures.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace indexforge::domain {

/**
 * @enum RowFailureCause
 * @brief Why a target row could not be scored.
 */
enum class RowFailureCause {
    MissingMapping,        ///< Indicator unmapped, or mapped column absent from the dataset.
    MissingValue,          ///< Cell empty or not numeric.
    DuplicateObservation   ///< (entity, year) already scored from an earlier dataset/row.
};

inline std::string RowFailureCauseToString(RowFailureCause c) {
    switch (c) {
        case RowFailureCause::MissingMapping: return "MissingMapping";
        case RowFailureCause::MissingValue: return "MissingValue";
        case RowFailureCause::DuplicateObservation: return "DuplicateObservation";
    }
    return "MissingValue";
}

inline std::optional<RowFailureCause> RowFailureCauseFromString(const std::string& s) {
    if (s == "MissingMapping") return RowFailureCause::MissingMapping;
    if (s == "MissingValue") return RowFailureCause::MissingValue;
    if (s == "DuplicateObservation") return RowFailureCause::DuplicateObservation;
    return std::nullopt;
}

struct RowIssue {
    std::string indicatorKey;   ///< Empty for row-wide causes (duplicates).
    RowFailureCause cause = RowFailureCause::MissingValue;
    std::string detail;
};

/**
 * @struct RowFailure
 * @brief A skipped row. Non-fatal: the run continues with the remaining rows.
 */
struct RowFailure {
    std::string datasetId;
    std::string entity;
    int year = 0;
    std::vector<RowIssue> issues;
};

struct FailureSummary {
    size_t failedRows = 0;
    std::map<std::string, size_t> byCause;  ///< RowFailureCause name -> number of failed rows.
};

/**
 * @struct ResultRow
 * @brief Scores of one (entity, year) plus the raw mapped values used to compute them.
 */
struct ResultRow {
    std::string entity;
    int year = 0;
    std::string datasetId;
    double scoreRaw = 0.0;
    double index0To100 = 0.0;
    std::map<std::string, double> subScoreRaw;   ///< dimension -> conditional raw sub-score.
    std::map<std::string, double> subindex;      ///< dimension -> 0-100 sub-index.
    std::map<std::string, double> rawValues;     ///< indicatorKey -> raw mapped value.
};

/**
 * @struct ResultSet
 * @brief Immutable once created; re-running aggregation produces a new id.
 */
struct ResultSet {
    std::string id;
    std::string name;
    std::string createdAt;
    std::vector<std::string> datasetIds;
    std::string weightModelId;
    std::vector<std::string> dimensionKeys;
    std::vector<std::string> indicatorKeys;
    std::vector<ResultRow> rows;
    std::vector<RowFailure> failures;
    FailureSummary failureSummary;
};

} // namespace indexforge::domain
