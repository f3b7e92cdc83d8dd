/**
 * @file CsvCodec.cpp
 * @brief Implementation of CsvCodec.
 */

#include "infrastructure/CsvCodec.hpp"

#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

#include "domain/Errors.hpp"

namespace indexforge::infrastructure {

using namespace indexforge::domain;

namespace {

std::string Trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool IsBlankRecord(const std::vector<std::string>& fields) {
    for (const auto& f : fields) {
        if (!f.empty()) return false;
    }
    return true;
}

std::string Quote(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::optional<int> ParseYear(const std::string& text) {
    auto value = ParseNumericCell(text);
    if (!value || std::fabs(*value) > 1e9) return std::nullopt;
    return static_cast<int>(*value);
}

} // namespace

CsvTable CsvCodec::parse(const std::string& input) {
    std::string text = input;
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
        text.erase(0, 3);
    }
    if (Trim(text).empty()) {
        throw ValidationError("CSV is empty");
    }

    std::vector<std::vector<std::string>> lines;
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        if (c == '"') {
            inQuotes = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
            fields.push_back(field);
            field.clear();
            if (!IsBlankRecord(fields)) lines.push_back(fields);
            fields.clear();
        } else {
            field += c;
        }
    }
    if (inQuotes) {
        throw ValidationError("CSV has an unterminated quoted field");
    }
    fields.push_back(field);
    if (!IsBlankRecord(fields)) lines.push_back(fields);

    if (lines.empty()) {
        throw ValidationError("CSV is missing its header line");
    }

    // Header: keep non-empty names with their source position.
    CsvTable table;
    std::vector<std::pair<size_t, std::string>> header;
    std::set<std::string> seen;
    for (size_t i = 0; i < lines[0].size(); ++i) {
        std::string name = Trim(lines[0][i]);
        if (name.empty()) continue;
        if (!seen.insert(name).second) {
            throw ValidationError("CSV header repeats column '" + name + "'");
        }
        header.emplace_back(i, name);
        table.columns.push_back(name);
    }
    if (table.columns.empty()) {
        throw ValidationError("CSV is missing its header line");
    }

    for (size_t r = 1; r < lines.size(); ++r) {
        const auto& line = lines[r];
        std::map<std::string, std::string> record;
        for (const auto& [pos, name] : header) {
            record[name] = pos < line.size() ? Trim(line[pos]) : "";
        }
        table.records.push_back(std::move(record));
    }
    return table;
}

std::string CsvCodec::write(const std::vector<std::string>& columns,
                            const std::vector<std::map<std::string, std::string>>& records) {
    std::ostringstream out;
    for (size_t i = 0; i < columns.size(); ++i) {
        out << (i ? "," : "") << Quote(columns[i]);
    }
    out << "\n";
    for (const auto& record : records) {
        for (size_t i = 0; i < columns.size(); ++i) {
            auto it = record.find(columns[i]);
            out << (i ? "," : "") << Quote(it == record.end() ? "" : it->second);
        }
        out << "\n";
    }
    return out.str();
}

Dataset CsvCodec::normalize(const CsvTable& table, std::optional<int> yearOverride) {
    auto hasColumn = [&](const std::string& name) {
        for (const auto& c : table.columns) {
            if (c == name) return true;
        }
        return false;
    };

    if (!hasColumn(kEntityColumn)) {
        throw ValidationError("CSV must contain an 'entity' column");
    }

    Dataset dataset;
    if (hasColumn(kYearColumn)) {
        dataset.columns = table.columns;
    } else {
        if (!yearOverride) {
            throw ValidationError("CSV has no 'year' column; provide a year for the import");
        }
        dataset.columns = {kEntityColumn, kYearColumn};
        for (const auto& c : table.columns) {
            if (c != kEntityColumn) dataset.columns.push_back(c);
        }
    }

    std::vector<std::map<std::string, std::string>> normalized;
    std::set<std::pair<std::string, int>> seen;
    std::vector<std::string> duplicates;

    for (const auto& record : table.records) {
        auto entityIt = record.find(kEntityColumn);
        const std::string entity = entityIt == record.end() ? "" : entityIt->second;
        if (entity.empty()) {
            throw ValidationError("CSV has a row with an empty entity");
        }

        auto yearIt = record.find(kYearColumn);
        const std::string yearText = yearIt == record.end() ? "" : yearIt->second;
        int year = 0;
        if (yearText.empty()) {
            if (!yearOverride) {
                throw ValidationError("CSV has an empty year for entity '" + entity + "'");
            }
            year = *yearOverride;
        } else {
            auto parsed = ParseYear(yearText);
            if (!parsed) {
                throw ValidationError("Year is not numeric: " + yearText);
            }
            year = *parsed;
        }

        if (!seen.insert({entity, year}).second && duplicates.size() < 5) {
            duplicates.push_back("(" + entity + "," + std::to_string(year) + ")");
        }

        DatasetRow row;
        row.entity = entity;
        row.year = year;
        auto flat = record;
        flat[kYearColumn] = std::to_string(year);
        for (const auto& c : dataset.columns) {
            if (c == kEntityColumn || c == kYearColumn) continue;
            auto it = record.find(c);
            row.cells[c] = it == record.end() ? "" : it->second;
        }
        normalized.push_back(std::move(flat));
        dataset.rows.push_back(std::move(row));
    }

    if (!duplicates.empty()) {
        std::string examples;
        for (const auto& d : duplicates) examples += (examples.empty() ? "" : ", ") + d;
        throw ValidationError("Duplicate entity+year rows (e.g. " + examples + ")");
    }

    dataset.columnTypes = inferTypes(dataset.columns, normalized);
    return dataset;
}

std::map<std::string, std::string> CsvCodec::inferTypes(const std::vector<std::string>& columns,
                                                        const std::vector<std::map<std::string, std::string>>& records) {
    std::map<std::string, std::string> types;
    for (const auto& column : columns) {
        bool any = false;
        bool numeric = true;
        for (const auto& record : records) {
            auto it = record.find(column);
            if (it == record.end() || it->second.empty()) continue;
            any = true;
            if (!ParseNumericCell(it->second)) {
                numeric = false;
                break;
            }
        }
        if (!any || !numeric) {
            types[column] = "string";
        } else {
            types[column] = column == kYearColumn ? "int" : "number";
        }
    }
    return types;
}

std::string CsvCodec::datasetToCsv(const Dataset& dataset) {
    std::vector<std::map<std::string, std::string>> records;
    records.reserve(dataset.rows.size());
    for (const auto& row : dataset.rows) {
        auto record = row.cells;
        record[kEntityColumn] = row.entity;
        record[kYearColumn] = std::to_string(row.year);
        records.push_back(std::move(record));
    }
    return write(dataset.columns, records);
}

std::string CsvCodec::formatNumber(double value) {
    std::ostringstream out;
    out << std::setprecision(12) << value;
    return out.str();
}

std::string CsvCodec::resultToCsv(const ResultSet& result) {
    std::vector<std::string> columns = {"entity", "year", "score_raw", "index_0_100"};
    for (const auto& dim : result.dimensionKeys) {
        columns.push_back("sub_score_raw." + dim);
        columns.push_back("subindex." + dim + "_0_100");
    }
    for (const auto& key : result.indicatorKeys) {
        columns.push_back("raw." + key);
    }

    std::vector<std::map<std::string, std::string>> records;
    records.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        std::map<std::string, std::string> record;
        record["entity"] = row.entity;
        record["year"] = std::to_string(row.year);
        record["score_raw"] = formatNumber(row.scoreRaw);
        record["index_0_100"] = formatNumber(row.index0To100);
        for (const auto& dim : result.dimensionKeys) {
            auto raw = row.subScoreRaw.find(dim);
            auto idx = row.subindex.find(dim);
            record["sub_score_raw." + dim] = raw == row.subScoreRaw.end() ? "" : formatNumber(raw->second);
            record["subindex." + dim + "_0_100"] = idx == row.subindex.end() ? "" : formatNumber(idx->second);
        }
        for (const auto& key : result.indicatorKeys) {
            auto v = row.rawValues.find(key);
            record["raw." + key] = v == row.rawValues.end() ? "" : formatNumber(v->second);
        }
        records.push_back(std::move(record));
    }
    return write(columns, records);
}

} // namespace indexforge::infrastructure
