// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * NeoCat - Near-Earth object catalog loader
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#include "csv_handler.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "field_parser.hpp"

namespace neocat::catalog::io {

/**
 * @brief Internal implementation of CSV handler
 */
class CsvHandler::Impl {
public:
    /**
     * @brief Physical-line-independent record with its first source line
     */
    struct RawRecord {
        std::vector<std::string> fields;
        size_t line = 0;
    };

    /**
     * @brief Parse CSV line according to dialect
     *
     * A quote character opens a quoted field only at the start of a field;
     * elsewhere it is kept as data.
     *
     * @param line Input line to parse
     * @param dialect CSV dialect configuration
     * @param openQuote Set when the line ends inside a quoted field
     * @return Vector of field values
     */
    static auto parseLine(const std::string& line, const CsvDialect& dialect,
                          bool& openQuote) -> std::vector<std::string> {
        std::vector<std::string> fields;
        std::string field;
        bool inQuotes = false;
        bool atFieldStart = true;
        bool escapeNext = false;

        for (size_t i = 0; i < line.length(); ++i) {
            char c = line[i];

            if (escapeNext) {
                field += c;
                escapeNext = false;
                atFieldStart = false;
                continue;
            }

            if (dialect.escapechar != '\0' && c == dialect.escapechar) {
                escapeNext = true;
                continue;
            }

            if (inQuotes) {
                if (c != dialect.quotechar) {
                    field += c;
                } else if (dialect.doublequote && i + 1 < line.length() &&
                           line[i + 1] == dialect.quotechar) {
                    field += dialect.quotechar;
                    ++i;  // Skip next quote
                } else {
                    inQuotes = false;
                }
                continue;
            }

            if (c == dialect.delimiter) {
                fields.push_back(std::move(field));
                field.clear();
                atFieldStart = true;
                continue;
            }

            if (atFieldStart) {
                if (c == dialect.quotechar) {
                    inQuotes = true;
                    atFieldStart = false;
                    continue;
                }
                if (c == ' ' && dialect.skipinitialspace) {
                    continue;
                }
            }

            field += c;
            atFieldStart = false;
        }

        // Add last field
        fields.push_back(std::move(field));
        openQuote = inQuotes;
        return fields;
    }

    /**
     * @brief Read the next record, joining lines while a quote is open
     *
     * Blank lines between data records are skipped.
     *
     * @return Record, nullopt at end of input, or SourceReadError for a
     * quoted field still open at end of input
     */
    static auto readRecord(std::istream& input, const CsvDialect& dialect,
                           size_t& lineNum, bool isHeader)
        -> Result<std::optional<RawRecord>> {
        std::string line;
        do {
            if (!std::getline(input, line)) {
                return std::optional<RawRecord>{};
            }
            ++lineNum;
            normalizeLine(line, isHeader);
        } while (!isHeader && line.empty());

        RawRecord record;
        record.line = lineNum;
        bool openQuote = false;
        record.fields = parseLine(line, dialect, openQuote);

        while (openQuote) {
            std::string next;
            if (!std::getline(input, next)) {
                return makeSourceReadError(
                    "Unterminated quoted field starting at line " +
                    std::to_string(record.line));
            }
            ++lineNum;
            normalizeLine(next, false);
            line += '\n';
            line += next;
            record.fields = parseLine(line, dialect, openQuote);
        }

        if (isHeader && line.empty()) {
            record.fields.clear();
        }
        return std::optional<RawRecord>{std::move(record)};
    }

    /**
     * @brief Strip line terminator leftovers and a leading UTF-8 BOM
     */
    static void normalizeLine(std::string& line, bool isHeader) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (isHeader && line.starts_with("\xEF\xBB\xBF")) {
            line.erase(0, 3);
        }
    }
};

// ============================================================================
// CsvHandler Implementation
// ============================================================================

CsvHandler::CsvHandler() : impl_(std::make_unique<Impl>()) {}

CsvHandler::~CsvHandler() = default;

auto CsvHandler::read(const std::string& filename, const CsvDialect& dialect)
    -> Result<CsvTable> {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        return makeSourceReadError("Failed to open file: " + filename);
    }
    return readStream(file, dialect);
}

auto CsvHandler::readStream(std::istream& input, const CsvDialect& dialect)
    -> Result<CsvTable> {
    CsvTable table;
    size_t lineNum = 0;

    // Read header record
    auto header = Impl::readRecord(input, dialect, lineNum, true);
    if (!header) {
        return std::unexpected(header.error());
    }
    if (!header->has_value()) {
        return makeSourceReadError("Empty CSV file");
    }
    table.fieldnames = std::move((*header)->fields);
    if (table.fieldnames.empty()) {
        return makeSourceReadError("No field names in CSV header");
    }

    // Read data records
    while (true) {
        auto next = Impl::readRecord(input, dialect, lineNum, false);
        if (!next) {
            return std::unexpected(next.error());
        }
        if (!next->has_value()) {
            break;
        }
        auto& [fields, recordLine] = **next;

        // Handle field count mismatch
        if (fields.size() != table.fieldnames.size()) {
            if (dialect.strict) {
                return makeSourceReadError(
                    "Field count mismatch at line " +
                    std::to_string(recordLine) + ": expected " +
                    std::to_string(table.fieldnames.size()) + ", got " +
                    std::to_string(fields.size()));
            }
            // Pad with empty strings or truncate
            fields.resize(table.fieldnames.size());
        }

        // Create record dictionary
        CsvRecord record;
        for (size_t i = 0; i < table.fieldnames.size(); ++i) {
            record[table.fieldnames[i]] = std::move(fields[i]);
        }
        table.records.push_back(std::move(record));
        table.lineNumbers.push_back(recordLine);
    }

    if (input.bad()) {
        return makeSourceReadError("I/O error while reading CSV data");
    }

    return table;
}

auto CsvHandler::rowToNearEarthObject(const CsvRecord& row,
                                      const NeoColumnNames& columns)
    -> Result<model::NearEarthObject> {
    // Missing optional columns read as empty values
    auto getField = [&row](const std::string& key) -> std::string {
        auto it = row.find(key);
        return (it != row.end()) ? it->second : "";
    };

    model::NeoFields fields;
    fields.designation = getField(columns.designation);

    auto name = getField(columns.name);
    if (!name.empty()) {
        fields.name = std::move(name);
    }

    auto diameter = getField(columns.diameter);
    if (!diameter.empty()) {
        fields.diameter = parseNumber(diameter);
        if (!fields.diameter) {
            return makeValidationError("Non-numeric diameter '" + diameter +
                                       "' for designation '" +
                                       fields.designation + "'");
        }
    }

    fields.hazardous = parseHazardFlag(getField(columns.hazardous));

    return model::NearEarthObject::create(std::move(fields));
}

auto CsvHandler::extractNearEarthObjects(const CsvTable& table,
                                         const NeoColumnNames& columns)
    -> ImportOutcome<model::NearEarthObject> {
    if (std::find(table.fieldnames.begin(), table.fieldnames.end(),
                  columns.designation) == table.fieldnames.end()) {
        spdlog::warn("CsvHandler: Header has no designation column '{}'; "
                     "every record will be skipped",
                     columns.designation);
    }

    std::vector<model::NearEarthObject> objects;
    objects.reserve(table.records.size());
    std::unordered_set<std::string> seen;
    ImportResult stats;
    stats.totalRecords = static_cast<int>(table.records.size());

    for (size_t i = 0; i < table.records.size(); ++i) {
        auto objResult = rowToNearEarthObject(table.records[i], columns);
        if (!objResult) {
            size_t line = i < table.lineNumbers.size() ? table.lineNumbers[i]
                                                       : i + 2;
            auto message = "line " + std::to_string(line) + ": " +
                           objResult.error().describe();
            spdlog::warn("CsvHandler: Skipping NEO record at {}", message);
            ++stats.errorCount;
            stats.errors.push_back(std::move(message));
            continue;
        }

        if (!seen.insert(objResult->designation()).second) {
            ++stats.duplicateCount;
            spdlog::warn("CsvHandler: Duplicate designation '{}' kept as a "
                         "separate record",
                         objResult->designation());
        }
        objects.push_back(std::move(objResult.value()));
        ++stats.successCount;
    }

    return std::make_pair(std::move(objects), std::move(stats));
}

auto CsvHandler::importNearEarthObjects(const std::string& filename,
                                        const NeoColumnNames& columns,
                                        const CsvDialect& dialect)
    -> ImportOutcome<model::NearEarthObject> {
    auto readResult = read(filename, dialect);
    if (!readResult) {
        spdlog::error("CsvHandler: Cannot read NEO catalog {}: {}", filename,
                      readResult.error().message);
        return std::unexpected(readResult.error());
    }

    auto outcome = extractNearEarthObjects(readResult.value(), columns);
    if (outcome) {
        const auto& stats = outcome->second;
        spdlog::info("CsvHandler: Imported {} of {} NEO records from {} ({} "
                     "skipped)",
                     stats.successCount, stats.totalRecords, filename,
                     stats.errorCount);
    }
    return outcome;
}

}  // namespace neocat::catalog::io
