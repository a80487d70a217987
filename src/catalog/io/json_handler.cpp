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

#include "json_handler.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>

#include <spdlog/spdlog.h>

#include "field_parser.hpp"

namespace neocat::catalog::io {

/**
 * @brief Internal implementation of JSON handler
 */
class JsonHandler::Impl {
public:
    /**
     * @brief Read file with UTF-8 validation
     *
     * @param filename Path to file
     * @return File contents, or SourceReadError
     */
    static auto readFileWithUtf8(const std::string& filename)
        -> Result<std::string> {
        std::ifstream file(filename, std::ios::binary);
        if (!file.is_open()) {
            return makeSourceReadError("Failed to open file: " + filename);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            return makeSourceReadError("I/O error while reading " + filename);
        }
        return buffer.str();
    }

    /**
     * @brief Basic UTF-8 validation (check for valid UTF-8 sequences)
     *
     * @return Byte offset of the first invalid sequence, or nullopt
     */
    static auto findInvalidUtf8(const std::string& content)
        -> std::optional<size_t> {
        for (size_t i = 0; i < content.length(); ++i) {
            unsigned char c = content[i];
            size_t continuation = 0;
            if (c < 0x80) {
                continue;
            } else if ((c & 0xE0) == 0xC0) {
                continuation = 1;
            } else if ((c & 0xF0) == 0xE0) {
                continuation = 2;
            } else if ((c & 0xF8) == 0xF0) {
                continuation = 3;
            } else {
                return i;
            }
            if (i + continuation >= content.length()) {
                return i;
            }
            for (size_t k = 1; k <= continuation; ++k) {
                if ((content[i + k] & 0xC0) != 0x80) {
                    return i;
                }
            }
            i += continuation;
        }
        return std::nullopt;
    }

    /**
     * @brief Get a field as text
     *
     * Strings are returned as-is and numbers in their JSON spelling.
     *
     * @return Text value, or nullopt if absent, null or structured
     */
    static auto getString(const ApproachRecord& record, const std::string& key)
        -> std::optional<std::string> {
        auto it = record.find(key);
        if (it == record.end() || it->second.is_null()) {
            return std::nullopt;
        }
        if (it->second.is_string()) {
            return it->second.get<std::string>();
        }
        if (it->second.is_number()) {
            return it->second.dump();
        }
        return std::nullopt;
    }

    /**
     * @brief Get a required numeric field
     *
     * Accepts JSON numbers and numeric strings.
     */
    static auto getNumber(const ApproachRecord& record, const std::string& key)
        -> Result<double> {
        auto it = record.find(key);
        if (it == record.end() || it->second.is_null()) {
            return makeValidationError("Missing required field: " + key);
        }
        const auto& value = it->second;
        if (value.is_number()) {
            double number = value.get<double>();
            if (std::isfinite(number)) {
                return number;
            }
        } else if (value.is_string()) {
            if (auto number = parseNumber(value.get<std::string>())) {
                return *number;
            }
        }
        return makeValidationError("Non-numeric value " + value.dump() +
                                   " for field: " + key);
    }
};

// ============================================================================
// JsonHandler Implementation
// ============================================================================

JsonHandler::JsonHandler() : impl_(std::make_unique<Impl>()) {}

JsonHandler::~JsonHandler() = default;

auto JsonHandler::read(const std::string& filename) -> Result<json> {
    auto contentResult = Impl::readFileWithUtf8(filename);
    if (!contentResult) {
        return std::unexpected(contentResult.error());
    }
    return parse(contentResult.value());
}

auto JsonHandler::parse(const std::string& content) -> Result<json> {
    if (content.empty()) {
        return makeSourceReadError("File is empty");
    }
    if (auto offset = Impl::findInvalidUtf8(content)) {
        return makeSourceReadError("Invalid UTF-8 sequence at byte " +
                                   std::to_string(*offset));
    }

    try {
        return json::parse(content);
    } catch (const json::exception& ex) {
        return makeSourceReadError(std::string("JSON parse error: ") +
                                   ex.what());
    }
}

auto JsonHandler::validateFeedDocument(const json& document,
                                       const ApproachFieldNames& fields)
    -> Result<std::vector<std::string>> {
    if (!document.is_object()) {
        return makeSourceReadError("Expected a JSON object at top level");
    }
    if (!document.contains("fields") || !document["fields"].is_array()) {
        return makeSourceReadError("Missing or invalid 'fields' array");
    }
    if (!document.contains("data") || !document["data"].is_array()) {
        return makeSourceReadError("Missing or invalid 'data' array");
    }

    std::vector<std::string> manifest;
    manifest.reserve(document["fields"].size());
    for (const auto& name : document["fields"]) {
        if (!name.is_string()) {
            return makeSourceReadError("Non-string entry in 'fields': " +
                                       name.dump());
        }
        manifest.push_back(name.get<std::string>());
    }

    for (const auto* required :
         {&fields.designation, &fields.time, &fields.distance,
          &fields.velocity}) {
        if (std::find(manifest.begin(), manifest.end(), *required) ==
            manifest.end()) {
            spdlog::warn("JsonHandler: Field manifest has no '{}' column; "
                         "every row will be skipped",
                         *required);
        }
    }

    return manifest;
}

auto JsonHandler::zipRecord(const std::vector<std::string>& manifest,
                            const json& row) -> ApproachRecord {
    ApproachRecord record;
    size_t count = std::min(manifest.size(), row.size());
    for (size_t i = 0; i < count; ++i) {
        record[manifest[i]] = row[i];
    }
    return record;
}

auto JsonHandler::recordToCloseApproach(const ApproachRecord& record,
                                        const ApproachFieldNames& fields)
    -> Result<model::CloseApproach> {
    model::ApproachFields approach;

    auto designation = Impl::getString(record, fields.designation);
    if (!designation || designation->empty()) {
        return makeValidationError("Missing required field: " +
                                   fields.designation);
    }
    approach.designation = std::move(*designation);

    auto timeText = Impl::getString(record, fields.time);
    if (!timeText || timeText->empty()) {
        return makeValidationError("Missing required field: " + fields.time +
                                   " for designation '" +
                                   approach.designation + "'");
    }
    approach.time = std::move(*timeText);

    auto distance = Impl::getNumber(record, fields.distance);
    if (!distance) {
        return std::unexpected(distance.error());
    }
    approach.distance = *distance;

    auto velocity = Impl::getNumber(record, fields.velocity);
    if (!velocity) {
        return std::unexpected(velocity.error());
    }
    approach.velocity = *velocity;

    return model::CloseApproach::create(std::move(approach));
}

auto JsonHandler::extractCloseApproaches(const json& document,
                                         const ApproachFieldNames& fields)
    -> ImportOutcome<model::CloseApproach> {
    auto manifest = validateFeedDocument(document, fields);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }

    const auto& rows = document["data"];
    std::vector<model::CloseApproach> approaches;
    approaches.reserve(rows.size());
    ImportResult stats;
    stats.totalRecords = static_cast<int>(rows.size());

    auto skip = [&stats](size_t row, const CatalogError& error) {
        auto message = "row " + std::to_string(row) + ": " + error.describe();
        spdlog::warn("JsonHandler: Skipping approach record at {}", message);
        ++stats.errorCount;
        stats.errors.push_back(std::move(message));
    };

    for (size_t i = 0; i < rows.size(); ++i) {
        if (!rows[i].is_array()) {
            skip(i, CatalogError{ErrorKind::ValidationError,
                                 "Data row is not an array: " +
                                     rows[i].dump()});
            continue;
        }

        auto approachResult =
            recordToCloseApproach(zipRecord(*manifest, rows[i]), fields);
        if (!approachResult) {
            skip(i, approachResult.error());
            continue;
        }

        approaches.push_back(std::move(approachResult.value()));
        ++stats.successCount;
    }

    return std::make_pair(std::move(approaches), std::move(stats));
}

auto JsonHandler::importCloseApproaches(const std::string& filename,
                                        const ApproachFieldNames& fields)
    -> ImportOutcome<model::CloseApproach> {
    auto readResult = read(filename);
    if (!readResult) {
        spdlog::error("JsonHandler: Cannot read approach feed {}: {}",
                      filename, readResult.error().message);
        return std::unexpected(readResult.error());
    }

    auto outcome = extractCloseApproaches(readResult.value(), fields);
    if (!outcome) {
        spdlog::error("JsonHandler: Invalid approach feed {}: {}", filename,
                      outcome.error().message);
        return outcome;
    }

    const auto& stats = outcome->second;
    spdlog::info("JsonHandler: Imported {} of {} approach records from {} ({} "
                 "skipped)",
                 stats.successCount, stats.totalRecords, filename,
                 stats.errorCount);
    return outcome;
}

}  // namespace neocat::catalog::io
