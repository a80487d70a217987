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

#ifndef NEOCAT_CATALOG_IO_JSON_HANDLER_HPP
#define NEOCAT_CATALOG_IO_JSON_HANDLER_HPP

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "../error.hpp"
#include "../model/close_approach.hpp"
#include "csv_handler.hpp"

using json = nlohmann::json;

namespace neocat::catalog::io {

/**
 * @brief Field names of the close-approach feed
 */
struct ApproachFieldNames {
    std::string designation = "des";  ///< Designation of the NEO
    std::string time = "cd";          ///< Approach date-time string
    std::string distance = "dist";    ///< Nominal distance in au
    std::string velocity = "v_rel";   ///< Relative velocity in km/s
};

/// One data row zipped against the field manifest
using ApproachRecord = std::unordered_map<std::string, json>;

/**
 * @brief JSON handler for the column-oriented close-approach feed
 *
 * The feed separates schema from data: a "fields" array names the columns
 * and a "data" array holds one positional value array per approach. Each
 * row is zipped against the manifest before any field is accessed.
 */
class JsonHandler {
public:
    /**
     * @brief Default constructor
     */
    JsonHandler();

    /**
     * @brief Destructor
     */
    ~JsonHandler();

    /**
     * @brief Read JSON data from file
     *
     * @param filename Path to the JSON file
     * @return Parsed document, or SourceReadError
     */
    [[nodiscard]] auto read(const std::string& filename) -> Result<json>;

    /**
     * @brief Parse JSON data held in memory
     *
     * @param content Raw JSON text
     * @return Parsed document, or SourceReadError
     */
    [[nodiscard]] auto parse(const std::string& content) -> Result<json>;

    /**
     * @brief Import close approaches from a JSON file
     *
     * @param filename Path to the JSON file
     * @param fields Field names of the feed
     * @return Approaches in file order with import statistics, or
     * SourceReadError when the file itself cannot be used
     */
    [[nodiscard]] auto importCloseApproaches(
        const std::string& filename, const ApproachFieldNames& fields = {})
        -> ImportOutcome<model::CloseApproach>;

    /**
     * @brief Convert a parsed feed document into close approaches
     *
     * None of the returned approaches is linked to an object.
     *
     * @param document Parsed feed with "fields" and "data" arrays
     * @param fields Field names of the feed
     * @return Approaches in row order with import statistics, or
     * SourceReadError if the document lacks the "fields" or "data" array.
     * A manifest without one of the configured fields fails every row, not
     * the document.
     */
    [[nodiscard]] static auto extractCloseApproaches(
        const json& document, const ApproachFieldNames& fields = {})
        -> ImportOutcome<model::CloseApproach>;

    /**
     * @brief Zip one positional row against the field manifest
     *
     * Values past the end of a short row are absent; extra values are
     * ignored.
     */
    [[nodiscard]] static auto zipRecord(const std::vector<std::string>& manifest,
                                        const json& row) -> ApproachRecord;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    /**
     * @brief Check the top-level feed shape and extract the manifest
     */
    [[nodiscard]] static auto validateFeedDocument(
        const json& document, const ApproachFieldNames& fields)
        -> Result<std::vector<std::string>>;

    /**
     * @brief Convert a named record to CloseApproach
     *
     * @param record Zipped record
     * @param fields Field names of the feed
     * @return Approach, or the per-record error
     */
    [[nodiscard]] static auto recordToCloseApproach(
        const ApproachRecord& record, const ApproachFieldNames& fields)
        -> Result<model::CloseApproach>;
};

}  // namespace neocat::catalog::io

#endif  // NEOCAT_CATALOG_IO_JSON_HANDLER_HPP
