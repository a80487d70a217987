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

#ifndef NEOCAT_CATALOG_IO_CSV_HANDLER_HPP
#define NEOCAT_CATALOG_IO_CSV_HANDLER_HPP

#include <istream>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../error.hpp"
#include "../model/near_earth_object.hpp"

namespace neocat::catalog::io {

/**
 * @brief CSV dialect configuration for handling different CSV formats
 */
struct CsvDialect {
    char delimiter = ',';           ///< Field separator character
    char quotechar = '"';           ///< Quote character
    char escapechar = '\0';         ///< Escape character, '\0' disables
    bool doublequote = true;        ///< Whether to double quote characters
    bool skipinitialspace = false;  ///< Skip spaces after delimiter
    bool strict = false;            ///< Reject rows with a wrong field count

    /**
     * @brief Parameterized constructor
     *
     * @param delim Field delimiter character
     * @param quote Quote character
     * @param escape Escape character
     * @param dquote Whether to double quotes in fields
     * @param skipspace Whether to skip spaces after delimiter
     * @param strict_mode Strict mode validation
     */
    CsvDialect(char delim, char quote, char escape, bool dquote, bool skipspace,
               bool strict_mode)
        : delimiter(delim),
          quotechar(quote),
          escapechar(escape),
          doublequote(dquote),
          skipinitialspace(skipspace),
          strict(strict_mode) {}

    CsvDialect() = default;
};

/**
 * @brief Column names of the NEO catalog feed
 */
struct NeoColumnNames {
    std::string designation = "pdes";  ///< Primary designation
    std::string name = "name";          ///< IAU name
    std::string diameter = "diameter";  ///< Diameter in km
    std::string hazardous = "pha";      ///< Potentially hazardous flag
};

using CsvRecord = std::unordered_map<std::string, std::string>;

/**
 * @brief Parsed CSV content keyed by header names
 */
struct CsvTable {
    std::vector<std::string> fieldnames;  ///< Header row
    std::vector<CsvRecord> records;       ///< Data rows in file order
    std::vector<size_t> lineNumbers;      ///< Source line of each record
};

/**
 * @brief Result statistics for import operations
 */
struct ImportResult {
    int totalRecords = 0;             ///< Total records encountered
    int successCount = 0;             ///< Successfully imported
    int errorCount = 0;               ///< Records skipped with errors
    int duplicateCount = 0;           ///< Records repeating a designation
    std::vector<std::string> errors;  ///< Detailed error messages
};

template <typename T>
using ImportOutcome = Result<std::pair<std::vector<T>, ImportResult>>;

/**
 * @brief CSV handler for reading the near-Earth object catalog
 *
 * Reads CSV files with configurable dialects and converts records into
 * NearEarthObject instances. A malformed record is skipped and reported;
 * it never aborts the import of the remaining records.
 */
class CsvHandler {
public:
    /**
     * @brief Default constructor
     */
    CsvHandler();

    /**
     * @brief Destructor
     */
    ~CsvHandler();

    /**
     * @brief Read CSV file into header-keyed records
     *
     * @param filename Path to the CSV file
     * @param dialect CSV dialect configuration
     * @return Parsed table, or SourceReadError
     */
    [[nodiscard]] auto read(const std::string& filename,
                            const CsvDialect& dialect = {})
        -> Result<CsvTable>;

    /**
     * @brief Read CSV content from a stream
     *
     * @param input Stream positioned at the header row
     * @param dialect CSV dialect configuration
     * @return Parsed table, or SourceReadError
     */
    [[nodiscard]] auto readStream(std::istream& input,
                                  const CsvDialect& dialect = {})
        -> Result<CsvTable>;

    /**
     * @brief Import near-Earth objects from a CSV file
     *
     * @param filename Path to the CSV file
     * @param columns Column names of the feed
     * @param dialect CSV dialect configuration
     * @return Objects in file order with import statistics, or
     * SourceReadError when the file itself cannot be used
     */
    [[nodiscard]] auto importNearEarthObjects(
        const std::string& filename, const NeoColumnNames& columns = {},
        const CsvDialect& dialect = {}) -> ImportOutcome<model::NearEarthObject>;

    /**
     * @brief Convert already-read CSV records into near-Earth objects
     *
     * @param table Parsed CSV table
     * @param columns Column names of the feed
     * @return Objects in record order with import statistics. A missing
     * column only fails the records that need it.
     */
    [[nodiscard]] static auto extractNearEarthObjects(
        const CsvTable& table, const NeoColumnNames& columns = {})
        -> ImportOutcome<model::NearEarthObject>;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    /**
     * @brief Convert field dictionary to NearEarthObject
     *
     * @param row Field dictionary from CSV
     * @param columns Column names of the feed
     * @return Object, or the per-record error
     */
    [[nodiscard]] static auto rowToNearEarthObject(const CsvRecord& row,
                                                   const NeoColumnNames& columns)
        -> Result<model::NearEarthObject>;
};

}  // namespace neocat::catalog::io

#endif  // NEOCAT_CATALOG_IO_CSV_HANDLER_HPP
