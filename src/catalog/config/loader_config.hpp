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

#ifndef NEOCAT_CATALOG_CONFIG_LOADER_CONFIG_HPP
#define NEOCAT_CATALOG_CONFIG_LOADER_CONFIG_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "../error.hpp"
#include "../io/csv_handler.hpp"
#include "../io/json_handler.hpp"
#include "utils/logging/spdlog_config.hpp"

namespace neocat::catalog::config {

/**
 * @brief Settings for loading both feeds
 *
 * Every section is optional in the JSON form; absent keys keep their
 * defaults, which match the public NASA/JPL feed layouts.
 *
 * @code
 * {
 *   "csv": {"delimiter": ",", "quotechar": "\"", "strict": false},
 *   "neo_columns": {"designation": "pdes", "hazardous": "pha"},
 *   "approach_fields": {"time": "cd"},
 *   "logging": {"level": "info", "console": true, "file": false}
 * }
 * @endcode
 */
struct LoaderConfig {
    io::CsvDialect dialect;
    io::NeoColumnNames neoColumns;
    io::ApproachFieldNames approachFields;
    neocat::logging::LoggerConfig logging;

    /**
     * @brief Install the "logging" section as the process-wide spdlog setup
     *
     * NeoCatalog::load and the handlers only log through the default
     * logger; they never change it. Call this once at startup.
     */
    void applyLogging() const;

    /**
     * @brief Serialize to JSON
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Deserialize from JSON
     *
     * @param j JSON object
     * @return Configuration, or ConfigurationError for a wrongly typed or
     * empty value
     */
    static auto fromJson(const nlohmann::json& j) -> Result<LoaderConfig>;

    /**
     * @brief Load configuration from a JSON file
     *
     * @param path Path to the configuration file
     * @return Configuration, or ConfigurationError
     */
    static auto loadFromFile(const std::string& path) -> Result<LoaderConfig>;
};

}  // namespace neocat::catalog::config

#endif  // NEOCAT_CATALOG_CONFIG_LOADER_CONFIG_HPP
