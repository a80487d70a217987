// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file io.hpp
 * @brief Aggregated header for catalog IO module.
 *
 * Include this file to get access to the CSV and JSON feed handlers.
 *
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2024 Max Qian
 */

#ifndef NEOCAT_CATALOG_IO_MODULE_HPP
#define NEOCAT_CATALOG_IO_MODULE_HPP

#include "csv_handler.hpp"
#include "field_parser.hpp"
#include "json_handler.hpp"

/**
 * @brief Catalog IO Module
 *
 * Usage:
 * @code
 * using namespace neocat::catalog::io;
 *
 * CsvHandler csvHandler;
 * auto [objects, stats] =
 *     csvHandler.importNearEarthObjects("neos.csv").value();
 *
 * JsonHandler jsonHandler;
 * auto [approaches, feedStats] =
 *     jsonHandler.importCloseApproaches("cad.json").value();
 * @endcode
 */

namespace neocat::catalog::io {

/**
 * @brief Create a CSV handler instance
 * @return CsvHandler instance
 */
inline auto createCsvHandler() -> CsvHandler { return CsvHandler(); }

/**
 * @brief Create a JSON handler instance
 * @return JsonHandler instance
 */
inline auto createJsonHandler() -> JsonHandler { return JsonHandler(); }

}  // namespace neocat::catalog::io

#endif  // NEOCAT_CATALOG_IO_MODULE_HPP
