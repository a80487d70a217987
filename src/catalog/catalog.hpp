// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file catalog.hpp
 * @brief Aggregated header for the NEO catalog loader.
 *
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2024 Max Qian
 */

#ifndef NEOCAT_CATALOG_HPP
#define NEOCAT_CATALOG_HPP

#include "config/loader_config.hpp"
#include "error.hpp"
#include "io/io.hpp"
#include "model/model.hpp"
#include "repository/approach_linker.hpp"
#include "repository/neo_catalog.hpp"
#include "time/approach_time.hpp"

#endif  // NEOCAT_CATALOG_HPP
