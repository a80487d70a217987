// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file model.hpp
 * @brief Aggregated header for catalog model module.
 *
 * Include this file to get access to the near-Earth object and close
 * approach entity types.
 *
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2024 Max Qian
 */

#ifndef NEOCAT_CATALOG_MODEL_HPP
#define NEOCAT_CATALOG_MODEL_HPP

#include "close_approach.hpp"
#include "near_earth_object.hpp"

namespace neocat::catalog::model {

/**
 * @brief Model module version.
 */
inline constexpr const char* MODEL_MODULE_VERSION = "1.0.0";

/**
 * @brief Get model module version string.
 * @return Version string.
 */
[[nodiscard]] inline const char* getModelModuleVersion() noexcept {
    return MODEL_MODULE_VERSION;
}

}  // namespace neocat::catalog::model

#endif  // NEOCAT_CATALOG_MODEL_HPP
