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

#ifndef NEOCAT_CATALOG_REPOSITORY_NEO_CATALOG_HPP
#define NEOCAT_CATALOG_REPOSITORY_NEO_CATALOG_HPP

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../config/loader_config.hpp"
#include "../error.hpp"
#include "../io/csv_handler.hpp"
#include "../model/close_approach.hpp"
#include "../model/near_earth_object.hpp"
#include "approach_linker.hpp"

namespace neocat::catalog::repository {

/**
 * @brief Linked, read-only collection of near-Earth objects and approaches
 *
 * Owns both entity collections. Construction links them once; afterwards
 * the collections never change, so the cross-links and the lookup indexes
 * stay valid for the lifetime of the catalog (moves included).
 *
 * @note Not copyable: a copy would hold entities whose links point into
 * the original's storage.
 */
class NeoCatalog {
public:
    /**
     * @brief Take ownership of both collections and link them
     *
     * @param objects Near-Earth objects in feed order
     * @param approaches Close approaches in feed order
     */
    NeoCatalog(std::vector<model::NearEarthObject> objects,
               std::vector<model::CloseApproach> approaches);

    NeoCatalog(const NeoCatalog&) = delete;
    auto operator=(const NeoCatalog&) -> NeoCatalog& = delete;
    NeoCatalog(NeoCatalog&&) noexcept = default;
    auto operator=(NeoCatalog&&) noexcept -> NeoCatalog& = default;
    ~NeoCatalog() = default;

    /**
     * @brief Load both feeds and link them
     *
     * Malformed records are skipped and counted in objectImport() and
     * approachImport().
     *
     * @param neoCsvPath Path to the NEO catalog CSV
     * @param approachJsonPath Path to the close-approach JSON feed
     * @param config Dialect and field-name settings. The logging section is
     * not applied here; see LoaderConfig::applyLogging.
     * @return Linked catalog, or the first SourceReadError
     */
    [[nodiscard]] static auto load(const std::string& neoCsvPath,
                                   const std::string& approachJsonPath,
                                   const config::LoaderConfig& config = {})
        -> Result<NeoCatalog>;

    /**
     * @brief Find an object by primary designation
     * @return Object, or nullptr
     */
    [[nodiscard]] auto findByDesignation(std::string_view designation) const
        -> const model::NearEarthObject*;

    /**
     * @brief Find an object by IAU name (exact match)
     * @return Object, or nullptr
     */
    [[nodiscard]] auto findByName(std::string_view name) const
        -> const model::NearEarthObject*;

    [[nodiscard]] auto objects() const
        -> const std::vector<model::NearEarthObject>& {
        return objects_;
    }
    [[nodiscard]] auto approaches() const
        -> const std::vector<model::CloseApproach>& {
        return approaches_;
    }
    [[nodiscard]] auto linkStats() const -> const LinkStats& {
        return linkStats_;
    }

    /// Statistics of the CSV import; zero when built from vectors
    [[nodiscard]] auto objectImport() const -> const io::ImportResult& {
        return objectImport_;
    }
    /// Statistics of the JSON import; zero when built from vectors
    [[nodiscard]] auto approachImport() const -> const io::ImportResult& {
        return approachImport_;
    }

private:
    using LookupIndex =
        std::unordered_map<std::string, const model::NearEarthObject*>;

    void buildLookupIndexes();

    std::vector<model::NearEarthObject> objects_;
    std::vector<model::CloseApproach> approaches_;
    LookupIndex byDesignation_;
    LookupIndex byName_;
    LinkStats linkStats_;
    io::ImportResult objectImport_;
    io::ImportResult approachImport_;
};

}  // namespace neocat::catalog::repository

#endif  // NEOCAT_CATALOG_REPOSITORY_NEO_CATALOG_HPP
