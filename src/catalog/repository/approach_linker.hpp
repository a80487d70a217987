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

#ifndef NEOCAT_CATALOG_REPOSITORY_APPROACH_LINKER_HPP
#define NEOCAT_CATALOG_REPOSITORY_APPROACH_LINKER_HPP

#include <string>
#include <unordered_map>
#include <vector>

#include "../model/close_approach.hpp"
#include "../model/near_earth_object.hpp"

namespace neocat::catalog::repository {

/**
 * @brief Counters reported by a linkage pass
 */
struct LinkStats {
    size_t linked = 0;                 ///< Approaches attached to an object
    size_t unlinked = 0;               ///< Approaches with no loaded object
    size_t duplicateDesignations = 0;  ///< Objects shadowed in the index
};

/**
 * @brief Joins close approaches to near-Earth objects by designation
 *
 * The only code allowed to write the link fields of both entity types.
 * Both collections must be final before linking: the links are raw
 * pointers into the vectors' storage.
 */
class ApproachLinker {
public:
    using Index = std::unordered_map<std::string, model::NearEarthObject*>;

    /**
     * @brief Build the designation index
     *
     * Later objects replace earlier ones with the same designation.
     *
     * @param objects Object collection
     * @param stats Receives the duplicate count
     */
    [[nodiscard]] static auto buildIndex(
        std::vector<model::NearEarthObject>& objects, LinkStats& stats)
        -> Index;

    /**
     * @brief Link every approach to its object, in approach order
     *
     * Existing links are cleared first. An approach whose designation is
     * not indexed is left unlinked and stays in its collection.
     *
     * @param objects Object collection
     * @param approaches Approach collection
     * @return Linkage counters
     */
    static auto link(std::vector<model::NearEarthObject>& objects,
                     std::vector<model::CloseApproach>& approaches)
        -> LinkStats;
};

/**
 * @brief Convenience wrapper for ApproachLinker::link
 */
inline auto link(std::vector<model::NearEarthObject>& objects,
                 std::vector<model::CloseApproach>& approaches) -> LinkStats {
    return ApproachLinker::link(objects, approaches);
}

}  // namespace neocat::catalog::repository

#endif  // NEOCAT_CATALOG_REPOSITORY_APPROACH_LINKER_HPP
