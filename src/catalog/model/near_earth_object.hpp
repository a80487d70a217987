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

#ifndef NEOCAT_CATALOG_MODEL_NEAR_EARTH_OBJECT_HPP
#define NEOCAT_CATALOG_MODEL_NEAR_EARTH_OBJECT_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../error.hpp"

namespace neocat::catalog::repository {
class ApproachLinker;
}  // namespace neocat::catalog::repository

namespace neocat::catalog::model {

class CloseApproach;

/**
 * @brief Named construction fields for a near-Earth object
 *
 * Every field except the designation may be absent in the source feed.
 */
struct NeoFields {
    std::string designation;          ///< Primary designation (required)
    std::optional<std::string> name;  ///< IAU name, unset if unnamed
    std::optional<double> diameter;   ///< Diameter in km, unset if unknown
    bool hazardous = false;           ///< Potentially hazardous flag
};

/**
 * @brief A near-Earth object with its linked close approaches
 *
 * Instances are immutable after construction except for the approach list,
 * which is populated once by the linkage step. The approach pointers are
 * non-owning; the approach collection owns the approaches.
 */
class NearEarthObject {
public:
    /**
     * @brief Validate fields and construct an object
     *
     * An empty name is normalized to unset.
     *
     * @param fields Construction fields
     * @return Object, or ValidationError if the designation is empty
     */
    [[nodiscard]] static auto create(NeoFields fields)
        -> Result<NearEarthObject>;

    [[nodiscard]] const std::string& designation() const {
        return designation_;
    }

    [[nodiscard]] const std::optional<std::string>& name() const {
        return name_;
    }

    [[nodiscard]] const std::optional<double>& diameter() const {
        return diameter_;
    }

    /**
     * @brief Diameter in kilometers, quiet NaN when unknown
     */
    [[nodiscard]] auto diameterKm() const -> double;

    [[nodiscard]] bool hazardous() const { return hazardous_; }

    /**
     * @brief Close approaches linked to this object, in feed order
     */
    [[nodiscard]] const std::vector<const CloseApproach*>& approaches() const {
        return approaches_;
    }

    /**
     * @brief "{designation}" or "{designation} ({name})"
     */
    [[nodiscard]] auto fullname() const -> std::string;

    /**
     * @brief Human-readable description
     */
    [[nodiscard]] auto toString() const -> std::string;

    /**
     * @brief Machine-oriented description listing every field
     */
    [[nodiscard]] auto repr() const -> std::string;

    /**
     * @brief Flat record for external writers
     *
     * Keys: designation, name ("" when unnamed), diameter_km (NaN when
     * unknown), potentially_hazardous.
     */
    [[nodiscard]] auto serialize() const -> nlohmann::json;

private:
    friend class repository::ApproachLinker;

    explicit NearEarthObject(NeoFields fields);

    std::string designation_;
    std::optional<std::string> name_;
    std::optional<double> diameter_;
    bool hazardous_ = false;
    std::vector<const CloseApproach*> approaches_;
};

auto operator<<(std::ostream& os, const NearEarthObject& neo) -> std::ostream&;

}  // namespace neocat::catalog::model

#endif  // NEOCAT_CATALOG_MODEL_NEAR_EARTH_OBJECT_HPP
