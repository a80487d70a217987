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

#ifndef NEOCAT_CATALOG_MODEL_CLOSE_APPROACH_HPP
#define NEOCAT_CATALOG_MODEL_CLOSE_APPROACH_HPP

#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "../error.hpp"
#include "../time/approach_time.hpp"

namespace neocat::catalog::repository {
class ApproachLinker;
}  // namespace neocat::catalog::repository

namespace neocat::catalog::model {

class NearEarthObject;

/**
 * @brief Named construction fields for a close approach
 */
struct ApproachFields {
    std::string designation;         ///< Designation of the approaching NEO
    std::string time;                ///< Raw date-time string (required)
    std::optional<double> distance;  ///< Nominal distance in au
    std::optional<double> velocity;  ///< Relative velocity in km/s
};

/**
 * @brief A recorded close approach to Earth by a near-Earth object
 *
 * The designation is kept only so the linkage step can find the owning
 * object. The NEO pointer is non-owning and stays null until linkage.
 */
class CloseApproach {
public:
    /**
     * @brief Validate fields and construct an approach
     *
     * @param fields Construction fields
     * @return Approach, FormatError for an unparsable time, or
     * ValidationError for a missing designation or time
     */
    [[nodiscard]] static auto create(ApproachFields fields)
        -> Result<CloseApproach>;

    [[nodiscard]] const std::string& designation() const {
        return designation_;
    }

    [[nodiscard]] catalog::time::Instant time() const { return time_; }

    /**
     * @brief Approach time as "YYYY-MM-DD HH:MM"
     */
    [[nodiscard]] auto timeStr() const -> std::string;

    [[nodiscard]] const std::optional<double>& distance() const {
        return distance_;
    }

    [[nodiscard]] const std::optional<double>& velocity() const {
        return velocity_;
    }

    /// Distance in au, quiet NaN when unknown
    [[nodiscard]] auto distanceAu() const -> double;

    /// Velocity in km/s, quiet NaN when unknown
    [[nodiscard]] auto velocityKmS() const -> double;

    /**
     * @brief Linked object, or nullptr before linkage or when the object
     * is not in the loaded catalog
     */
    [[nodiscard]] const NearEarthObject* neo() const { return neo_; }

    /**
     * @brief Human-readable description
     *
     * @throws std::logic_error if called before the approach is linked
     */
    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] auto repr() const -> std::string;

    /**
     * @brief Flat record for external writers
     *
     * Keys: datetime_utc, distance_au, velocity_km_s. The linked object is
     * not included.
     */
    [[nodiscard]] auto serialize() const -> nlohmann::json;

private:
    friend class repository::ApproachLinker;

    CloseApproach(std::string designation, catalog::time::Instant instant,
                  std::optional<double> distance,
                  std::optional<double> velocity);

    std::string designation_;
    catalog::time::Instant time_;
    std::optional<double> distance_;
    std::optional<double> velocity_;
    const NearEarthObject* neo_ = nullptr;
};

auto operator<<(std::ostream& os, const CloseApproach& approach)
    -> std::ostream&;

}  // namespace neocat::catalog::model

#endif  // NEOCAT_CATALOG_MODEL_CLOSE_APPROACH_HPP
