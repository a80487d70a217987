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

#include "close_approach.hpp"

#include <limits>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "near_earth_object.hpp"

namespace neocat::catalog::model {

CloseApproach::CloseApproach(std::string designation, time::Instant instant,
                             std::optional<double> distance,
                             std::optional<double> velocity)
    : designation_(std::move(designation)),
      time_(instant),
      distance_(distance),
      velocity_(velocity) {}

auto CloseApproach::create(ApproachFields fields) -> Result<CloseApproach> {
    if (fields.designation.empty()) {
        return makeValidationError("Missing required field: designation");
    }

    auto parsed = time::parseApproachTime(fields.time);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    if (time::isUnset(*parsed)) {
        return makeValidationError(fmt::format(
            "Missing approach time for designation '{}'", fields.designation));
    }

    return CloseApproach(std::move(fields.designation), *parsed,
                         fields.distance, fields.velocity);
}

auto CloseApproach::timeStr() const -> std::string {
    return time::formatApproachTime(time_);
}

auto CloseApproach::distanceAu() const -> double {
    return distance_.value_or(std::numeric_limits<double>::quiet_NaN());
}

auto CloseApproach::velocityKmS() const -> double {
    return velocity_.value_or(std::numeric_limits<double>::quiet_NaN());
}

auto CloseApproach::toString() const -> std::string {
    if (neo_ == nullptr) {
        throw std::logic_error(fmt::format(
            "CloseApproach for '{}' at {} has not been linked to an object",
            designation_, timeStr()));
    }
    return fmt::format(
        "On {}, '{}' approaches Earth at a distance of {:.2f} au and a "
        "velocity of {:.2f} km/s.",
        timeStr(), neo_->fullname(), distanceAu(), velocityKmS());
}

auto CloseApproach::repr() const -> std::string {
    return fmt::format(
        "CloseApproach(time='{}', distance={:.2f}, velocity={:.2f}, neo={})",
        timeStr(), distanceAu(), velocityKmS(),
        neo_ != nullptr ? neo_->repr() : std::string("null"));
}

auto CloseApproach::serialize() const -> nlohmann::json {
    return nlohmann::json{
        {"datetime_utc", timeStr()},
        {"distance_au", distanceAu()},
        {"velocity_km_s", velocityKmS()},
    };
}

auto operator<<(std::ostream& os, const CloseApproach& approach)
    -> std::ostream& {
    return os << approach.toString();
}

}  // namespace neocat::catalog::model
