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

#include "near_earth_object.hpp"

#include <cmath>
#include <limits>

#include <spdlog/fmt/fmt.h>

namespace neocat::catalog::model {

NearEarthObject::NearEarthObject(NeoFields fields)
    : designation_(std::move(fields.designation)),
      name_(std::move(fields.name)),
      diameter_(fields.diameter),
      hazardous_(fields.hazardous) {}

auto NearEarthObject::create(NeoFields fields) -> Result<NearEarthObject> {
    if (fields.designation.empty()) {
        return makeValidationError("Missing required field: designation");
    }
    if (fields.name && fields.name->empty()) {
        fields.name.reset();
    }
    return NearEarthObject(std::move(fields));
}

auto NearEarthObject::diameterKm() const -> double {
    return diameter_.value_or(std::numeric_limits<double>::quiet_NaN());
}

auto NearEarthObject::fullname() const -> std::string {
    if (!name_) {
        return designation_;
    }
    return fmt::format("{} ({})", designation_, *name_);
}

auto NearEarthObject::toString() const -> std::string {
    std::string result = fmt::format("NEO {} has ", fullname());
    if (diameter_) {
        result += fmt::format("a diameter of {:.3f} km", *diameter_);
    } else {
        result += "an unknown diameter";
    }
    result += hazardous_ ? " and is potentially hazardous."
                         : " and is not potentially hazardous.";
    return result;
}

auto NearEarthObject::repr() const -> std::string {
    return fmt::format(
        "NearEarthObject(designation='{}', name={}, diameter={:.3f}, "
        "hazardous={})",
        designation_, name_ ? fmt::format("'{}'", *name_) : "null",
        diameterKm(), hazardous_);
}

auto NearEarthObject::serialize() const -> nlohmann::json {
    return nlohmann::json{
        {"designation", designation_},
        {"name", name_.value_or("")},
        {"diameter_km", diameterKm()},
        {"potentially_hazardous", hazardous_},
    };
}

auto operator<<(std::ostream& os, const NearEarthObject& neo)
    -> std::ostream& {
    return os << neo.toString();
}

}  // namespace neocat::catalog::model
