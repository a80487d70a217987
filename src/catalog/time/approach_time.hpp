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

#ifndef NEOCAT_CATALOG_TIME_APPROACH_TIME_HPP
#define NEOCAT_CATALOG_TIME_APPROACH_TIME_HPP

#include <chrono>
#include <string>
#include <string_view>

#include "../error.hpp"

namespace neocat::catalog::time {

/**
 * @brief UTC instant at minute resolution
 *
 * The approach feed carries no sub-minute precision, so instants are kept
 * at the resolution that survives a format/parse round trip.
 */
using Instant = std::chrono::sys_time<std::chrono::minutes>;

/// Value returned for an absent date-time string
inline constexpr Instant UNSET_INSTANT = Instant::min();

[[nodiscard]] constexpr auto isUnset(Instant instant) noexcept -> bool {
    return instant == UNSET_INSTANT;
}

/**
 * @brief Parse an approach date-time string
 *
 * Recognized forms (month either a three-letter English abbreviation,
 * case-insensitive, or a two-digit number):
 *   - YYYY-MMM-DD
 *   - YYYY-MMM-DD HH:MM
 *   - YYYY-MMM-DD HH:MM:SS
 *   - YYYY-MMM-DD HH:MM:SS.fff
 *
 * Seconds are accepted and truncated to the minute.
 *
 * @param raw Source string
 * @return Parsed instant, UNSET_INSTANT for an empty string, or FormatError
 */
[[nodiscard]] auto parseApproachTime(std::string_view raw) -> Result<Instant>;

/**
 * @brief Render an instant as "YYYY-MM-DD HH:MM"
 *
 * @param instant Instant to format
 * @return Formatted string, empty for UNSET_INSTANT
 */
[[nodiscard]] auto formatApproachTime(Instant instant) -> std::string;

}  // namespace neocat::catalog::time

#endif  // NEOCAT_CATALOG_TIME_APPROACH_TIME_HPP
