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

#ifndef NEOCAT_CATALOG_IO_FIELD_PARSER_HPP
#define NEOCAT_CATALOG_IO_FIELD_PARSER_HPP

#include <optional>
#include <string_view>

namespace neocat::catalog::io {

/**
 * @brief Parse a finite floating-point value
 *
 * Surrounding whitespace is ignored. The rest must be a decimal number;
 * hexadecimal, "nan", "inf", trailing text and overflowing values are
 * rejected. Underflow gives a subnormal value or zero.
 *
 * @param text Field text
 * @return Parsed value, or nullopt if the text is not a finite number
 */
[[nodiscard]] auto parseNumber(std::string_view text) -> std::optional<double>;

/**
 * @brief Interpret a single-letter hazard flag
 *
 * @return false for "" or "N", true for any other value
 */
[[nodiscard]] auto parseHazardFlag(std::string_view flag) -> bool;

}  // namespace neocat::catalog::io

#endif  // NEOCAT_CATALOG_IO_FIELD_PARSER_HPP
