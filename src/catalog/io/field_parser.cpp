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

#include "field_parser.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

namespace neocat::catalog::io {

auto parseNumber(std::string_view text) -> std::optional<double> {
    constexpr std::string_view WHITESPACE = " \t\n\r\f\v";
    auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto last = text.find_last_not_of(WHITESPACE);
    std::string str(text.substr(first, last - first + 1));

    // strtod also reads hexadecimal floats; the feeds are decimal only
    if (str.find_first_of("xX") != std::string::npos) {
        return std::nullopt;
    }

    char* end = nullptr;
    double val = std::strtod(str.c_str(), &end);
    // Check if entire string was consumed; overflow reads as infinity,
    // underflow as a subnormal or zero
    if (end != str.c_str() + str.length() || !std::isfinite(val)) {
        return std::nullopt;
    }
    return val;
}

auto parseHazardFlag(std::string_view flag) -> bool {
    return !(flag.empty() || flag == "N");
}

}  // namespace neocat::catalog::io
