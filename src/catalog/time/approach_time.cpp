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

#include "approach_time.hpp"

#include <array>
#include <cctype>
#include <optional>

#include <spdlog/fmt/fmt.h>

namespace neocat::catalog::time {

namespace {

constexpr std::array<std::string_view, 12> MONTH_ABBREVIATIONS = {
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};

/**
 * @brief Sequential reader over the raw date-time string
 */
class Cursor {
public:
    explicit Cursor(std::string_view text) : text_(text) {}

    [[nodiscard]] auto atEnd() const -> bool { return pos_ >= text_.size(); }

    [[nodiscard]] auto peek() const -> char {
        return atEnd() ? '\0' : text_[pos_];
    }

    auto consume(char expected) -> bool {
        if (peek() != expected) {
            return false;
        }
        ++pos_;
        return true;
    }

    /**
     * @brief Read exactly @p count decimal digits
     */
    auto digits(size_t count) -> std::optional<int> {
        if (pos_ + count > text_.size()) {
            return std::nullopt;
        }
        int value = 0;
        for (size_t i = 0; i < count; ++i) {
            char c = text_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        return value;
    }

    /**
     * @brief Skip one or more decimal digits
     */
    auto skipDigits() -> bool {
        size_t start = pos_;
        while (!atEnd() &&
               std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        return pos_ > start;
    }

    /**
     * @brief Read a month as a three-letter abbreviation or two digits
     */
    auto month() -> std::optional<unsigned> {
        if (std::isdigit(static_cast<unsigned char>(peek()))) {
            auto value = digits(2);
            if (!value) {
                return std::nullopt;
            }
            return static_cast<unsigned>(*value);
        }
        if (pos_ + 3 > text_.size()) {
            return std::nullopt;
        }
        std::string lowered;
        for (size_t i = 0; i < 3; ++i) {
            lowered += static_cast<char>(
                std::tolower(static_cast<unsigned char>(text_[pos_ + i])));
        }
        for (size_t i = 0; i < MONTH_ABBREVIATIONS.size(); ++i) {
            if (MONTH_ABBREVIATIONS[i] == lowered) {
                pos_ += 3;
                return static_cast<unsigned>(i + 1);
            }
        }
        return std::nullopt;
    }

private:
    std::string_view text_;
    size_t pos_ = 0;
};

auto unrecognized(std::string_view raw) -> std::unexpected<CatalogError> {
    return makeFormatError(
        fmt::format("Unrecognized date-time string: '{}'", raw));
}

}  // namespace

auto parseApproachTime(std::string_view raw) -> Result<Instant> {
    if (raw.empty()) {
        return UNSET_INSTANT;
    }

    Cursor cursor(raw);

    auto year = cursor.digits(4);
    if (!year || !cursor.consume('-')) {
        return unrecognized(raw);
    }
    auto month = cursor.month();
    if (!month || !cursor.consume('-')) {
        return unrecognized(raw);
    }
    auto day = cursor.digits(2);
    if (!day) {
        return unrecognized(raw);
    }

    int hour = 0;
    int minute = 0;
    if (!cursor.atEnd()) {
        if (!cursor.consume(' ')) {
            return unrecognized(raw);
        }
        auto h = cursor.digits(2);
        if (!h || !cursor.consume(':')) {
            return unrecognized(raw);
        }
        auto m = cursor.digits(2);
        if (!m) {
            return unrecognized(raw);
        }
        hour = *h;
        minute = *m;

        // Optional seconds and fraction, truncated to the minute
        if (cursor.consume(':')) {
            auto s = cursor.digits(2);
            if (!s || *s > 59) {
                return unrecognized(raw);
            }
            if (cursor.consume('.') && !cursor.skipDigits()) {
                return unrecognized(raw);
            }
        }
        if (!cursor.atEnd()) {
            return unrecognized(raw);
        }
    }

    if (hour > 23 || minute > 59) {
        return makeFormatError(
            fmt::format("Time of day out of range in '{}'", raw));
    }

    std::chrono::year_month_day ymd{std::chrono::year{*year},
                                    std::chrono::month{*month},
                                    std::chrono::day{
                                        static_cast<unsigned>(*day)}};
    if (!ymd.ok()) {
        return makeFormatError(
            fmt::format("Invalid calendar date in '{}'", raw));
    }

    return Instant{std::chrono::sys_days{ymd}} + std::chrono::hours{hour} +
           std::chrono::minutes{minute};
}

auto formatApproachTime(Instant instant) -> std::string {
    if (isUnset(instant)) {
        return "";
    }

    auto dayPoint = std::chrono::floor<std::chrono::days>(instant);
    std::chrono::year_month_day ymd{dayPoint};
    std::chrono::hh_mm_ss<std::chrono::minutes> hms{instant - dayPoint};

    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()), hms.hours().count(),
                       hms.minutes().count());
}

}  // namespace neocat::catalog::time
