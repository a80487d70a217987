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

#ifndef NEOCAT_CATALOG_ERROR_HPP
#define NEOCAT_CATALOG_ERROR_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace neocat::catalog {

/**
 * @brief Classification of catalog loading failures
 */
enum class ErrorKind : uint8_t {
    FormatError,        ///< Date-time string matches no recognized pattern
    ValidationError,    ///< Required field missing or numeric field invalid
    SourceReadError,    ///< Source unreadable or top-level shape is wrong
    ConfigurationError  ///< Loader configuration is invalid
};

/**
 * @brief Get the display name of an error kind
 */
[[nodiscard]] constexpr auto errorKindName(ErrorKind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case ErrorKind::FormatError:
            return "FormatError";
        case ErrorKind::ValidationError:
            return "ValidationError";
        case ErrorKind::SourceReadError:
            return "SourceReadError";
        case ErrorKind::ConfigurationError:
            return "ConfigurationError";
    }
    return "UnknownError";
}

/**
 * @brief Error value carried through Result returns
 */
struct CatalogError {
    ErrorKind kind = ErrorKind::ValidationError;
    std::string message;

    /**
     * @brief Render as "<Kind>: <message>"
     */
    [[nodiscard]] auto describe() const -> std::string {
        std::string out{errorKindName(kind)};
        out += ": ";
        out += message;
        return out;
    }
};

template <typename T>
using Result = std::expected<T, CatalogError>;

[[nodiscard]] inline auto makeFormatError(std::string message)
    -> std::unexpected<CatalogError> {
    return std::unexpected(
        CatalogError{ErrorKind::FormatError, std::move(message)});
}

[[nodiscard]] inline auto makeValidationError(std::string message)
    -> std::unexpected<CatalogError> {
    return std::unexpected(
        CatalogError{ErrorKind::ValidationError, std::move(message)});
}

[[nodiscard]] inline auto makeSourceReadError(std::string message)
    -> std::unexpected<CatalogError> {
    return std::unexpected(
        CatalogError{ErrorKind::SourceReadError, std::move(message)});
}

[[nodiscard]] inline auto makeConfigurationError(std::string message)
    -> std::unexpected<CatalogError> {
    return std::unexpected(
        CatalogError{ErrorKind::ConfigurationError, std::move(message)});
}

}  // namespace neocat::catalog

#endif  // NEOCAT_CATALOG_ERROR_HPP
