/*
 * spdlog_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration for the catalog loader

**************************************************/

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace neocat::logging {

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

struct LoggerConfig {
    std::string name{"neocat"};
    LogLevel level = LogLevel::INFO;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    bool console_output = true;
    bool file_output = false;
    std::string log_file_path = "logs/neocat.log";
    std::size_t max_file_size = 1048576 * 10;  // 10MB
    std::size_t max_files = 5;
    bool flush_on_error = true;
};

/**
 * @brief spdlog setup shared by the library and its callers
 *
 * Library code logs through the spdlog default logger; initialize() makes
 * that the configured "neocat" logger.
 */
class LogConfig {
public:
    /**
     * @brief Install the configured logger as the spdlog default
     *
     * Calls after the first successful one only update the global level.
     *
     * @param config Logger configuration
     */
    static void initialize(const LoggerConfig& config = LoggerConfig{});

    /**
     * @brief Get or create logger
     * @param name Logger name
     * @param config Sink configuration used if the logger is created
     * @return Shared pointer to logger
     */
    static auto getLogger(std::string_view name,
                          const LoggerConfig& config = LoggerConfig{})
        -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set global log level
     * @param level New log level
     */
    static void setGlobalLevel(LogLevel level) noexcept;

    /**
     * @brief Flush all loggers
     */
    static void flushAll();

    /**
     * @brief Parse a level name ("trace" ... "critical", "off")
     * @return Level, or nullopt for an unknown name
     */
    static auto parseLevel(std::string_view name) noexcept
        -> std::optional<LogLevel>;

    /**
     * @brief Lower-case name of a level
     */
    static auto levelName(LogLevel level) noexcept -> std::string_view;

    static auto convertLevel(LogLevel level) noexcept
        -> spdlog::level::level_enum;

private:
    static inline bool initialized_ = false;
};

// Convenience macros that skip formatting for disabled levels
#define NEOCAT_LOG_DEBUG(logger, ...)                         \
    if (logger && logger->should_log(spdlog::level::debug)) { \
        logger->debug(__VA_ARGS__);                           \
    }

#define NEOCAT_LOG_INFO(logger, ...)                         \
    if (logger && logger->should_log(spdlog::level::info)) { \
        logger->info(__VA_ARGS__);                           \
    }

#define NEOCAT_LOG_WARN(logger, ...)                         \
    if (logger && logger->should_log(spdlog::level::warn)) { \
        logger->warn(__VA_ARGS__);                           \
    }

#define NEOCAT_LOG_ERROR(logger, ...)                       \
    if (logger && logger->should_log(spdlog::level::err)) { \
        logger->error(__VA_ARGS__);                         \
    }

}  // namespace neocat::logging
