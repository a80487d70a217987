/*
 * spdlog_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration implementation

**************************************************/

#include "spdlog_config.hpp"

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace neocat::logging {

namespace {
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>
    logger_registry_;
std::mutex registry_mutex_;
}  // namespace

void LogConfig::initialize(const LoggerConfig& config) {
    if (initialized_) {
        setGlobalLevel(config.level);
        return;
    }

    auto default_logger = getLogger(config.name, config);
    spdlog::set_default_logger(default_logger);
    setGlobalLevel(config.level);

    spdlog::set_error_handler([](const std::string& msg) {
        // Fallback to stderr if a sink fails
        std::fprintf(stderr, "spdlog error: %s\n", msg.c_str());
    });

    initialized_ = true;
    NEOCAT_LOG_DEBUG(default_logger, "Logging initialized at level {}",
                     levelName(config.level));
}

auto LogConfig::getLogger(std::string_view name, const LoggerConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    std::string nameStr{name};

    std::lock_guard lock(registry_mutex_);
    if (auto it = logger_registry_.find(nameStr);
        it != logger_registry_.end()) {
        return it->second;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_output) {
            auto console_sink =
                std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(convertLevel(config.level));
            console_sink->set_pattern(config.pattern);
            sinks.push_back(console_sink);
        }

        if (config.file_output) {
            // Create logs directory if it doesn't exist
            auto parent =
                std::filesystem::path(config.log_file_path).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto file_sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.log_file_path, config.max_file_size,
                    config.max_files);
            file_sink->set_level(spdlog::level::trace);  // Log everything to file
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(nameStr, sinks.begin(),
                                                       sinks.end());
        logger->set_level(convertLevel(config.level));
        if (config.flush_on_error) {
            logger->flush_on(spdlog::level::err);
        }

        if (!spdlog::get(nameStr)) {
            spdlog::register_logger(logger);
        }
        logger_registry_.emplace(nameStr, logger);
        return logger;

    } catch (const spdlog::spdlog_ex& e) {
        throw std::runtime_error("Failed to create logger '" + nameStr +
                                 "': " + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        throw std::runtime_error("Failed to create log directory for '" +
                                 nameStr + "': " + e.what());
    }
}

void LogConfig::setGlobalLevel(LogLevel level) noexcept {
    spdlog::set_level(convertLevel(level));
}

void LogConfig::flushAll() {
    spdlog::apply_all(
        [](const std::shared_ptr<spdlog::logger>& l) { l->flush(); });
}

auto LogConfig::parseLevel(std::string_view name) noexcept
    -> std::optional<LogLevel> {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    if (name == "off") return LogLevel::OFF;
    return std::nullopt;
}

auto LogConfig::levelName(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::CRITICAL: return "critical";
        case LogLevel::OFF: return "off";
    }
    return "info";
}

auto LogConfig::convertLevel(LogLevel level) noexcept
    -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace neocat::logging
