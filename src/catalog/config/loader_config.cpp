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

#include "loader_config.hpp"

#include <cstdint>
#include <fstream>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace neocat::catalog::config {

namespace {

/**
 * @brief Reads optional keys of one config section into typed fields
 *
 * The first failure is kept; later reads become no-ops.
 */
class SectionReader {
public:
    SectionReader(const json& root, std::string section)
        : section_(std::move(section)) {
        if (!root.contains(section_)) {
            return;
        }
        if (!root[section_].is_object()) {
            fail("section must be an object");
            return;
        }
        node_ = &root[section_];
    }

    void string(const char* key, std::string& out, bool allowEmpty = false) {
        const json* value = find(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_string()) {
            fail(std::string(key) + " must be a string");
            return;
        }
        auto text = value->get<std::string>();
        if (text.empty() && !allowEmpty) {
            fail(std::string(key) + " must not be empty");
            return;
        }
        out = std::move(text);
    }

    void character(const char* key, char& out, bool allowEmpty = false) {
        const json* value = find(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_string()) {
            fail(std::string(key) + " must be a one-character string");
            return;
        }
        auto text = value->get<std::string>();
        if (text.empty() && allowEmpty) {
            out = '\0';
        } else if (text.size() == 1) {
            out = text.front();
        } else {
            fail(std::string(key) + " must be a one-character string");
        }
    }

    void boolean(const char* key, bool& out) {
        const json* value = find(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_boolean()) {
            fail(std::string(key) + " must be a boolean");
            return;
        }
        out = value->get<bool>();
    }

    void count(const char* key, std::size_t& out) {
        const json* value = find(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_number_integer() || value->get<std::int64_t>() <= 0) {
            fail(std::string(key) + " must be a positive integer");
            return;
        }
        out = value->get<std::size_t>();
    }

    void level(const char* key, logging::LogLevel& out) {
        std::string name;
        string(key, name);
        if (name.empty() || error_) {
            return;
        }
        auto parsed = logging::LogConfig::parseLevel(name);
        if (!parsed) {
            fail("unknown log level '" + name + "'");
            return;
        }
        out = *parsed;
    }

    [[nodiscard]] auto error() const -> const std::optional<std::string>& {
        return error_;
    }

private:
    auto find(const char* key) const -> const json* {
        if (node_ == nullptr || error_ || !node_->contains(key)) {
            return nullptr;
        }
        return &(*node_)[key];
    }

    void fail(std::string message) {
        if (!error_) {
            error_ = section_ + ": " + std::move(message);
        }
    }

    std::string section_;
    const json* node_ = nullptr;
    std::optional<std::string> error_;
};

}  // namespace

void LoaderConfig::applyLogging() const {
    neocat::logging::LogConfig::initialize(logging);
}

auto LoaderConfig::toJson() const -> json {
    return json{
        {"csv",
         {{"delimiter", std::string(1, dialect.delimiter)},
          {"quotechar", std::string(1, dialect.quotechar)},
          {"escapechar", dialect.escapechar == '\0'
                             ? std::string()
                             : std::string(1, dialect.escapechar)},
          {"doublequote", dialect.doublequote},
          {"skipinitialspace", dialect.skipinitialspace},
          {"strict", dialect.strict}}},
        {"neo_columns",
         {{"designation", neoColumns.designation},
          {"name", neoColumns.name},
          {"diameter", neoColumns.diameter},
          {"hazardous", neoColumns.hazardous}}},
        {"approach_fields",
         {{"designation", approachFields.designation},
          {"time", approachFields.time},
          {"distance", approachFields.distance},
          {"velocity", approachFields.velocity}}},
        {"logging",
         {{"level", std::string(neocat::logging::LogConfig::levelName(
                               logging.level))},
          {"pattern", logging.pattern},
          {"console", logging.console_output},
          {"file", logging.file_output},
          {"file_path", logging.log_file_path},
          {"max_file_size", logging.max_file_size},
          {"max_files", logging.max_files}}},
    };
}

auto LoaderConfig::fromJson(const json& j) -> Result<LoaderConfig> {
    if (!j.is_object()) {
        return makeConfigurationError("Expected a JSON object for loader "
                                      "configuration");
    }

    LoaderConfig config;

    SectionReader csv(j, "csv");
    csv.character("delimiter", config.dialect.delimiter);
    csv.character("quotechar", config.dialect.quotechar);
    csv.character("escapechar", config.dialect.escapechar, true);
    csv.boolean("doublequote", config.dialect.doublequote);
    csv.boolean("skipinitialspace", config.dialect.skipinitialspace);
    csv.boolean("strict", config.dialect.strict);

    SectionReader neo(j, "neo_columns");
    neo.string("designation", config.neoColumns.designation);
    neo.string("name", config.neoColumns.name);
    neo.string("diameter", config.neoColumns.diameter);
    neo.string("hazardous", config.neoColumns.hazardous);

    SectionReader cad(j, "approach_fields");
    cad.string("designation", config.approachFields.designation);
    cad.string("time", config.approachFields.time);
    cad.string("distance", config.approachFields.distance);
    cad.string("velocity", config.approachFields.velocity);

    SectionReader log(j, "logging");
    log.level("level", config.logging.level);
    log.string("pattern", config.logging.pattern);
    log.boolean("console", config.logging.console_output);
    log.boolean("file", config.logging.file_output);
    log.string("file_path", config.logging.log_file_path);
    log.count("max_file_size", config.logging.max_file_size);
    log.count("max_files", config.logging.max_files);

    for (const auto* reader : {&csv, &neo, &cad, &log}) {
        if (reader->error()) {
            return makeConfigurationError(*reader->error());
        }
    }

    if (config.dialect.delimiter == config.dialect.quotechar) {
        return makeConfigurationError(
            "csv: delimiter and quotechar must differ");
    }

    return config;
}

auto LoaderConfig::loadFromFile(const std::string& path)
    -> Result<LoaderConfig> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return makeConfigurationError("Failed to open config file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& ex) {
        return makeConfigurationError("Invalid JSON in " + path + ": " +
                                      ex.what());
    }

    auto config = fromJson(j);
    if (config) {
        spdlog::debug("LoaderConfig: Loaded configuration from {}", path);
    }
    return config;
}

}  // namespace neocat::catalog::config
