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

#include "neo_catalog.hpp"

#include <spdlog/spdlog.h>

#include "../io/json_handler.hpp"

namespace neocat::catalog::repository {

NeoCatalog::NeoCatalog(std::vector<model::NearEarthObject> objects,
                       std::vector<model::CloseApproach> approaches)
    : objects_(std::move(objects)), approaches_(std::move(approaches)) {
    linkStats_ = ApproachLinker::link(objects_, approaches_);
    buildLookupIndexes();
}

void NeoCatalog::buildLookupIndexes() {
    byDesignation_.reserve(objects_.size());
    for (const auto& neo : objects_) {
        byDesignation_[neo.designation()] = &neo;
        if (neo.name()) {
            byName_[*neo.name()] = &neo;
        }
    }
}

auto NeoCatalog::load(const std::string& neoCsvPath,
                      const std::string& approachJsonPath,
                      const config::LoaderConfig& config)
    -> Result<NeoCatalog> {
    io::CsvHandler csvHandler;
    auto neoOutcome = csvHandler.importNearEarthObjects(
        neoCsvPath, config.neoColumns, config.dialect);
    if (!neoOutcome) {
        return std::unexpected(neoOutcome.error());
    }

    io::JsonHandler jsonHandler;
    auto approachOutcome =
        jsonHandler.importCloseApproaches(approachJsonPath, config.approachFields);
    if (!approachOutcome) {
        return std::unexpected(approachOutcome.error());
    }

    auto& [objects, objectStats] = neoOutcome.value();
    auto& [approaches, approachStats] = approachOutcome.value();

    NeoCatalog catalog(std::move(objects), std::move(approaches));
    catalog.objectImport_ = std::move(objectStats);
    catalog.approachImport_ = std::move(approachStats);

    spdlog::info("NeoCatalog: Loaded {} objects ({} skipped) and {} approaches "
                 "({} skipped); {} linked, {} unlinked",
                 catalog.objects_.size(), catalog.objectImport_.errorCount,
                 catalog.approaches_.size(), catalog.approachImport_.errorCount,
                 catalog.linkStats_.linked, catalog.linkStats_.unlinked);
    return catalog;
}

auto NeoCatalog::findByDesignation(std::string_view designation) const
    -> const model::NearEarthObject* {
    auto it = byDesignation_.find(std::string(designation));
    return it != byDesignation_.end() ? it->second : nullptr;
}

auto NeoCatalog::findByName(std::string_view name) const
    -> const model::NearEarthObject* {
    auto it = byName_.find(std::string(name));
    return it != byName_.end() ? it->second : nullptr;
}

}  // namespace neocat::catalog::repository
