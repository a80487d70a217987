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

#include "approach_linker.hpp"

#include <spdlog/spdlog.h>

namespace neocat::catalog::repository {

auto ApproachLinker::buildIndex(std::vector<model::NearEarthObject>& objects,
                                LinkStats& stats) -> Index {
    Index index;
    index.reserve(objects.size());
    for (auto& neo : objects) {
        auto [it, inserted] = index.try_emplace(neo.designation(), &neo);
        if (!inserted) {
            ++stats.duplicateDesignations;
            spdlog::warn("ApproachLinker: Designation '{}' appears more than "
                         "once; linking to the last occurrence",
                         neo.designation());
            it->second = &neo;
        }
    }
    return index;
}

auto ApproachLinker::link(std::vector<model::NearEarthObject>& objects,
                          std::vector<model::CloseApproach>& approaches)
    -> LinkStats {
    LinkStats stats;

    for (auto& neo : objects) {
        neo.approaches_.clear();
    }
    for (auto& approach : approaches) {
        approach.neo_ = nullptr;
    }

    auto index = buildIndex(objects, stats);

    for (auto& approach : approaches) {
        auto it = index.find(approach.designation());
        if (it == index.end()) {
            ++stats.unlinked;
            spdlog::debug("ApproachLinker: No object loaded for approach of "
                          "'{}' at {}",
                          approach.designation(), approach.timeStr());
            continue;
        }
        approach.neo_ = it->second;
        it->second->approaches_.push_back(&approach);
        ++stats.linked;
    }

    spdlog::debug("ApproachLinker: Linked {} approaches, {} unlinked",
                  stats.linked, stats.unlinked);
    return stats;
}

}  // namespace neocat::catalog::repository
