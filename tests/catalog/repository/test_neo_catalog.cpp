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

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <utility>

#include "catalog/repository/neo_catalog.hpp"

namespace fs = std::filesystem;
using namespace neocat::catalog;
using repository::NeoCatalog;

class NeoCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "neocat_catalog_test";
        fs::create_directories(test_dir);

        neo_file = test_dir / "neos.csv";
        std::ofstream neo_out(neo_file);
        neo_out << "pdes,name,diameter,pha\n"
                   "433,Eros,16.84,N\n"
                   "99942,Apophis,0.37,Y\n"
                   "2020 AB,,,N\n"
                   ",Broken,1.0,N\n";
        neo_out.close();

        cad_file = test_dir / "cad.json";
        std::ofstream cad_out(cad_file);
        cad_out << R"({
            "signature": {"version": "1.1"},
            "count": "4",
            "fields": ["des", "orbit_id", "cd", "dist", "v_rel"],
            "data": [
                ["433", "659", "1900-Dec-27 01:30", "0.3149", "5.58"],
                ["99942", "220", "2029-Apr-13 21:46", "0.000254", "7.42"],
                ["3200", "780", "2017-Dec-16 23:00", "0.0690", "31.99"],
                ["433", "659", "1917-Jan-30 10:00", "n/a", "5.10"]
            ]
        })";
        cad_out.close();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path test_dir;
    fs::path neo_file;
    fs::path cad_file;
};

TEST_F(NeoCatalogTest, LoadLinksBothFeeds) {
    auto result = NeoCatalog::load(neo_file.string(), cad_file.string());
    ASSERT_TRUE(result);

    const auto& catalog = result.value();
    EXPECT_EQ(catalog.objects().size(), 3);
    EXPECT_EQ(catalog.approaches().size(), 3);

    EXPECT_EQ(catalog.objectImport().totalRecords, 4);
    EXPECT_EQ(catalog.objectImport().errorCount, 1);
    EXPECT_EQ(catalog.approachImport().totalRecords, 4);
    EXPECT_EQ(catalog.approachImport().errorCount, 1);

    EXPECT_EQ(catalog.linkStats().linked, 2);
    EXPECT_EQ(catalog.linkStats().unlinked, 1);
}

TEST_F(NeoCatalogTest, FindByDesignationAndName) {
    auto result = NeoCatalog::load(neo_file.string(), cad_file.string());
    ASSERT_TRUE(result);
    const auto& catalog = result.value();

    const auto* eros = catalog.findByDesignation("433");
    ASSERT_NE(eros, nullptr);
    EXPECT_EQ(eros->fullname(), "433 (Eros)");
    ASSERT_EQ(eros->approaches().size(), 1);
    EXPECT_EQ(eros->approaches()[0]->timeStr(), "1900-12-27 01:30");

    EXPECT_EQ(catalog.findByName("Apophis"),
              catalog.findByDesignation("99942"));
    EXPECT_EQ(catalog.findByName("apophis"), nullptr);
    EXPECT_EQ(catalog.findByDesignation("3200"), nullptr);
    EXPECT_EQ(catalog.findByName(""), nullptr);
}

TEST_F(NeoCatalogTest, UnlinkedApproachStaysInCatalog) {
    auto result = NeoCatalog::load(neo_file.string(), cad_file.string());
    ASSERT_TRUE(result);

    const auto& approaches = result->approaches();
    ASSERT_EQ(approaches.size(), 3);
    EXPECT_EQ(approaches[2].designation(), "3200");
    EXPECT_EQ(approaches[2].neo(), nullptr);
}

TEST_F(NeoCatalogTest, LinksSurviveMove) {
    auto result = NeoCatalog::load(neo_file.string(), cad_file.string());
    ASSERT_TRUE(result);

    NeoCatalog moved = std::move(result.value());
    const auto* eros = moved.findByDesignation("433");
    ASSERT_NE(eros, nullptr);
    EXPECT_EQ(eros, &moved.objects()[0]);
    EXPECT_EQ(moved.approaches()[0].neo(), eros);
    EXPECT_EQ(eros->approaches()[0], &moved.approaches()[0]);
}

TEST_F(NeoCatalogTest, MissingNeoFileFailsWholeLoad) {
    auto result = NeoCatalog::load((test_dir / "missing.csv").string(),
                                   cad_file.string());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::SourceReadError);
}

TEST_F(NeoCatalogTest, InvalidApproachFeedFailsWholeLoad) {
    auto bad_file = test_dir / "bad.json";
    std::ofstream out(bad_file);
    out << R"({"data": []})";
    out.close();

    auto result = NeoCatalog::load(neo_file.string(), bad_file.string());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::SourceReadError);
}

TEST_F(NeoCatalogTest, LoadWithCustomConfig) {
    auto semi_file = test_dir / "neos_semicolon.csv";
    std::ofstream out(semi_file);
    out << "id;label\n"
           "433;Eros\n";
    out.close();

    config::LoaderConfig config;
    config.dialect.delimiter = ';';
    config.neoColumns.designation = "id";
    config.neoColumns.name = "label";

    auto result =
        NeoCatalog::load(semi_file.string(), cad_file.string(), config);
    ASSERT_TRUE(result);
    ASSERT_EQ(result->objects().size(), 1);
    EXPECT_EQ(result->objects()[0].fullname(), "433 (Eros)");
    EXPECT_EQ(result->linkStats().linked, 1);
}

TEST_F(NeoCatalogTest, ConstructFromCollections) {
    std::vector<model::NearEarthObject> objects;
    objects.push_back(
        model::NearEarthObject::create(model::NeoFields{"433"}).value());
    std::vector<model::CloseApproach> approaches;
    approaches.push_back(model::CloseApproach::create(
                             model::ApproachFields{"433", "2000-Jan-01 00:00"})
                             .value());

    NeoCatalog catalog(std::move(objects), std::move(approaches));
    EXPECT_EQ(catalog.linkStats().linked, 1);
    EXPECT_EQ(catalog.objectImport().totalRecords, 0);
    ASSERT_NE(catalog.approaches()[0].neo(), nullptr);
    EXPECT_EQ(catalog.approaches()[0].neo()->designation(), "433");
}
