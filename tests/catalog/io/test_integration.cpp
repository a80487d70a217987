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

#include "catalog/io/io.hpp"
#include "catalog/repository/approach_linker.hpp"

namespace fs = std::filesystem;
using namespace neocat::catalog;

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "neocat_io_integration";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path test_dir;
};

TEST_F(IntegrationTest, ErosEndToEnd) {
    auto csv_handler = io::createCsvHandler();
    auto json_handler = io::createJsonHandler();

    auto csv_file = test_dir / "neos.csv";
    std::ofstream csv_out(csv_file);
    csv_out << "pdes,name,diameter,pha\n"
               "433,Eros,16.84,N\n";
    csv_out.close();

    auto json_file = test_dir / "cad.json";
    std::ofstream json_out(json_file);
    json_out << R"({"fields": ["des", "cd", "dist", "v_rel"],
                    "data": [["433", "1900-Jan-01 12:00", "0.15", "5.3"]]})";
    json_out.close();

    auto csv_result = csv_handler.importNearEarthObjects(csv_file.string());
    ASSERT_TRUE(csv_result);
    auto json_result = json_handler.importCloseApproaches(json_file.string());
    ASSERT_TRUE(json_result);

    auto& objects = csv_result->first;
    auto& approaches = json_result->first;
    ASSERT_EQ(objects.size(), 1);
    ASSERT_EQ(approaches.size(), 1);

    EXPECT_EQ(objects[0].fullname(), "433 (Eros)");
    EXPECT_FALSE(objects[0].hazardous());
    EXPECT_EQ(approaches[0].timeStr(), "1900-01-01 12:00");
    EXPECT_DOUBLE_EQ(approaches[0].distanceAu(), 0.15);
    EXPECT_DOUBLE_EQ(approaches[0].velocityKmS(), 5.3);

    auto stats = repository::link(objects, approaches);
    EXPECT_EQ(stats.linked, 1);
    EXPECT_EQ(stats.unlinked, 0);

    ASSERT_NE(approaches[0].neo(), nullptr);
    EXPECT_EQ(approaches[0].neo()->designation(), "433");
    ASSERT_EQ(objects[0].approaches().size(), 1);
    EXPECT_EQ(objects[0].approaches()[0], &approaches[0]);
}

TEST_F(IntegrationTest, DesignationIsNotNormalized) {
    auto csv_handler = io::createCsvHandler();

    auto csv_file = test_dir / "spaced.csv";
    std::ofstream csv_out(csv_file);
    csv_out << "pdes,name\n"
               " 2020 ab ,\n";
    csv_out.close();

    auto result = csv_handler.importNearEarthObjects(csv_file.string());
    ASSERT_TRUE(result);
    ASSERT_EQ(result->first.size(), 1);
    EXPECT_EQ(result->first[0].serialize()["designation"], " 2020 ab ");
}

TEST_F(IntegrationTest, SkippedRowsReduceOutputLength) {
    auto json_handler = io::createJsonHandler();

    auto parsed = json_handler.parse(R"({
        "fields": ["des", "cd", "dist", "v_rel"],
        "data": [["433", "1900-Jan-01 12:00", "0.15", "5.3"],
                 ["433", "1900-Feb-01 12:00", "n/a", "5.3"],
                 ["433", "1900-Mar-01 12:00", "0.25", "5.1"]]
    })");
    ASSERT_TRUE(parsed);

    auto result = io::JsonHandler::extractCloseApproaches(parsed.value());
    ASSERT_TRUE(result);
    const auto& [approaches, stats] = result.value();
    EXPECT_EQ(approaches.size(),
              static_cast<size_t>(stats.totalRecords - stats.errorCount));
    EXPECT_EQ(stats.errorCount, 1);
}
