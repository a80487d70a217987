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

#include "catalog/io/json_handler.hpp"

namespace fs = std::filesystem;
using namespace neocat::catalog;

class JsonHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temporary directory for test files
        test_dir = fs::temp_directory_path() / "neocat_json_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        fs::remove_all(test_dir);
    }

    static auto feed(const json& data) -> json {
        return json{
            {"signature", {{"source", "NASA/JPL SBDB Close Approach Data API"},
                           {"version", "1.1"}}},
            {"count", std::to_string(data.size())},
            {"fields",
             {"des", "orbit_id", "jd", "cd", "dist", "dist_min", "dist_max",
              "v_rel", "v_inf", "t_sigma_f", "h"}},
            {"data", data},
        };
    }

    fs::path test_dir;
};

TEST_F(JsonHandlerTest, ReadSimpleJson) {
    io::JsonHandler handler;

    json data = {{"fields", json::array()}, {"data", json::array()}};

    auto json_file = test_dir / "simple.json";
    std::ofstream out(json_file);
    out << data.dump(2);
    out.close();

    auto result = handler.read(json_file.string());
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value()["fields"].is_array());
}

TEST_F(JsonHandlerTest, ParseErrors) {
    io::JsonHandler handler;

    auto empty = handler.parse("");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().kind, ErrorKind::SourceReadError);

    auto broken = handler.parse("{\"fields\": [");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().kind, ErrorKind::SourceReadError);

    auto badUtf8 = handler.parse("{\"des\": \"\xC3\x28\"}");
    ASSERT_FALSE(badUtf8);
    EXPECT_EQ(badUtf8.error().kind, ErrorKind::SourceReadError);
}

TEST_F(JsonHandlerTest, MissingFileIsSourceReadError) {
    io::JsonHandler handler;

    auto result =
        handler.importCloseApproaches((test_dir / "missing.json").string());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::SourceReadError);
}

TEST_F(JsonHandlerTest, WrongTopLevelShapeIsSourceReadError) {
    for (const auto& document :
         {json::array(), json{{"data", json::array()}},
          json{{"fields", "des"}, {"data", json::array()}},
          json{{"fields", {"des", "cd", "dist", "v_rel"}}, {"data", 1}}}) {
        auto result = io::JsonHandler::extractCloseApproaches(document);
        ASSERT_FALSE(result) << document.dump();
        EXPECT_EQ(result.error().kind, ErrorKind::SourceReadError);
    }
}

TEST_F(JsonHandlerTest, ManifestWithoutRequiredFieldSkipsEveryRow) {
    json document = {{"fields", {"des", "cd", "dist"}},
                     {"data",
                      {{"433", "1900-Dec-27 01:30", "0.3149"},
                       {"99942", "2029-Apr-13 21:46", "0.000254"}}}};

    auto result = io::JsonHandler::extractCloseApproaches(document);
    ASSERT_TRUE(result);

    const auto& [approaches, stats] = result.value();
    EXPECT_TRUE(approaches.empty());
    EXPECT_EQ(stats.totalRecords, 2);
    EXPECT_EQ(stats.errorCount, 2);
    ASSERT_EQ(stats.errors.size(), 2);
    EXPECT_NE(stats.errors[0].find("v_rel"), std::string::npos);
}

TEST_F(JsonHandlerTest, ZipRecordIgnoresExtraAndMissingValues) {
    std::vector<std::string> manifest = {"des", "cd", "dist"};

    auto shortRow =
        io::JsonHandler::zipRecord(manifest, json::array({"433"}));
    EXPECT_EQ(shortRow.size(), 1);
    EXPECT_EQ(shortRow.at("des"), "433");

    auto longRow = io::JsonHandler::zipRecord(
        manifest, json::array({"433", "cd", "0.1", "x"}));
    EXPECT_EQ(longRow.size(), 3);
    EXPECT_EQ(longRow.at("dist"), "0.1");
}

TEST_F(JsonHandlerTest, ExtractCloseApproaches) {
    auto document = feed({
        {"433", "659", "2415015.563", "1900-Dec-27 01:30", "0.314929",
         "0.314928", "0.314930", "5.58", "5.57", "< 00:01", "10.3"},
        {"99942", "220", "2462240.407", "2029-Apr-13 21:46", "0.000254",
         "0.000254", "0.000254", "7.42", "5.84", "< 00:01", "19.7"},
    });

    auto result = io::JsonHandler::extractCloseApproaches(document);
    ASSERT_TRUE(result);

    const auto& [approaches, stats] = result.value();
    ASSERT_EQ(approaches.size(), 2);
    EXPECT_EQ(stats.totalRecords, 2);
    EXPECT_EQ(stats.successCount, 2);
    EXPECT_EQ(stats.errorCount, 0);

    EXPECT_EQ(approaches[0].designation(), "433");
    EXPECT_EQ(approaches[0].timeStr(), "1900-12-27 01:30");
    EXPECT_DOUBLE_EQ(approaches[0].distanceAu(), 0.314929);
    EXPECT_DOUBLE_EQ(approaches[0].velocityKmS(), 5.58);
    EXPECT_EQ(approaches[0].neo(), nullptr);

    EXPECT_EQ(approaches[1].designation(), "99942");
    EXPECT_EQ(approaches[1].timeStr(), "2029-04-13 21:46");
}

TEST_F(JsonHandlerTest, NumericValuesAreAccepted) {
    json document = {{"fields", {"des", "cd", "dist", "v_rel"}},
                     {"data", {{433, "1900-Dec-27 01:30", 0.3149, 5.58}}}};

    auto result = io::JsonHandler::extractCloseApproaches(document);
    ASSERT_TRUE(result);
    ASSERT_EQ(result->first.size(), 1);
    EXPECT_EQ(result->first[0].designation(), "433");
    EXPECT_DOUBLE_EQ(result->first[0].distanceAu(), 0.3149);
}

TEST_F(JsonHandlerTest, MalformedRowsAreSkippedAndReported) {
    json document = {
        {"fields", {"des", "cd", "dist", "v_rel"}},
        {"data",
         {{"433", "1900-Dec-27 01:30", "0.3149", "5.58"},
          {"433", "1900-Dec-27 01:30", "n/a", "5.58"},
          {"433", "sometime", "0.1", "5.58"},
          {"", "1900-Dec-27 01:30", "0.1", "5.58"},
          {"433", "1900-Dec-27 01:30"},
          "not a row",
          {"433", "1901-Jan-05 10:00", "0.2", "6.10"}}},
    };

    auto result = io::JsonHandler::extractCloseApproaches(document);
    ASSERT_TRUE(result);

    const auto& [approaches, stats] = result.value();
    ASSERT_EQ(approaches.size(), 2);
    EXPECT_EQ(approaches[0].timeStr(), "1900-12-27 01:30");
    EXPECT_EQ(approaches[1].timeStr(), "1901-01-05 10:00");

    EXPECT_EQ(stats.totalRecords, 7);
    EXPECT_EQ(stats.successCount, 2);
    EXPECT_EQ(stats.errorCount, 5);
    ASSERT_EQ(stats.errors.size(), 5);
    EXPECT_NE(stats.errors[0].find("row 1"), std::string::npos);
    EXPECT_NE(stats.errors[0].find("ValidationError"), std::string::npos);
    EXPECT_NE(stats.errors[1].find("FormatError"), std::string::npos);
    EXPECT_NE(stats.errors[4].find("row 5"), std::string::npos);
}

TEST_F(JsonHandlerTest, CustomFieldNames) {
    json document = {{"fields", {"id", "when", "au", "kms"}},
                     {"data", {{"433", "1900-Dec-27 01:30", "0.3149", "5.58"}}}};

    io::ApproachFieldNames fields{"id", "when", "au", "kms"};
    auto result = io::JsonHandler::extractCloseApproaches(document, fields);
    ASSERT_TRUE(result);
    ASSERT_EQ(result->first.size(), 1);
    EXPECT_DOUBLE_EQ(result->first[0].velocityKmS(), 5.58);
}

TEST_F(JsonHandlerTest, ImportCloseApproachesFromFile) {
    io::JsonHandler handler;

    json row = {"433",      "659",      "2415015.563", "1900-Dec-27 01:30",
                "0.314929", "0.314928", "0.314930",    "5.58",
                "5.57",     "< 00:01",  "10.3"};
    auto document = feed(json::array({row}));

    auto json_file = test_dir / "cad.json";
    std::ofstream out(json_file);
    out << document.dump();
    out.close();

    auto result = handler.importCloseApproaches(json_file.string());
    ASSERT_TRUE(result);
    EXPECT_EQ(result->first.size(), 1);
    EXPECT_EQ(result->second.successCount, 1);
}
