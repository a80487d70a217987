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

#include "catalog/io/field_parser.hpp"

using namespace neocat::catalog::io;

TEST(FieldParserTest, ParsesDecimalAndExponent) {
    EXPECT_DOUBLE_EQ(parseNumber("16.84").value(), 16.84);
    EXPECT_DOUBLE_EQ(parseNumber("-2").value(), -2.0);
    EXPECT_DOUBLE_EQ(parseNumber("1.5e-3").value(), 0.0015);
}

TEST(FieldParserTest, RejectsNonNumericText) {
    EXPECT_FALSE(parseNumber(""));
    EXPECT_FALSE(parseNumber("n/a"));
    EXPECT_FALSE(parseNumber("12km"));
    EXPECT_FALSE(parseNumber("1.0 km"));
    EXPECT_FALSE(parseNumber("   "));
}

TEST(FieldParserTest, IgnoresSurroundingWhitespace) {
    EXPECT_DOUBLE_EQ(parseNumber(" 2.3").value(), 2.3);
    EXPECT_DOUBLE_EQ(parseNumber("2.3 ").value(), 2.3);
    EXPECT_DOUBLE_EQ(parseNumber("\t2.3\n").value(), 2.3);
}

TEST(FieldParserTest, RejectsHexadecimal) {
    EXPECT_FALSE(parseNumber("0x10"));
    EXPECT_FALSE(parseNumber("-0X1p3"));
}

TEST(FieldParserTest, AcceptsSubnormalValues) {
    auto value = parseNumber("1e-310");
    ASSERT_TRUE(value);
    EXPECT_GT(*value, 0.0);
    EXPECT_LT(*value, 1e-300);
}

TEST(FieldParserTest, RejectsNonFiniteValues) {
    EXPECT_FALSE(parseNumber("nan"));
    EXPECT_FALSE(parseNumber("inf"));
    EXPECT_FALSE(parseNumber("-Infinity"));
    EXPECT_FALSE(parseNumber("1e999"));
}

TEST(FieldParserTest, HazardFlag) {
    EXPECT_TRUE(parseHazardFlag("Y"));
    EXPECT_FALSE(parseHazardFlag("N"));
    EXPECT_FALSE(parseHazardFlag(""));
    EXPECT_TRUE(parseHazardFlag("y"));
}
