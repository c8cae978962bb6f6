// =====================================================================
//  tests/textformat_test.cpp — Measurement text formatting
// =====================================================================
//
//  Part of libdxfdim.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "test_common.h"

#include <dxfdim/dimstyle/schema.h>
#include <dxfdim/errors.h>
#include <dxfdim/render/textformat.h>

using namespace dxfdim;
using render::formatText;

TEST(TextFormat, FixedDecimals) {
    EXPECT_EQ(formatText(12.0, std::nullopt, 2, 0, '.', "<>"), QString("12.00"));
    EXPECT_EQ(formatText(1.23456, std::nullopt, 3), QString("1.235"));
}

TEST(TextFormat, UnsetDecimalsDropTrailingZeros) {
    EXPECT_EQ(formatText(0.5, std::nullopt, std::nullopt, DIMZIN_SUPPRESSES_LEADING_ZEROS),
              QString(".5"));
    EXPECT_EQ(formatText(12.0), QString("12"));
    EXPECT_EQ(formatText(2.25), QString("2.25"));
}

TEST(TextFormat, TrailingZerosAndPostfix) {
    EXPECT_EQ(formatText(3.0, std::nullopt, 0, DIMZIN_SUPPRESSES_TRAILING_ZEROS, '.', "<>mm"),
              QString("3mm"));
    EXPECT_EQ(formatText(3.10, std::nullopt, 3, DIMZIN_SUPPRESSES_TRAILING_ZEROS), QString("3.1"));
}

TEST(TextFormat, LeadingZeroSuppressionKeepsSign) {
    EXPECT_EQ(formatText(-0.25, std::nullopt, 2, DIMZIN_SUPPRESSES_LEADING_ZEROS),
              QString("-.25"));
}

TEST(TextFormat, ZeroStaysZero) {
    EXPECT_EQ(formatText(0.0, std::nullopt, 2,
                         DIMZIN_SUPPRESSES_LEADING_ZEROS | DIMZIN_SUPPRESSES_TRAILING_ZEROS),
              QString("0"));
}

TEST(TextFormat, Rounding) {
    EXPECT_EQ(formatText(12.34, 0.25, 2), QString("12.25"));
    EXPECT_EQ(formatText(12.4, 0.25, 2), QString("12.50"));
    // Ties round away from zero
    EXPECT_EQ(formatText(2.5, 1.0, 0), QString("3"));
    EXPECT_EQ(formatText(-2.5, 1.0, 0), QString("-3"));
    // No rounding increment
    EXPECT_EQ(formatText(12.34, 0.0, 2), QString("12.34"));
}

TEST(TextFormat, DecimalSeparator) {
    EXPECT_EQ(formatText(12.5, std::nullopt, 2, 0, ','), QString("12,50"));
    EXPECT_EQ(formatText(12.0, std::nullopt, 2, DIMZIN_SUPPRESSES_TRAILING_ZEROS, ','),
              QString("12"));
}

TEST(TextFormat, PrefixAndPostfix) {
    EXPECT_EQ(formatText(5.0, std::nullopt, 1, 0, '.', "L=<> mm"), QString("L=5.0 mm"));
    // Only the first token is replaced
    EXPECT_EQ(formatText(5.0, std::nullopt, 0, 0, '.', "<>/<>"), QString("5/<>"));
    EXPECT_EQ(formatText(5.0, std::nullopt, 0, 0, '.', QString()), QString("5"));
}

TEST(TextFormat, TemplateWithoutTokenThrows) {
    EXPECT_THROW(formatText(5.0, std::nullopt, 0, 0, '.', "mm"), ValidationError);
}

TEST(TextFormat, RaiseDecimals) {
    EXPECT_EQ(render::raiseDecimals("12.50"), QString("12\\S50^ ;"));
    EXPECT_EQ(formatText(1.25, std::nullopt, 2, 0, '.', "<>", true), QString("1\\S25^ ;"));
    EXPECT_EQ(render::raiseDecimals("12"), QString("12"));
}

TEST(TextFormat, SuppressZeros) {
    EXPECT_EQ(render::suppressZeros("0.500", true, false), QString(".500"));
    EXPECT_EQ(render::suppressZeros("0.500", false, true), QString("0.5"));
    EXPECT_EQ(render::suppressZeros("10.000", false, true), QString("10"));
    EXPECT_EQ(render::suppressZeros("100", false, true), QString("100"));
    EXPECT_EQ(render::suppressZeros("0.500", false, false), QString("0.500"));
}
