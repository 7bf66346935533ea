// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include <gtest/gtest.h>
#include <frost/cell_format.h>

using namespace zen;
using namespace frost;


TEST(CellFormat, GroupedFloatingPoint)
{
    EXPECT_EQ(formatGrouped(1234.5, 2), L"1,234.50");
    EXPECT_EQ(formatGrouped(-1234567.125, 1), L"-1,234,567.1");
    EXPECT_EQ(formatGrouped(999, 0), L"999");
    EXPECT_EQ(formatGrouped(0.5, 3), L"0.500");

    const NumberSymbols german{L'.', L','};
    EXPECT_EQ(formatGrouped(1234.5, 2, german), L"1.234,50");
}


TEST(CellFormat, ColumnPrecision)
{
    Column col;
    col.name = L"x";

    EXPECT_EQ(formatCellValue(1234.5, col), L"1,234.50"); //precision 0 means "default 2"

    col.precision = 3;
    EXPECT_EQ(formatCellValue(1234.5, col), L"1,234.500");
}


TEST(CellFormat, BooleanGlyph)
{
    Column col;
    EXPECT_EQ(formatCellValue(true,  col), checkMarkGlyph);
    EXPECT_EQ(formatCellValue(false, col), L"");
}


TEST(CellFormat, GenericPattern)
{
    Column col;
    EXPECT_EQ(formatCellValue(int64_t(42), col), L"42");

    col.format = L"#%x items";
    EXPECT_EQ(formatCellValue(int64_t(42), col), L"#42 items");

    EXPECT_EQ(formatCellValue(std::wstring(L"%x text"), col), L"%x text"); //strings render as-is
    EXPECT_EQ(formatCellValue(CellValue(), col), L"");
}


TEST(CellFormat, TimeValues)
{
    Column col;
    col.format = L"%Y-%m-%d";

    TimeComp tc;
    tc.year  = 2021;
    tc.month = 3;
    tc.day   = 14;
    EXPECT_EQ(formatCellValue(tc, col), L"2021-03-14");

    tc.year = 1601; //"no date"
    EXPECT_EQ(formatCellValue(tc, col), L"");
    EXPECT_TRUE(isNullTime(TimeComp()));
}
