// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef CELL_FORMAT_H_5516320948276153094
#define CELL_FORMAT_H_5516320948276153094

#include "column_registry.h"
#include "table_model.h"


namespace frost
{
struct NumberSymbols
{
    wchar_t groupSeparator = L',';
    wchar_t decimalPoint   = L'.';
};

const wchar_t* const checkMarkGlyph = L"\u2714"; //check mark
const wchar_t* const defaultTimeFormat = L"%Y-%m-%d %H:%M:%S";

//years at or before 1601 are the "no date" sentinel
inline bool isNullTime(const zen::TimeComp& tc) { return tc.year <= 1601; }

//e.g. 1234.5, precision 2 => "1,234.50"
std::wstring formatGrouped(double value, int precision, const NumberSymbols& sym = NumberSymbols());

std::wstring formatCellValue(const CellValue& value, const Column& col, const NumberSymbols& sym = NumberSymbols());
}

#endif //CELL_FORMAT_H_5516320948276153094
