// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "cell_format.h"
#include <cmath>
#include <algorithm>
#include <zen/string_tools.h>
#include <zen/utf.h>
#include <zen/zstring.h>

using namespace zen;
using namespace frost;


std::wstring frost::formatGrouped(double value, int precision, const NumberSymbols& sym)
{
    if (!std::isfinite(value))
        return numberTo<std::wstring>(value);

    precision = std::clamp(precision, 0, 17);

    const std::string fmt = "%." + numberTo<std::string>(precision) + 'f';
    const std::string plain = printNumber<std::string>(fmt.c_str(), value); //e.g. "-1234.50"

    std::string_view digits = plain;
    std::wstring output;

    if (!digits.empty() && digits[0] == '-')
    {
        output += L'-';
        digits.remove_prefix(1);
    }

    const size_t posDot = digits.find('.');
    const std::string_view intPart  = digits.substr(0, posDot);
    const std::string_view fracPart = posDot == std::string_view::npos ? std::string_view() : digits.substr(posDot + 1);

    for (size_t i = 0; i < intPart.size(); ++i)
    {
        if (i != 0 && (intPart.size() - i) % 3 == 0)
            output += sym.groupSeparator;
        output += static_cast<wchar_t>(intPart[i]);
    }

    if (!fracPart.empty())
    {
        output += sym.decimalPoint;
        for (const char c : fracPart)
            output += static_cast<wchar_t>(c);
    }
    return output;
}


std::wstring frost::formatCellValue(const CellValue& value, const Column& col, const NumberSymbols& sym)
{
    auto formatGeneric = [&](const std::wstring& valStr)
    {
        if (col.format.empty())
            return valStr;
        return replaceCpy(col.format, L"%x", valStr);
    };

    return std::visit([&](const auto& val) -> std::wstring
    {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::monostate>)
            return std::wstring();
        else if constexpr (std::is_same_v<T, std::wstring>)
            return val;
        else if constexpr (std::is_same_v<T, double>)
            return formatGrouped(val, col.precision == 0 ? 2 : col.precision, sym);
        else if constexpr (std::is_same_v<T, bool>)
            return val ? checkMarkGlyph : L"";
        else if constexpr (std::is_same_v<T, TimeComp>)
        {
            if (isNullTime(val))
                return std::wstring();

            const Zstring fmt = utfTo<Zstring>(col.format.empty() ? defaultTimeFormat : col.format);
            return utfTo<std::wstring>(formatTime(fmt.c_str(), val)); //empty string on error
        }
        else
        {
            static_assert(std::is_same_v<T, int64_t>);
            return formatGeneric(numberTo<std::wstring>(val));
        }
    }, value);
}
