// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "format_unit.h"
#include <cmath>
#include <cwchar>
#include "i18n.h"

using namespace mirr;


namespace
{
std::wstring printDouble(const wchar_t* format, double value)
{
    wchar_t buffer[64] = {};
    const int charsWritten = std::swprintf(buffer, std::size(buffer), format, value);
    return charsWritten > 0 ? std::wstring(buffer, charsWritten) : std::wstring();
}
}


std::wstring mirr::formatThreeDigitPrecision(double value)
{
    //print three digits: 0,01 | 0,11 | 1,11 | 11,1 | 111
    if (std::abs(value) < 9.995) //9.999 must not be formatted as "10.00"
        return printDouble(L"%.2f", value);
    if (std::abs(value) < 99.95) //99.99 must not be formatted as "100.0"
        return printDouble(L"%.1f", value);

    return numberTo<std::wstring>(std::llround(value));
}


std::wstring mirr::formatFilesizeShort(int64_t size)
{
    if (std::abs(size) <= 999)
        return _P("1 byte", "%x bytes", static_cast<int>(size));

    double sizeInUnit = static_cast<double>(size);

    auto formatUnit = [&](const std::wstring& unitTxt) { return replaceCpy(unitTxt, L"%x", formatThreeDigitPrecision(sizeInUnit)); };

    for (const wchar_t* unitTxt : {L"%x KB", L"%x MB", L"%x GB", L"%x TB"})
    {
        sizeInUnit /= bytesPerKilo;
        if (std::abs(sizeInUnit) < 999.5)
            return formatUnit(translate(unitTxt));
    }

    sizeInUnit /= bytesPerKilo;
    return formatUnit(_("%x PB"));
}
