// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#include "format_unit.h"
#include <algorithm>
#include <cmath>
#include "i18n.h"

using namespace tbx;


std::wstring tbx::formatThreeDigitPrecision(double value)
{
    //print three digits: 0,01 | 0,11 | 1,11 | 11,1 | 111
    if (std::abs(value) < 9.995) //9.999 must not be formatted as "10.00"
        return printNumber<std::wstring>(L"%.2f", value);
    if (std::abs(value) < 99.95) //99.99 must not be formatted as "100.0"
        return printNumber<std::wstring>(L"%.1f", value);

    return numberTo<std::wstring>(std::llround(value));
}


std::wstring tbx::formatFilesizeShort(int64_t size)
{
    if (std::abs(size) <= 999)
        return _P("1 byte", "%x bytes", static_cast<int>(size));

    double sizeInUnit = static_cast<double>(size);

    for (const wchar_t* unitTxt : {L"%x KB", L"%x MB", L"%x GB", L"%x TB"})
    {
        sizeInUnit /= bytesPerKilo;
        if (std::abs(sizeInUnit) < 999.5)
            return replaceCpy(translate(unitTxt), L"%x", formatThreeDigitPrecision(sizeInUnit));
    }
    sizeInUnit /= bytesPerKilo;
    return replaceCpy(_("%x PB"), L"%x", formatThreeDigitPrecision(sizeInUnit));
}


std::wstring tbx::formatRemainingTime(double timeInSec)
{
    const int64_t totalSec = std::max<int64_t>(std::llround(timeInSec), 0);

    const int64_t hours   = totalSec / 3600;
    const int64_t minutes = totalSec % 3600 / 60;
    const int64_t seconds = totalSec % 60;

    if (hours > 0)
        return _P("1 hour", "%x hours", hours) + L' ' + _P("1 min", "%x min", minutes);
    if (minutes > 0)
        return _P("1 min", "%x min", minutes) + L' ' + _P("1 sec", "%x sec", seconds);
    return _P("1 sec", "%x sec", seconds);
}
