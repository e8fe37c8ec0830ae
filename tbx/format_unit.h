// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef FORMAT_UNIT_H_51230948756129384
#define FORMAT_UNIT_H_51230948756129384

#include <cstdint>
#include <string>


namespace tbx
{
const int bytesPerKilo = 1000;

std::wstring formatFilesizeShort(int64_t filesize); //e.g. "4.21 MB"
std::wstring formatRemainingTime(double timeInSec); //e.g. "3 min 20 sec"

std::wstring formatThreeDigitPrecision(double value); //format with fixed number of digits (unless value is too large)
}

#endif //FORMAT_UNIT_H_51230948756129384
