// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef I18_N_H_09823475092384750234
#define I18_N_H_09823475092384750234

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include "string_tools.h"


//marks user-visible text: messages are kept in one place for a later localization layer
#define TBX_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        tbx::translate(TBX_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) tbx::translate(TBX_TRANS_CONCAT_SUB(L, s), TBX_TRANS_CONCAT_SUB(L, p), n)
//plural form: "%x" is replaced by the number


namespace tbx
{
inline
std::wstring translate(const std::wstring& text) { return text; }


//"1 file" "%x files"
template <class T> inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, T n)
{
    static_assert(sizeof(n) <= sizeof(int64_t));
    const auto n64 = static_cast<int64_t>(n);
    assert(contains(plural, L"%x"));

    return replaceCpy(std::abs(n64) == 1 ? singular : plural, L"%x", numberTo<std::wstring>(n64));
}
}

#endif //I18_N_H_09823475092384750234
