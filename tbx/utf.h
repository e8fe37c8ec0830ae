// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef UTF_H_40218732567329013458
#define UTF_H_40218732567329013458

#include <string>
#include <string_view>
#include <type_traits>


namespace tbx
{
//convert between UTF-8 (char) and UTF-32 (wchar_t on Linux); invalid input is replaced by U+FFFD
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);








//######################## implementation ########################
namespace impl
{
static_assert(sizeof(wchar_t) == 4);

const char32_t REPLACEMENT_CHAR = 0xfffd;


inline
void appendUtf8(std::string& out, char32_t cp)
{
    if (cp > 0x10ffff || (0xd800 <= cp && cp <= 0xdfff))
        cp = REPLACEMENT_CHAR;

    if (cp < 0x80)
        out += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xc0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xe0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else
    {
        out += static_cast<char>(0xf0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
}


inline
std::wstring decodeUtf8(std::string_view str)
{
    std::wstring out;
    out.reserve(str.size());

    for (size_t i = 0; i < str.size(); )
    {
        const auto lead = static_cast<unsigned char>(str[i]);

        size_t trailCount = 0;
        char32_t cp = 0;
        if (lead < 0x80)                { cp = lead;        trailCount = 0; }
        else if ((lead & 0xe0) == 0xc0) { cp = lead & 0x1f; trailCount = 1; }
        else if ((lead & 0xf0) == 0xe0) { cp = lead & 0x0f; trailCount = 2; }
        else if ((lead & 0xf8) == 0xf0) { cp = lead & 0x07; trailCount = 3; }
        else
        {
            out += static_cast<wchar_t>(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        if (i + trailCount >= str.size()) //truncated sequence
        {
            out += static_cast<wchar_t>(REPLACEMENT_CHAR);
            break;
        }

        bool valid = true;
        for (size_t t = 1; t <= trailCount; ++t)
        {
            const auto trail = static_cast<unsigned char>(str[i + t]);
            if ((trail & 0xc0) != 0x80)
            {
                valid = false;
                trailCount = t - 1;
                break;
            }
            cp = (cp << 6) | (trail & 0x3f);
        }

        out += static_cast<wchar_t>(valid ? cp : REPLACEMENT_CHAR);
        i += 1 + trailCount;
    }
    return out;
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    using SourceChar = typename std::remove_cvref_t<decltype(str[0])>;
    using TargetChar = typename TargetString::value_type;

    if constexpr (std::is_same_v<SourceChar, TargetChar>)
        return TargetString(str.begin(), str.end());
    else if constexpr (std::is_same_v<SourceChar, char>) //UTF-8 -> UTF-32
    {
        const std::wstring tmp = impl::decodeUtf8(std::string_view(str.data(), str.size()));
        return TargetString(tmp.begin(), tmp.end());
    }
    else //UTF-32 -> UTF-8
    {
        static_assert(std::is_same_v<TargetChar, char>);
        std::string out;
        out.reserve(str.size());
        for (const auto c : str)
            impl::appendUtf8(out, static_cast<char32_t>(c));
        return TargetString(out.begin(), out.end());
    }
}
}

#endif //UTF_H_40218732567329013458
