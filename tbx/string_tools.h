// *****************************************************************************
// * This file is part of the TransferBox project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju and TransferBox authors - All Rights Reserved         *
// *****************************************************************************

#ifndef STRING_TOOLS_H_21340958723409872345
#define STRING_TOOLS_H_21340958723409872345

#include <cstdio>  //snprintf
#include <cwchar>  //swprintf
#include <algorithm>
#include <charconv>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>


//enhance *any* std::basic_string<> with a few useful functions: terms may be a string, string_view, C-string or single char
namespace tbx
{
template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast(const S& str, const T& term, IfNotFoundReturn infr);

template <class S, class T, class U> void replace   (S& str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U> S    replaceCpy(S  str, const T& oldTerm, const U& newTerm);

template <class S> S trimCpy(S str); //strip leading and trailing white space

template <class S, class Num> S numberTo(const Num& number);

//format: C-string using the same char type as S, e.g. printNumber<std::wstring>(L"%04x", n)
template <class S, class Num> S printNumber(const typename S::value_type* format, const Num& number);

std::string formatAsHexString(std::string_view blob); //bytes -> lower-case hex








//######################## implementation ########################
namespace impl
{
inline std::string_view  asView(const std::string&  str) { return str; }
inline std::string_view  asView(std::string_view    str) { return str; }
inline std::string_view  asView(const char*         str) { return str; }
inline std::string_view  asView(const char&         ch ) { return {&ch, 1}; }
inline std::wstring_view asView(const std::wstring& str) { return str; }
inline std::wstring_view asView(std::wstring_view   str) { return str; }
inline std::wstring_view asView(const wchar_t*      str) { return str; }
inline std::wstring_view asView(const wchar_t&      ch ) { return {&ch, 1}; }

template <class Char> inline
bool isWhiteSpace(Char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::asView(str).find(impl::asView(term)) != std::basic_string_view<typename S::value_type>::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    return impl::asView(str).starts_with(impl::asView(prefix));
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    return impl::asView(str).ends_with(impl::asView(postfix));
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = impl::asView(str);
    const auto termView = impl::asView(term);
    const size_t pos = termView.empty() ? strView.npos : strView.rfind(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(strView.substr(pos + termView.size()));
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = impl::asView(oldTerm);
    const auto newView = impl::asView(newTerm);
    if (oldView.empty())
        return;

    S output;
    size_t posLast = 0;
    for (size_t pos = str.find(oldView); pos != S::npos; pos = str.find(oldView, posLast))
    {
        output.append(str, posLast, pos - posLast);
        output += newView;
        posLast = pos + oldView.size();
    }
    if (posLast == 0)
        return;

    output.append(str, posLast);
    str = std::move(output);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S> inline
S trimCpy(S str)
{
    const auto itFirst = std::find_if_not(str.begin(), str.end(), [](auto c) { return impl::isWhiteSpace(c); });
    const auto itLast  = std::find_if_not(str.rbegin(), std::make_reverse_iterator(itFirst), [](auto c) { return impl::isWhiteSpace(c); }).base();
    return S(itFirst, itLast);
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    using Char = typename S::value_type;

    if constexpr (std::is_floating_point_v<Num>)
    {
        if constexpr (std::is_same_v<Char, char>)
            return printNumber<S>("%g", static_cast<double>(number));
        else
            return printNumber<S>(L"%g", static_cast<double>(number));
    }
    else
    {
        static_assert(std::is_integral_v<Num>);
        char buffer[32] = {};
        const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
        return S(std::begin(buffer), rv.ptr);
    }
}


template <class S, class Num> inline
S printNumber(const typename S::value_type* format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    using Char = typename S::value_type;

    Char buffer[128] = {};
    int charsWritten = 0;
    if constexpr (std::is_same_v<Char, char>)
        charsWritten = std::snprintf(buffer, std::size(buffer), format, number);
    else
        charsWritten = std::swprintf(buffer, std::size(buffer), format, number);

    return charsWritten > 0 ? S(buffer, std::min(static_cast<size_t>(charsWritten), std::size(buffer) - 1)) : S();
}


inline
std::string formatAsHexString(std::string_view blob)
{
    const char digits[] = "0123456789abcdef";
    std::string output;
    output.reserve(blob.size() * 2);
    for (const char b : blob)
    {
        const auto byte = static_cast<unsigned char>(b);
        output += digits[byte >> 4];
        output += digits[byte & 0xf];
    }
    return output;
}
}

#endif //STRING_TOOLS_H_21340958723409872345
