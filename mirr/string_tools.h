// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef STRING_TOOLS_H_5720938475019283
#define STRING_TOOLS_H_5720938475019283

#include <cassert>
#include <charconv>
#include <string>
#include <string_view>
#include <vector>


//non-member helpers for std::string and std::wstring
namespace mirr
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only

//"term" may be a string, a string literal or a single character
template <class Char, class T> bool contains  (const std::basic_string<Char>& str, const T& term);
template <class Char, class T> bool startsWith(const std::basic_string<Char>& str, const T& prefix);
template <class Char, class T> bool endsWith  (const std::basic_string<Char>& str, const T& postfix);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class Char, class T> std::basic_string<Char> afterLast  (const std::basic_string<Char>& str, const T& term, IfNotFoundReturn infr);
template <class Char, class T> std::basic_string<Char> beforeLast (const std::basic_string<Char>& str, const T& term, IfNotFoundReturn infr);
template <class Char, class T> std::basic_string<Char> afterFirst (const std::basic_string<Char>& str, const T& term, IfNotFoundReturn infr);
template <class Char, class T> std::basic_string<Char> beforeFirst(const std::basic_string<Char>& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class Char> [[nodiscard]] std::vector<std::basic_string<Char>> splitCpy(const std::basic_string<Char>& str, Char delimiter, SplitOnEmpty soe);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class Char, class Function> void trim(std::basic_string<Char>& str, TrimSide side, Function trimThisChar);
template <class Char> void trim(std::basic_string<Char>& str, TrimSide side = TrimSide::both);
template <class Char> [[nodiscard]] std::basic_string<Char> trimCpy(std::basic_string<Char> str, TrimSide side = TrimSide::both);

template <class Char, class T, class U> void replace(std::basic_string<Char>& str, const T& oldTerm, const U& newTerm);
template <class Char, class T, class U> [[nodiscard]] std::basic_string<Char> replaceCpy(std::basic_string<Char> str, const T& oldTerm, const U& newTerm);

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //return 0 on parse error








//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r'));
}


template <class Char> inline
bool isDigit(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


namespace impl
{
template <class Char> inline std::basic_string_view<Char> makeView(const std::basic_string<Char>& str) { return str; }
template <class Char> inline std::basic_string_view<Char> makeView(const std::basic_string_view<Char>& str) { return str; }
template <class Char> inline std::basic_string_view<Char> makeView(const Char* str) { return str; }
template <class Char> inline std::basic_string_view<Char> makeView(const Char& ch) { return {&ch, 1}; }
}


template <class Char, class T> inline
bool contains(const std::basic_string<Char>& str, const T& term)
{
    return str.find(impl::makeView<Char>(term)) != std::basic_string<Char>::npos;
}


template <class Char, class T> inline
bool startsWith(const std::basic_string<Char>& str, const T& prefix)
{
    return std::basic_string_view<Char>(str).starts_with(impl::makeView<Char>(prefix));
}


template <class Char, class T> inline
bool endsWith(const std::basic_string<Char>& str, const T& postfix)
{
    return std::basic_string_view<Char>(str).ends_with(impl::makeView<Char>(postfix));
}


template <class Char, class T> inline
std::basic_string<Char> afterLast(const std::basic_string<Char>& str, const T& term, IfNotFoundReturn infr)
{
    const std::basic_string_view<Char> termView = impl::makeView<Char>(term);
    assert(!termView.empty());

    const size_t pos = str.rfind(termView);
    if (pos == std::basic_string<Char>::npos)
        return infr == IfNotFoundReturn::all ? str : std::basic_string<Char>();

    return str.substr(pos + termView.size());
}


template <class Char, class T> inline
std::basic_string<Char> beforeLast(const std::basic_string<Char>& str, const T& term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(impl::makeView<Char>(term));
    if (pos == std::basic_string<Char>::npos)
        return infr == IfNotFoundReturn::all ? str : std::basic_string<Char>();

    return str.substr(0, pos);
}


template <class Char, class T> inline
std::basic_string<Char> afterFirst(const std::basic_string<Char>& str, const T& term, IfNotFoundReturn infr)
{
    const std::basic_string_view<Char> termView = impl::makeView<Char>(term);
    assert(!termView.empty());

    const size_t pos = str.find(termView);
    if (pos == std::basic_string<Char>::npos)
        return infr == IfNotFoundReturn::all ? str : std::basic_string<Char>();

    return str.substr(pos + termView.size());
}


template <class Char, class T> inline
std::basic_string<Char> beforeFirst(const std::basic_string<Char>& str, const T& term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(impl::makeView<Char>(term));
    if (pos == std::basic_string<Char>::npos)
        return infr == IfNotFoundReturn::all ? str : std::basic_string<Char>();

    return str.substr(0, pos);
}


template <class Char> inline
std::vector<std::basic_string<Char>> splitCpy(const std::basic_string<Char>& str, Char delimiter, SplitOnEmpty soe)
{
    std::vector<std::basic_string<Char>> output;

    for (size_t blockStart = 0;;)
    {
        const size_t blockEnd = str.find(delimiter, blockStart);
        const size_t blockLen = blockEnd == std::basic_string<Char>::npos ? str.size() - blockStart : blockEnd - blockStart;

        if (blockLen != 0 || soe == SplitOnEmpty::allow)
            output.push_back(str.substr(blockStart, blockLen));

        if (blockEnd == std::basic_string<Char>::npos)
            return output;
        blockStart = blockEnd + 1;
    }
}


template <class Char, class Function> inline
void trim(std::basic_string<Char>& str, TrimSide side, Function trimThisChar)
{
    size_t first = 0;
    size_t last  = str.size();

    if (side == TrimSide::both || side == TrimSide::left)
        while (first < last && trimThisChar(str[first]))
            ++first;

    if (side == TrimSide::both || side == TrimSide::right)
        while (last > first && trimThisChar(str[last - 1]))
            --last;

    str = str.substr(first, last - first);
}


template <class Char> inline
void trim(std::basic_string<Char>& str, TrimSide side)
{
    trim(str, side, [](Char c) { return isWhiteSpace(c); });
}


template <class Char> inline
std::basic_string<Char> trimCpy(std::basic_string<Char> str, TrimSide side)
{
    trim(str, side);
    return str;
}


template <class Char, class T, class U> inline
void replace(std::basic_string<Char>& str, const T& oldTerm, const U& newTerm)
{
    const std::basic_string_view<Char> oldView = impl::makeView<Char>(oldTerm);
    const std::basic_string_view<Char> newView = impl::makeView<Char>(newTerm);
    assert(!oldView.empty());

    for (size_t pos = str.find(oldView); pos != std::basic_string<Char>::npos; pos = str.find(oldView, pos + newView.size()))
        str.replace(pos, oldView.size(), newView);
}


template <class Char, class T, class U> inline
std::basic_string<Char> replaceCpy(std::basic_string<Char> str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    char buffer[64];
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(rv.ec == std::errc());

    return S(buffer, rv.ptr); //ASCII only => char-by-char widening is fine for std::wstring
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_arithmetic_v<Num>);
    std::string ascii;
    for (const auto c : str)
        if (static_cast<unsigned int>(c) < 128)
            ascii += static_cast<char>(c);
        else
            return 0;

    trim(ascii);
    if (!ascii.empty() && ascii[0] == '+')
        ascii.erase(0, 1);

    Num number = 0;
    const std::from_chars_result rv = std::from_chars(ascii.data(), ascii.data() + ascii.size(), number);
    if (rv.ec != std::errc() || rv.ptr != ascii.data() + ascii.size())
        return 0;
    return number;
}
}

#endif //STRING_TOOLS_H_5720938475019283
