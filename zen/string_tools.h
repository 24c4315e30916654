// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <vector>
#include "utf.h"


//string functions working on std::string, std::wstring, their views and char literals
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only!
template <class Char> bool isAsciiChar (Char c);
template <class S   > bool isAsciiString(const S& str);
template <class Char> Char asciiToLower(Char c);
template <class Char> Char asciiToUpper(Char c);

template <class S, class T> bool contains(const S& str, const T& term);

template <class S, class T> bool startsWith           (const S& str, const T& prefix);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);
template <class S, class T> bool endsWith             (const S& str, const T& postfix);

template <class S, class T> bool equalAsciiNoCase(const S& lhs, const T& rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onStringPart);
template <class S, class Function1, class Function2> void split2(const S& str, Function1 isDelimiter, Function2 onStringPart);
template <class S, class Char> [[nodiscard]] std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class S> [[nodiscard]] S trimCpy(const S& str, TrimSide side = TrimSide::both);
template <class S>                     void trim(S& str, TrimSide side = TrimSide::both);
template <class S, class Function>     void trim(S& str, TrimSide side, Function trimThisChar);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str);

template <class Char> size_t strLength(const Char* str);

template <class Iterator> auto makeStringView(Iterator first, Iterator last);






//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    //caveat: std::isspace() is locale-dependent and undefined for negative char
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}


template <class Char> inline
bool isLineBreak(Char c) { return c == '\r' || c == '\n'; }


template <class Char> inline
bool isDigit(Char c) { return static_cast<Char>('0') <= c && c <= static_cast<Char>('9'); }


template <class Char> inline
bool isAsciiChar(Char c) { return static_cast<std::make_unsigned_t<Char>>(c) < 128; }


template <class S> inline
bool isAsciiString(const S& str)
{
    const auto strView = impl::asView(str);
    return std::all_of(strView.begin(), strView.end(), [](auto c) { return isAsciiChar(c); });
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class Char> inline
Char asciiToUpper(Char c)
{
    if (static_cast<Char>('a') <= c && c <= static_cast<Char>('z'))
        return static_cast<Char>(c - static_cast<Char>('a') + static_cast<Char>('A'));
    return c;
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::asView(str).find(impl::asView(term)) != std::string_view::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto s = impl::asView(str);
    const auto p = impl::asView(prefix);
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto s = impl::asView(str);
    const auto p = impl::asView(postfix);
    return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto l = impl::asView(lhs);
    const auto r = impl::asView(rhs);
    return l.size() == r.size() &&
           std::equal(l.begin(), l.end(), r.begin(), [](auto cl, auto cr) { return asciiToLower(cl) == asciiToLower(cr); });
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto s = impl::asView(str);
    const auto p = impl::asView(prefix);
    return s.size() >= p.size() && equalAsciiNoCase(s.substr(0, p.size()), p);
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::asView(str);
    const auto t = impl::asView(term);
    const size_t pos = s.rfind(t);
    if (pos == s.npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(s.substr(pos + t.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::asView(str);
    const size_t pos = s.rfind(impl::asView(term));
    if (pos == s.npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(s.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::asView(str);
    const auto t = impl::asView(term);
    const size_t pos = s.find(t);
    if (pos == s.npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(s.substr(pos + t.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::asView(str);
    const size_t pos = s.find(impl::asView(term));
    if (pos == s.npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(s.substr(0, pos));
}


template <class S, class Function1, class Function2> inline
void split2(const S& str, Function1 isDelimiter, Function2 onStringPart)
{
    const auto s = impl::asView(str);
    auto blockFirst = s.begin();
    for (;;)
    {
        auto blockLast = std::find_if(blockFirst, s.end(), isDelimiter);
        onStringPart(makeStringView(blockFirst, blockLast));

        if (blockLast == s.end())
            return;
        blockFirst = blockLast + 1;
    }
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onStringPart)
{
    split2(str, [delimiter](Char c) { return c == delimiter; }, onStringPart);
}


template <class S, class Char> inline
std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    split(str, delimiter, [&](auto part)
    {
        if (!part.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(part);
    });
    return output;
}


template <class S, class Function> inline
void trim(S& str, TrimSide side, Function trimThisChar)
{
    const auto s = impl::asView(str);
    auto first = s.begin();
    auto last  = s.end();

    if (side == TrimSide::both || side == TrimSide::right)
        while (last != first && trimThisChar(*(last - 1)))
            --last;

    if (side == TrimSide::both || side == TrimSide::left)
        while (first != last && trimThisChar(*first))
            ++first;

    str = S(makeStringView(first, last));
}


template <class S> inline
void trim(S& str, TrimSide side)
{
    using Char = typename decltype(impl::asView(str))::value_type;
    trim(str, side, [](Char c) { return isWhiteSpace(c); });
}


template <class S> inline
S trimCpy(const S& str, TrimSide side)
{
    S tmp = str;
    trim(tmp, side);
    return tmp;
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = impl::asView(oldTerm);
    const auto newView = impl::asView(newTerm);
    if (oldView.empty())
        return;

    for (size_t pos = str.find(oldView); pos != S::npos; pos = str.find(oldView, pos + newView.size()))
        str.replace(pos, oldView.size(), newView);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    if constexpr (std::is_same_v<typename S::value_type, wchar_t>)
        return S(std::to_wstring(number));
    else
        return S(std::to_string(number));
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_integral_v<Num>);
    const auto s = impl::asView(str);

    auto it = std::find_if(s.begin(), s.end(), [](auto c) { return !isWhiteSpace(c); });
    bool negative = false;
    if (it != s.end() && (*it == '-' || *it == '+'))
    {
        negative = *it == '-';
        ++it;
    }

    Num number = 0;
    for (; it != s.end() && isDigit(*it); ++it)
        number = static_cast<Num>(number * 10 + (*it - '0'));

    return negative ? static_cast<Num>(0 - number) : number;
}


template <class Char> inline
size_t strLength(const Char* str) { return std::char_traits<Char>::length(str); }


template <class Iterator> inline
auto makeStringView(Iterator first, Iterator last)
{
    using Char = std::iter_value_t<Iterator>;
    return std::basic_string_view<Char>(first, last);
}
}

#endif //STRING_TOOLS_H_213458973046
