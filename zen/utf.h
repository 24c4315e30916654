// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include <cstdint>
#include <string>
#include <string_view>


namespace zen
{
//convert between UTF-8 (char) and UTF-32 (wchar_t on Linux)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

bool isValidUtf(std::string_view str);

size_t unicodeLength(std::string_view str); //number of code points






//----------------------- implementation ----------------------------------
namespace impl
{
inline std::string_view  asView(const char*    str) { return str; }
inline std::wstring_view asView(const wchar_t* str) { return str; }
inline std::string_view  asView(const std::string&  str) { return str; }
inline std::wstring_view asView(const std::wstring& str) { return str; }
inline std::string_view  asView(std::string_view  str) { return str; }
inline std::wstring_view asView(std::wstring_view str) { return str; }
inline std::string_view  asView(const char&    c) { return {&c, 1}; } //single char as search term
inline std::wstring_view asView(const wchar_t& c) { return {&c, 1}; }


using CodePoint = uint32_t;
const CodePoint REPLACEMENT_CHAR = 0xfffd;
const CodePoint CODE_POINT_MAX   = 0x10ffff;


//invalid sequences are mapped to REPLACEMENT_CHAR
template <class Function> inline
void decodeUtf(std::string_view str, Function onCodePoint)
{
    for (auto it = str.begin(); it != str.end();)
    {
        const unsigned char lead = static_cast<unsigned char>(*it++);

        if (lead < 0x80)
        {
            onCodePoint(lead);
            continue;
        }

        size_t trailCount = 0;
        CodePoint cp = 0;
        if      ((lead >> 5) == 0x6) { trailCount = 1; cp = lead & 0x1f; }
        else if ((lead >> 4) == 0xe) { trailCount = 2; cp = lead & 0x0f; }
        else if ((lead >> 3) == 0x1e) { trailCount = 3; cp = lead & 0x07; }
        else
        {
            onCodePoint(REPLACEMENT_CHAR);
            continue;
        }

        bool valid = true;
        for (size_t i = 0; i < trailCount; ++i)
        {
            if (it == str.end() || (static_cast<unsigned char>(*it) >> 6) != 0x2)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(*it++) & 0x3f);
        }

        if (!valid || cp > CODE_POINT_MAX || (0xd800 <= cp && cp <= 0xdfff))
            onCodePoint(REPLACEMENT_CHAR);
        else
            onCodePoint(cp);
    }
}


template <class Function> inline
void decodeUtf(std::wstring_view str, Function onCodePoint)
{
    static_assert(sizeof(wchar_t) == 4);
    for (const wchar_t c : str)
    {
        const CodePoint cp = static_cast<CodePoint>(c);
        onCodePoint(cp > CODE_POINT_MAX || (0xd800 <= cp && cp <= 0xdfff) ? REPLACEMENT_CHAR : cp);
    }
}


inline
void encodeUtf(CodePoint cp, std::string& output)
{
    if (cp < 0x80)
        output += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        output += static_cast<char>(0xc0 | (cp >> 6));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp < 0x10000)
    {
        output += static_cast<char>(0xe0 | (cp >> 12));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else
    {
        output += static_cast<char>(0xf0 | (cp >> 18));
        output += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
}


inline
void encodeUtf(CodePoint cp, std::wstring& output) { output += static_cast<wchar_t>(cp); }
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    const auto strView = impl::asView(str);
    using SourceChar = typename decltype(strView)::value_type;
    using TargetChar = typename TargetString::value_type;

    if constexpr (sizeof(SourceChar) == sizeof(TargetChar))
        return TargetString(strView.begin(), strView.end());
    else
    {
        std::basic_string<TargetChar> output;
        impl::decodeUtf(strView, [&](impl::CodePoint cp) { impl::encodeUtf(cp, output); });
        return TargetString(output);
    }
}


inline
bool isValidUtf(std::string_view str)
{
    //a literal U+FFFD in the input is valid, too, but we'd rather be strict than sorry
    bool valid = true;
    impl::decodeUtf(str, [&](impl::CodePoint cp) { if (cp == impl::REPLACEMENT_CHAR) valid = false; });
    return valid;
}


inline
size_t unicodeLength(std::string_view str)
{
    size_t len = 0;
    impl::decodeUtf(str, [&](impl::CodePoint) { ++len; });
    return len;
}
}

#endif //UTF_H_01832479146991573473545
