// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef UTF_H_0192837465019283746
#define UTF_H_0192837465019283746

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>


namespace mirr
{
//convert between UTF-8 (std::string) and UTF-32 (std::wstring on Linux)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

const char32_t REPLACEMENT_CHAR = 0xfffd;








//----------------------- implementation ----------------------------------
static_assert(sizeof(wchar_t) == 4, "UTF-32 wchar_t expected");

namespace impl
{
inline
void codePointToUtf8(char32_t cp, std::string& out)
{
    if (cp >= 0xd800 && cp <= 0xdfff) //surrogates are not valid code points
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
    else if (cp <= 0x10ffff)
    {
        out += static_cast<char>(0xf0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else
        codePointToUtf8(REPLACEMENT_CHAR, out);
}


//invalid sequences are decoded as REPLACEMENT_CHAR, one per offending byte
inline
std::wstring utf8ToWide(std::string_view str)
{
    std::wstring output;
    output.reserve(str.size());

    for (size_t i = 0; i < str.size();)
    {
        const auto lead = static_cast<unsigned char>(str[i]);

        size_t trailLen = 0;
        char32_t cp = 0;
        if (lead < 0x80)
            cp = lead;
        else if ((lead & 0xe0) == 0xc0)
        {
            trailLen = 1;
            cp = lead & 0x1f;
        }
        else if ((lead & 0xf0) == 0xe0)
        {
            trailLen = 2;
            cp = lead & 0x0f;
        }
        else if ((lead & 0xf8) == 0xf0)
        {
            trailLen = 3;
            cp = lead & 0x07;
        }
        else
        {
            output += static_cast<wchar_t>(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        if (i + trailLen >= str.size()) //truncated sequence
        {
            output += static_cast<wchar_t>(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t t = 1; t <= trailLen; ++t)
        {
            const auto trail = static_cast<unsigned char>(str[i + t]);
            if ((trail & 0xc0) != 0x80)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (trail & 0x3f);
        }

        if (!valid)
        {
            output += static_cast<wchar_t>(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        output += static_cast<wchar_t>(cp);
        i += 1 + trailLen;
    }
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());

    for (const wchar_t c : str)
        codePointToUtf8(static_cast<char32_t>(c), output);
    return output;
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    using SourceChar = std::remove_cvref_t<decltype(str[0])>;

    if constexpr (std::is_same_v<SourceChar, typename TargetString::value_type>)
        return TargetString(str);
    else if constexpr (std::is_same_v<SourceChar, char>)
        return impl::utf8ToWide(str);
    else
        return impl::wideToUtf8(str);
}
}

#endif //UTF_H_0192837465019283746
