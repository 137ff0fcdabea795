// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef I18N_H_8273645019283746501
#define I18N_H_8273645019283746501

#include <cstdint>
#include <cstdlib>
#include "string_tools.h"


//all user-visible text passes through these macros to keep it greppable for a later translation
//use %x as number placeholder for plural forms

#define MIRR_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        mirr::translate(MIRR_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) mirr::translate(MIRR_TRANS_CONCAT_SUB(L, s), MIRR_TRANS_CONCAT_SUB(L, p), n)


namespace mirr
{
inline
std::wstring translate(const std::wstring& text) { return text; }


//"%x file" "%x files"
template <class T> inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, T n)
{
    static_assert(sizeof(n) <= sizeof(int64_t));
    const auto n64 = static_cast<int64_t>(n);

    assert(contains(plural, L"%x"));
    return replaceCpy(std::abs(n64) == 1 ? singular : plural, L"%x", numberTo<std::wstring>(n64));
}
}

#endif //I18N_H_8273645019283746501
