// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "sys_error.h"
    #include <glib.h>

using namespace mirr;


namespace
{
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes reachable through local file access and socket I/O
    {
            MIRR_CHECK_CASE_FOR_CONSTANT(EPERM);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENOENT);
            MIRR_CHECK_CASE_FOR_CONSTANT(EINTR);
            MIRR_CHECK_CASE_FOR_CONSTANT(EIO);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENXIO);
            MIRR_CHECK_CASE_FOR_CONSTANT(EBADF);
            MIRR_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            MIRR_CHECK_CASE_FOR_CONSTANT(EACCES);
            MIRR_CHECK_CASE_FOR_CONSTANT(EFAULT);
            MIRR_CHECK_CASE_FOR_CONSTANT(EBUSY);
            MIRR_CHECK_CASE_FOR_CONSTANT(EEXIST);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENODEV);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            MIRR_CHECK_CASE_FOR_CONSTANT(EISDIR);
            MIRR_CHECK_CASE_FOR_CONSTANT(EINVAL);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENFILE);
            MIRR_CHECK_CASE_FOR_CONSTANT(EMFILE);
            MIRR_CHECK_CASE_FOR_CONSTANT(EFBIG);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            MIRR_CHECK_CASE_FOR_CONSTANT(EROFS);
            MIRR_CHECK_CASE_FOR_CONSTANT(EPIPE);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            MIRR_CHECK_CASE_FOR_CONSTANT(ELOOP);
            MIRR_CHECK_CASE_FOR_CONSTANT(EOVERFLOW);
            MIRR_CHECK_CASE_FOR_CONSTANT(EILSEQ);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            MIRR_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            MIRR_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENETRESET);
            MIRR_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            MIRR_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENOBUFS);
            MIRR_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            MIRR_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            MIRR_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            MIRR_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
            MIRR_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            MIRR_CHECK_CASE_FOR_CONSTANT(ESTALE);
            MIRR_CHECK_CASE_FOR_CONSTANT(EDQUOT);
            MIRR_CHECK_CASE_FOR_CONSTANT(ECANCELED);
        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}
}


std::wstring mirr::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    MIRR_ON_SCOPE_EXIT(errno = ecCurrent);

    std::wstring errorMsg = utfTo<std::wstring>(std::string(::g_strerror(ec))); //thread-safe unlike strerror()
    trim(errorMsg);
    return errorMsg;
}


std::wstring mirr::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring mirr::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}
