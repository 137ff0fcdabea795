// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef SYS_ERROR_H_7219384756102938
#define SYS_ERROR_H_7219384756102938

#include <cerrno>
#include "scope_guard.h" //
#include "i18n.h"        //not used by this header, but most callers need it
#include "utf.h"         //


namespace mirr
{
using ErrorCode = int;

inline
ErrorCode getLastError() { return errno; } //don't use "::" prefix, errno is a macro!

//"<error code>: <description> [<function name>]"
std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);

std::wstring getSystemErrorDescription(ErrorCode ec); //return empty string on error


//low-level exception class giving (non-translated) detail information only
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    virtual ~SysError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public mirr::SysError { X(const std::wstring& msg) : SysError(msg) {} };


#define THROW_LAST_SYS_ERROR(functionName) \
    do { const mirr::ErrorCode ecInternal = mirr::getLastError(); throw mirr::SysError(mirr::formatSystemError(functionName, ecInternal)); } while (false)
}

#endif //SYS_ERROR_H_7219384756102938
