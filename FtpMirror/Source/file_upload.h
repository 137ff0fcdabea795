// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef FILE_UPLOAD_H_6102938475610293
#define FILE_UPLOAD_H_6102938475610293

#include <chrono>
#include <optional>
#include <mirr/file_error.h>
#include <mirr/zstring.h>
#include "ftp_client.h"


namespace fmr
{
using IoCallback = std::function<void(int64_t bytesDelta)>; //throw X

struct TransferTask
{
    Zstring localFilePath;
    RemoteAddress remoteAddr; //file address
};

struct RetryPolicy
{
    size_t maxAttempts = 3; //total number of attempts, including the first one
    std::chrono::milliseconds baseDelay{2000}; //delay before attempt n + 1: n * baseDelay
};

DEFINE_NEW_FILE_ERROR(ErrorUploadFailed)
DEFINE_NEW_FILE_ERROR(ErrorUploadVerification)

enum class UploadError
{
    none,
    retriesExhausted, //transient failure on every attempt
    permanent,        //login, permission, file name, malformed address: no retry
    verification,     //transfer completed, but not confirmed by "226"
    localRead,        //local file cannot be opened or read
};

struct UploadResult
{
    size_t attempts = 0;
    uint64_t bytesTransferred = 0; //of the last attempt
    UploadError errorType = UploadError::none;
    std::optional<mirr::FileError> error; //no value on success
};


/*  one attempt:
    - open local file, STOR to remote address, verify completion status 226
    - returns number of bytes sent                                       */
uint64_t uploadFileAttempt(const TransferTask& task, FtpClient& client, const Credentials& cred,
                           const IoCallback& notifyUnbufferedIO /*throw X*/); //throw FileError, ErrorUploadVerification, SysError, SysErrorFtp, X


/*  retry wrapper: upload failures are returned, not thrown
    - transient FTP failures are retried up to RetryPolicy::maxAttempts with linearly increasing delay
    - the worker thread may be stopped before each attempt and during the delay, never during a transfer
    - bytes of a failed attempt are reported back as negative delta                                      */
UploadResult uploadFile(const TransferTask& task, FtpClient& client, const Credentials& cred, const RetryPolicy& policy,
                        const std::function<void(const std::wstring& msg)>& onRetry /*throw X*/,
                        const IoCallback& notifyUnbufferedIO /*throw X*/); //throw ThreadStopRequest, X
}

#endif //FILE_UPLOAD_H_6102938475610293
