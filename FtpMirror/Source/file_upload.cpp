// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "file_upload.h"
#include <algorithm>
#include <mirr/file_io.h>
#include <mirr/thread.h>
#include <mirr/time.h>

using namespace mirr;
using namespace fmr;


namespace
{
std::wstring getUploadErrorMsg(const TransferTask& task)
{
    return replaceCpy(replaceCpy(_("Cannot upload file %x to %y."), L"%x", fmtPath(task.localFilePath)),
                      L"%y", fmtPath(task.remoteAddr.toString()));
}


uint64_t uploadFileAttemptImpl(const TransferTask& task, FtpClient& client, const Credentials& cred,
                               const IoCallback& notifyUnbufferedIO /*throw X*/,
                               uint64_t& bytesSent) //throw FileError, ErrorUploadVerification, SysError, SysErrorFtp, X
{
    FileInputPlain fileIn(task.localFilePath); //throw FileError

    const long ftpStatus = client.storeFile(task.remoteAddr, cred, [&](std::span<char> buf) //throw SysError, SysErrorFtp, FileError, X
    {
        size_t bytesRead = 0;
        while (bytesRead < buf.size()) //tryRead() may return short: fill the block unless EOF
        {
            const size_t bytesReadNow = fileIn.tryRead(buf.data() + bytesRead, buf.size() - bytesRead); //throw FileError
            if (bytesReadNow == 0) //EOF
                break;
            bytesRead += bytesReadNow;
        }
        bytesSent += bytesRead;

        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X
        return bytesRead;
    });

    if (ftpStatus != FTP_STATUS_TRANSFER_COMPLETE)
        throw ErrorUploadVerification(getUploadErrorMsg(task), replaceCpy(_("Transfer not confirmed by the server: %x"), L"%x", formatFtpStatus(ftpStatus)));

    return bytesSent;
}
}


uint64_t fmr::uploadFileAttempt(const TransferTask& task, FtpClient& client, const Credentials& cred,
                                const IoCallback& notifyUnbufferedIO) //throw FileError, ErrorUploadVerification, SysError, SysErrorFtp, X
{
    uint64_t bytesSent = 0;
    return uploadFileAttemptImpl(task, client, cred, notifyUnbufferedIO, bytesSent);
}


UploadResult fmr::uploadFile(const TransferTask& task, FtpClient& client, const Credentials& cred, const RetryPolicy& policy,
                             const std::function<void(const std::wstring& msg)>& onRetry /*throw X*/,
                             const IoCallback& notifyUnbufferedIO /*throw X*/) //throw ThreadStopRequest, X
{
    const size_t maxAttempts = std::max<size_t>(policy.maxAttempts, 1);
    UploadResult result;

    auto setError = [&](UploadError errorType, const FileError& e)
    {
        result.errorType = errorType;
        result.error = e;
        return result;
    };

    for (size_t attempt = 1;; ++attempt)
    {
        interruptionPoint(); //throw ThreadStopRequest
        result.attempts = attempt;

        uint64_t bytesSent = 0;
        auto undoProgress = [&] //failed attempt: bytes will be sent again or not at all
        {
            if (notifyUnbufferedIO && bytesSent != 0)
                notifyUnbufferedIO(-static_cast<int64_t>(bytesSent)); //throw X
            result.bytesTransferred = bytesSent;
        };

        try
        {
            result.bytesTransferred = uploadFileAttemptImpl(task, client, cred, notifyUnbufferedIO, bytesSent); //throw FileError, ErrorUploadVerification, SysError, SysErrorFtp, X
            return result;
        }
        catch (const ErrorUploadVerification& e)
        {
            undoProgress(); //throw X; data was sent, but the file counts as failed
            return setError(UploadError::verification, e);
        }
        catch (const SysErrorFtp& e)
        {
            undoProgress(); //throw X

            if (!isTransientFtpError(e))
                return setError(UploadError::permanent, ErrorUploadFailed(getUploadErrorMsg(task), e.toString()));

            if (attempt >= maxAttempts)
                return setError(UploadError::retriesExhausted,
                                ErrorUploadFailed(getUploadErrorMsg(task), e.toString() + L"\n\n" +
                                                  _P("Failed after 1 attempt.", "Failed after %x attempts.", attempt)));

            const std::chrono::milliseconds retryDelay = policy.baseDelay * static_cast<int64_t>(attempt);

            if (onRetry)
                onRetry(_("Automatic retry") + L' ' + numberTo<std::wstring>(attempt + 1) + L'/' + numberTo<std::wstring>(maxAttempts) + L": " +
                        replaceCpy(_("Waiting %x."), L"%x", utfTo<std::wstring>(formatTimeSpan(std::chrono::duration_cast<std::chrono::seconds>(retryDelay).count()))) +
                        L"\n" + getUploadErrorMsg(task) + L"\n" + e.toString()); //throw X

            interruptibleSleep(retryDelay); //throw ThreadStopRequest
        }
        catch (const SysError& e)
        {
            undoProgress(); //throw X
            return setError(UploadError::permanent, ErrorUploadFailed(getUploadErrorMsg(task), e.toString()));
        }
        catch (const FileError& e)
        {
            undoProgress(); //throw X
            return setError(UploadError::localRead, e);
        }
    }
}
