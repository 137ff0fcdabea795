// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef FTP_ERROR_H_7450918237465019
#define FTP_ERROR_H_7450918237465019

#include <mirr/sys_error.h>


namespace fmr
{
//FTP status codes interpreted by the mirror logic: https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
const long FTP_STATUS_TRANSFER_COMPLETE    = 226; //"Closing data connection. Requested file action successful"
const long FTP_STATUS_SERVICE_UNAVAILABLE  = 421;
const long FTP_STATUS_CANT_OPEN_DATA       = 425;
const long FTP_STATUS_CONNECTION_CLOSED    = 426;
const long FTP_STATUS_LOGIN_FAILED         = 530;
const long FTP_STATUS_FILE_UNAVAILABLE     = 550; //"Requested action not taken. File unavailable"
const long FTP_STATUS_FILE_NAME_NOT_ALLOWED = 553;


struct SysErrorFtp : public mirr::SysError
{
    SysErrorFtp(const std::wstring& msg, int curlStatus, long ftpStatusCode) : SysError(msg), curlCode(curlStatus), ftpStatus(ftpStatusCode) {}

    int  curlCode;  //CURLcode; 0 (CURLE_OK) if the command itself completed
    long ftpStatus; //last FTP reply code; 0 if none was received
};

//transient: server busy, control or data connection lost, timeout => worth another attempt
bool isTransientFtpError(const SysErrorFtp& e);

std::wstring formatFtpStatus(long sc);
}

#endif //FTP_ERROR_H_7450918237465019
