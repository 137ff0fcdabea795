// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "ftp_error.h"
#include <libcurl/curl_wrap.h>

using namespace mirr;
using namespace fmr;


bool fmr::isTransientFtpError(const SysErrorFtp& e)
{
    switch (e.ftpStatus)
    {
        case FTP_STATUS_SERVICE_UNAVAILABLE:
        case FTP_STATUS_CANT_OPEN_DATA:
        case FTP_STATUS_CONNECTION_CLOSED:
            return true;
    }

    switch (static_cast<CURLcode>(e.curlCode))
    {
        //*INDENT-OFF*
        case CURLE_OPERATION_TIMEDOUT: //CURLOPT_CONNECTTIMEOUT, CURLOPT_LOW_SPEED_TIME, CURLOPT_SERVER_RESPONSE_TIMEOUT
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_FTP_ACCEPT_FAILED:
        case CURLE_FTP_ACCEPT_TIMEOUT:
        case CURLE_FTP_CANT_GET_HOST: //failed to open data connection after PASV/EPSV
            return true;
        default:
            return false;
        //*INDENT-ON*
    }
}


std::wstring fmr::formatFtpStatus(long sc)
{
    const wchar_t* statusText = [&] //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 226: return L"Closing data connection. Requested file action successful.";
            case 250: return L"Requested file action okay, completed.";
            case 257: return L"Pathname created.";

            case 400: return L"The command was not accepted but the error condition is temporary.";
            case 421: return L"Service not available, closing control connection.";
            case 425: return L"Cannot open data connection.";
            case 426: return L"Connection closed; transfer aborted.";
            case 430: return L"Invalid username or password.";
            case 434: return L"Requested host unavailable.";
            case 450: return L"Requested file action not taken.";
            case 451: return L"Local error in processing.";
            case 452: return L"Insufficient storage space in system. File unavailable, e.g. file busy.";

            case 500: return L"Syntax error, command unrecognized or command line too long.";
            case 501: return L"Syntax error in parameters or arguments.";
            case 502: return L"Command not implemented.";
            case 503: return L"Bad sequence of commands.";
            case 504: return L"Command not implemented for that parameter.";
            case 530: return L"User not logged in.";
            case 532: return L"Need account for storing files.";
            case 534: return L"Could not connect to server; issue regarding SSL.";
            case 550: return L"File unavailable, e.g. file not found, no access.";
            case 551: return L"Requested action aborted. Page type unknown.";
            case 552: return L"Requested file action aborted. Exceeded storage allocation.";
            case 553: return L"File name not allowed.";

            default:  return L"";
            //*INDENT-ON*
        }
    }();

    if (*statusText == L'\0')
        return replaceCpy<wchar_t>(L"FTP status %x.", L"%x", numberTo<std::wstring>(sc));
    else
        return replaceCpy<wchar_t>(L"FTP status %x: ", L"%x", numberTo<std::wstring>(sc)) + statusText;
}
