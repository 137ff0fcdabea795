// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef CURL_WRAP_H_2879058325032785032789645
#define CURL_WRAP_H_2879058325032785032789645

#include <span>
#include <functional>
#include <vector>
#include <mirr/sys_error.h>


//-------------------------------------------------
#include <curl/curl.h>
//-------------------------------------------------

#ifndef CURLINC_CURL_H
    #error curl.h header guard changed
#endif

namespace mirr
{
void libcurlInit(); //throw SysError
void libcurlTearDown();


struct CurlOption
{
    template <class T>
    CurlOption(CURLoption o, T val) : option(o), value(static_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    template <class T>
    CurlOption(CURLoption o, T* val) : option(o), value(reinterpret_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    CURLoption option = CURLOPT_LASTENTRY;
    uint64_t value = 0;
};


//one easy handle per session: the connection is owned by the session and closed with it
class CurlSession
{
public:
    CurlSession() {}
    ~CurlSession();

    struct Result
    {
        CURLcode curlCode = CURLE_OK;
        long responseCode = 0;  //last protocol reply code, 0 if none
        std::string errorMsg;   //CURLOPT_ERRORBUFFER
        std::string lastReply;  //last line received on the control connection
    };
    Result perform(const std::string& url, const std::vector<CurlOption>& extraOptions,
                   const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/, //optional
                   const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/, //optional; return "bytesToRead" bytes unless end of stream!
                   int timeoutSec); //throw SysError, X

private:
    CurlSession           (const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    CURL* easyHandle_ = nullptr;
};


std::wstring formatCurlStatusCode(CURLcode sc);
}

#else
#error Why is this header already defined? Do not include in other headers: encapsulate the gory details!
#endif //CURL_WRAP_H_2879058325032785032789645
