// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "curl_wrap.h"
#include <algorithm>
#include <mirr/thread.h>
    #include <fcntl.h>

using namespace mirr;


namespace
{
int curlInitLevel = 0; //support interleaving initialization calls!
//zero-initialized POD => not subject to static initialization order fiasco
}

void mirr::libcurlInit() //throw SysError
{
    assert(runningOnMainThread()); //libcurl requires init on main thread!
    assert(curlInitLevel >= 0);
    if (++curlInitLevel != 1) //non-atomic => require call from main thread
        return;

    //CURL_GLOBAL_DEFAULT = CURL_GLOBAL_SSL|CURL_GLOBAL_WIN32: libcurl initializes its TLS backend for FTPS
    if (const CURLcode rc = ::curl_global_init(CURL_GLOBAL_DEFAULT);
        rc != CURLE_OK)
    {
        --curlInitLevel;
        throw SysError(formatSystemError("curl_global_init", formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
    }
}


void mirr::libcurlTearDown()
{
    assert(runningOnMainThread()); //+ avoid race condition on "curlInitLevel"
    assert(curlInitLevel >= 1);
    if (--curlInitLevel != 0)
        return;

    ::curl_global_cleanup();
}


CurlSession::~CurlSession()
{
    if (easyHandle_)
        ::curl_easy_cleanup(easyHandle_);
}


CurlSession::Result CurlSession::perform(const std::string& url, const std::vector<CurlOption>& extraOptions,
                                         const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/, //optional
                                         const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/, //optional; return "bytesToRead" bytes unless end of stream!
                                         int timeoutSec) //throw SysError, X
{
    if (!easyHandle_)
    {
        easyHandle_ = ::curl_easy_init();
        if (!easyHandle_)
            throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
    }
    else
        ::curl_easy_reset(easyHandle_);

    auto setCurlOption = [easyHandle = easyHandle_](const CurlOption& curlOpt) //throw SysError
    {
        if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
            rc != CURLE_OK)
            throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                             formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
    };

    char curlErrorBuf[CURL_ERROR_SIZE] = {};
    setCurlOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

    setCurlOption({CURLOPT_URL, url.c_str()}); //throw SysError

    setCurlOption({CURLOPT_NOSIGNAL, 1}); //throw SysError
    //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html

    setCurlOption({CURLOPT_CONNECTTIMEOUT, timeoutSec}); //throw SysError

    //CURLOPT_TIMEOUT: hard limit for the complete transfer => not usable for files of arbitrary size
    setCurlOption({CURLOPT_LOW_SPEED_TIME, timeoutSec}); //throw SysError
    setCurlOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError
    //can't use "0" which means "inactive", so use some low number

    setCurlOption({CURLOPT_SERVER_RESPONSE_TIMEOUT, timeoutSec}); //throw SysError
    //FTP only; unlike CURLOPT_TIMEOUT does not limit the transfer itself

    setCurlOption({CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError
    //control connection stays idle during long transfers

    std::exception_ptr userCallbackException;

    //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
    auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
    {
        if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1) //=> RACE-condition if other thread calls fork/execv before this thread sets FD_CLOEXEC!
        {
            userCallbackException = std::make_exception_ptr(SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno)));
            return CURL_SOCKOPT_ERROR;
        }
        return CURL_SOCKOPT_OK;
    };

    using SocketCbType = decltype(onSocketCreate);
    using SocketCbWrapperType =            int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
    SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
    {
        return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
    };

    setCurlOption({CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
    setCurlOption({CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

    //no certificate checks for FTPS: self-signed certificates are the norm for FTP servers
    setCurlOption({CURLOPT_CAINFO, 0}); //throw SysError
    setCurlOption({CURLOPT_SSL_VERIFYPEER, 0}); //throw SysError
    setCurlOption({CURLOPT_SSL_VERIFYHOST, 0}); //throw SysError

    //---------------------------------------------------
    std::string headerData;
    auto onHeaderReceived = [&](const char* buffer, size_t len)
    {
        headerData.append(buffer, len);
        return len;
    };
    curl_write_callback onHeaderReceivedWrapper = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(onHeaderReceived)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
    };
    setCurlOption({CURLOPT_HEADERDATA, &onHeaderReceived}); //throw SysError
    setCurlOption({CURLOPT_HEADERFUNCTION, onHeaderReceivedWrapper}); //throw SysError
    //---------------------------------------------------
    auto onBytesReceived = [&](const char* buffer, size_t bytesToWrite)
    {
        try
        {
            writeResponse({buffer, bytesToWrite}); //throw X
            return bytesToWrite;
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
        }
    };
    curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
    };
    //---------------------------------------------------
    auto getBytesToSend = [&](char* buffer, size_t bytesToRead) -> size_t
    {
        try
        {
            /*  libcurl calls back until 0 bytes are returned (Posix read() semantics)
                [!] let's NOT use "incomplete read Posix semantics" for libcurl!
                who knows if libcurl buffers properly, or if it requests incomplete packages!?     */
            return readRequest({buffer, bytesToRead}); //throw X; return "bytesToRead" bytes unless end of stream
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
        }
    };
    curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
    };
    //---------------------------------------------------
    if (writeResponse)
    {
        setCurlOption({CURLOPT_WRITEDATA, &onBytesReceived}); //throw SysError
        setCurlOption({CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper}); //throw SysError
    }
    if (readRequest)
    {
        setCurlOption({CURLOPT_UPLOAD, 1}); //throw SysError
        //issues FTP STOR

        setCurlOption({CURLOPT_READDATA, &getBytesToSend}); //throw SysError
        setCurlOption({CURLOPT_READFUNCTION, getBytesToSendWrapper}); //throw SysError
    }

    if (std::any_of(extraOptions.begin(), extraOptions.end(), [](const CurlOption& o) { return o.option == CURLOPT_WRITEFUNCTION || o.option == CURLOPT_READFUNCTION || o.option == CURLOPT_HEADERFUNCTION; }))
    /**/ throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!"); //Option already used here!

    for (const CurlOption& option : extraOptions)
        setCurlOption(option); //throw SysError

    //=======================================================================================================
    const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);

    if (userCallbackException)
        std::rethrow_exception(userCallbackException); //throw X
    //=======================================================================================================

    long responseCode = 0; //optional
    if (::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &responseCode) != CURLE_OK)
        responseCode = 0;

    //"220 welcome\r\n331 password required\r\n...550 not found\r\n" => keep the last reply
    std::string lastReply;
    for (const std::string& line : splitCpy(headerData, '\n', SplitOnEmpty::skip))
        if (std::string lineTrm = trimCpy(line);
            !lineTrm.empty())
            lastReply = std::move(lineTrm);

    return {rcPerf, responseCode, trimCpy(std::string(curlErrorBuf)), std::move(lastReply)};
}


std::wstring mirr::formatCurlStatusCode(CURLcode sc)
{
    switch (sc)
    {
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_OK);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_UNSUPPORTED_PROTOCOL);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FAILED_INIT);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_URL_MALFORMAT);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_NOT_BUILT_IN);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_PROXY);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_HOST);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_CONNECT);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_WEIRD_SERVER_REPLY);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_ACCESS_DENIED);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_FAILED);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASS_REPLY);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_TIMEOUT);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASV_REPLY);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_227_FORMAT);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_CANT_GET_HOST);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_HTTP2);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_SET_TYPE);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_PARTIAL_FILE);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_RETR_FILE);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_OBSOLETE20);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_QUOTE_ERROR);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_HTTP_RETURNED_ERROR);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_WRITE_ERROR);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_OBSOLETE24);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_UPLOAD_FAILED);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_READ_ERROR);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_OUT_OF_MEMORY);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_OPERATION_TIMEDOUT);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_OBSOLETE29);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PORT_FAILED);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_USE_REST);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_OBSOLETE32);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_RANGE_ERROR);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CONNECT_ERROR);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_DOWNLOAD_RESUME);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FILE_COULDNT_READ_FILE);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_ABORTED_BY_CALLBACK);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_FUNCTION_ARGUMENT);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_INTERFACE_FAILED);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_UNKNOWN_OPTION);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SETOPT_OPTION_SYNTAX);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_GOT_NOTHING);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_ERROR);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_RECV_ERROR);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CERTPROBLEM);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CIPHER);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_PEER_FAILED_VERIFICATION);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FILESIZE_EXCEEDED);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_USE_SSL_FAILED);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_FAIL_REWIND);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_LOGIN_DENIED);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_DISK_FULL);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_EXISTS);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CACERT_BADFILE);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_NOT_FOUND);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_SHUTDOWN_FAILED);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_AGAIN);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CRL_BADFILE);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_ISSUER_ERROR);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PRET_FAILED);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_BAD_FILE_LIST);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_NO_CONNECTION_AVAILABLE);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_INVALIDCERTSTATUS);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_RECURSIVE_API_CALL);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_AUTH_ERROR);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_PROXY);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CLIENTCERT);
            MIRR_CHECK_CASE_FOR_CONSTANT(CURLE_UNRECOVERABLE_POLL);

        default:
            break;
    }
    return replaceCpy<wchar_t>(L"Curl status %x", L"%x", numberTo<std::wstring>(static_cast<int>(sc)));
}
