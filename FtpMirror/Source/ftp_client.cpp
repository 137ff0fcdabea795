// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "ftp_client.h"
#include <stdexcept>
#include <libcurl/curl_wrap.h>

using namespace mirr;
using namespace fmr;


namespace
{
//"ftp://server/folder/file%20name.txt": each path component percent-encoded, '/' kept as separator
std::string getCurlUrl(const RemoteAddress& addr) //throw SysError
{
    std::string url = addr.serverPrefix + '/';

    for (const std::string& comp : splitCpy(addr.path, '/', SplitOnEmpty::skip))
    {
        char* compFmt = ::curl_easy_escape(nullptr, comp.c_str(), static_cast<int>(comp.size())); //handle is ignored by libcurl
        if (!compFmt)
            throw SysError(formatSystemError("curl_easy_escape", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
        MIRR_ON_SCOPE_EXIT(::curl_free(compFmt));

        url += compFmt;
        url += '/';
    }

    if (!addr.isFolder() && endsWith(url, '/'))
        url.pop_back();
    return url;
}


//throw SysErrorFtp for every failed curl_easy_perform(): caller decides on retry
void checkFtpResult(const CurlSession::Result& result) //throw SysErrorFtp
{
    if (result.curlCode == CURLE_OK)
        return;

    std::wstring errorMsg = utfTo<std::wstring>(result.errorMsg); //optional

    if (!result.lastReply.empty()) //that *should* be the server's error response
        errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(result.lastReply);
    else if (result.responseCode != 0)
        errorMsg += (errorMsg.empty() ? L"" : L"\n") + formatFtpStatus(result.responseCode);

    throw SysErrorFtp(formatSystemError("curl_easy_perform", formatCurlStatusCode(result.curlCode), errorMsg), result.curlCode, result.responseCode);
}


std::vector<CurlOption> getSessionOptions(const RemoteAddress& addr, const Credentials& cred, const FtpSessionCfg& cfg)
{
    std::vector<CurlOption> options =
    {
        //allow PASV IP: some FTP servers really use IP different from control connection
        {CURLOPT_FTP_SKIP_PASV_IP, 0L},

        {CURLOPT_FTP_FILEMETHOD, CURLFTPMETHOD_SINGLECWD},
    };

    if (!cred.username.empty()) //else: libcurl will default to CURL_DEFAULT_USER("anonymous") and CURL_DEFAULT_PASSWORD("ftp@example.com")
    {
        options.emplace_back(CURLOPT_USERNAME, cred.username.c_str());
        options.emplace_back(CURLOPT_PASSWORD, cred.password.c_str());
    }

    if (cfg.useTls && !startsWith(addr.serverPrefix, "ftps://")) //"ftps://" => implicit TLS on port 990
    {
        options.emplace_back(CURLOPT_USE_SSL,    CURLUSESSL_ALL);
        options.emplace_back(CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS);
    }
    return options;
}
}


void CurlFtpClient::listFolder(const RemoteAddress& folderAddr, const Credentials& cred) //throw SysError, SysErrorFtp
{
    std::vector<CurlOption> options = getSessionOptions(folderAddr, cred, cfg_);
    options.emplace_back(CURLOPT_DIRLISTONLY, 1L); //NLST: the listing content is not needed, only whether the server can provide it

    CurlSession session;
    const CurlSession::Result result = session.perform(getCurlUrl(folderAddr), options,
                                                       [](std::span<const char> buf) {} /*discard listing*/,
                                                       nullptr /*readRequest*/, cfg_.timeoutSec); //throw SysError
    checkFtpResult(result); //throw SysErrorFtp
}


void CurlFtpClient::makeFolder(const RemoteAddress& folderAddr, const Credentials& cred) //throw SysError, SysErrorFtp
{
    const std::string serverRelPath = getServerRelPath(folderAddr);
    if (serverRelPath.empty())
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!"); //root folder always exists

    curl_slist* quote = nullptr;
    MIRR_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
    quote = ::curl_slist_append(quote, ("MKD " + serverRelPath).c_str());
    if (!quote)
        throw SysError(formatSystemError("curl_slist_append", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));

    std::vector<CurlOption> options = getSessionOptions(folderAddr, cred, cfg_);
    options.emplace_back(CURLOPT_NOBODY, 1L);
    options.emplace_back(CURLOPT_QUOTE, quote);

    //QUOTE commands run relative to the login folder => connect to the root address
    CurlSession session;
    const CurlSession::Result result = session.perform(getCurlUrl({folderAddr.serverPrefix, "/"}), options,
                                                       nullptr /*writeResponse*/, nullptr /*readRequest*/, cfg_.timeoutSec); //throw SysError
    checkFtpResult(result); //throw SysErrorFtp
}


long CurlFtpClient::storeFile(const RemoteAddress& fileAddr, const Credentials& cred,
                              const std::function<size_t(std::span<char> buf)>& readBlock) //throw SysError, SysErrorFtp, X
{
    if (fileAddr.isFolder() || !readBlock)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    CurlSession session;
    const CurlSession::Result result = session.perform(getCurlUrl(fileAddr), getSessionOptions(fileAddr, cred, cfg_),
                                                       nullptr /*writeResponse*/, readBlock, cfg_.timeoutSec); //throw SysError, X
    checkFtpResult(result); //throw SysErrorFtp

    return result.responseCode; //"226 Transfer complete"
}
