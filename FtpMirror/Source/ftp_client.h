// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef FTP_CLIENT_H_5019283746510928
#define FTP_CLIENT_H_5019283746510928

#include <functional>
#include <span>
#include "credentials.h"
#include "ftp_error.h"
#include "remote_path.h"


namespace fmr
{
/*  the three FTP operations needed for mirroring
    - each call runs on its own control connection: login, command, logout
    - thread-safe: called concurrently by the upload workers
    - failure: SysErrorFtp with the curl status and the last FTP reply code      */
class FtpClient
{
public:
    virtual ~FtpClient() {}

    //LIST; folder missing => SysErrorFtp with ftpStatus 550
    virtual void listFolder(const RemoteAddress& folderAddr, const Credentials& cred) = 0; //throw SysError, SysErrorFtp

    //MKD; folder existing => SysErrorFtp with ftpStatus 550
    virtual void makeFolder(const RemoteAddress& folderAddr, const Credentials& cred) = 0; //throw SysError, SysErrorFtp

    //STOR; returns the final reply code of the transfer, e.g. 226
    virtual long storeFile(const RemoteAddress& fileAddr, const Credentials& cred,
                           const std::function<size_t(std::span<char> buf)>& readBlock /*throw X; return "buf.size()" bytes unless end of stream*/) = 0; //throw SysError, SysErrorFtp, X
};


struct FtpSessionCfg
{
    int timeoutSec = 30;
    bool useTls = false; //explicit FTPS (AUTH TLS); "ftps://" addresses use implicit TLS
};


//passive mode, binary transfers
class CurlFtpClient : public FtpClient
{
public:
    explicit CurlFtpClient(const FtpSessionCfg& cfg) : cfg_(cfg) {}

    void listFolder(const RemoteAddress& folderAddr, const Credentials& cred) override; //throw SysError, SysErrorFtp
    void makeFolder(const RemoteAddress& folderAddr, const Credentials& cred) override; //throw SysError, SysErrorFtp
    long storeFile(const RemoteAddress& fileAddr, const Credentials& cred,
                   const std::function<size_t(std::span<char> buf)>& readBlock) override; //throw SysError, SysErrorFtp, X

private:
    const FtpSessionCfg cfg_;
};
}

#endif //FTP_CLIENT_H_5019283746510928
