// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef CREDENTIALS_H_1928374650192837
#define CREDENTIALS_H_1928374650192837

#include <optional>
#include <mirr/file_error.h>
#include <mirr/zstring.h>


namespace fmr
{
struct Credentials
{
    std::string host;     //"server", "server:2121", "ftp://server"
    std::string username; //UTF-8
    std::string password; //
};

DEFINE_NEW_FILE_ERROR(ErrorConfigMissing)
DEFINE_NEW_FILE_ERROR(ErrorConfigInvalid)


class CredentialSource
{
public:
    virtual ~CredentialSource() {}

    virtual Credentials loadCredentials() const = 0; //throw ErrorConfigMissing, ErrorConfigInvalid
};


//JSON document: {"host": "...", "username": "...", "password": "..."}
//no file path: getDefaultAccountFilePath(), resolved only when the credentials are loaded
class AccountFileSource : public CredentialSource
{
public:
    explicit AccountFileSource(const std::optional<Zstring>& filePath) : filePath_(filePath) {}

    Credentials loadCredentials() const override; //throw ErrorConfigMissing, ErrorConfigInvalid

private:
    const std::optional<Zstring> filePath_;
};

Credentials parseAccountDocument(const std::string& byteStream, const Zstring& filePath /*for error messages*/); //throw ErrorConfigInvalid

//$XDG_CONFIG_HOME/FtpMirror/FtpAccount.json or ~/.config/FtpMirror/FtpAccount.json
Zstring getDefaultAccountFilePath(); //throw FileError


/*  - username or password missing or empty: take all three fields from "fallback"
    - only the host missing: take the host from "fallback"
    - "fallback" is not accessed if everything was given explicitly        */
Credentials resolveCredentials(const std::optional<std::string>& host,
                               const std::optional<std::string>& username,
                               const std::optional<std::string>& password,
                               const CredentialSource& fallback); //throw ErrorConfigMissing, ErrorConfigInvalid
}

#endif //CREDENTIALS_H_1928374650192837
