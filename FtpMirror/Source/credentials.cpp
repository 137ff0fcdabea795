// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "credentials.h"
#include <mirr/file_access.h>
#include <mirr/file_io.h>
#include <mirr/json.h>
#include <mirr/sys_info.h>

using namespace mirr;
using namespace fmr;


Credentials fmr::parseAccountDocument(const std::string& byteStream, const Zstring& filePath) //throw ErrorConfigInvalid
{
    const std::wstring errorMsg = replaceCpy(_("Configuration file %x is corrupted."), L"%x", fmtPath(filePath));

    JsonValue jval;
    try
    {
        jval = parseJson(byteStream); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw ErrorConfigInvalid(errorMsg, replaceCpy(replaceCpy(_("Syntax error in row %x, column %y."),
                                                                 L"%x", numberTo<std::wstring>(e.row + 1)),
                                                      L"%y", numberTo<std::wstring>(e.col + 1)));
    }

    if (jval.type != JsonValue::Type::object)
        throw ErrorConfigInvalid(errorMsg, _("JSON object expected."));

    auto getField = [&](const std::string& name)
    {
        if (std::optional<std::string> value = getStringFromJsonObject(jval, name))
            return *value;
        throw ErrorConfigInvalid(errorMsg, replaceCpy(_("Text field %x is missing."), L"%x", fmtPath(name)));
    };

    Credentials cred;
    cred.host     = trimCpy(getField("host"));
    cred.username = getField("username");
    cred.password = getField("password");

    if (cred.host.empty())
        throw ErrorConfigInvalid(errorMsg, _("Server name must not be empty."));

    return cred;
}


Credentials AccountFileSource::loadCredentials() const //throw ErrorConfigMissing, ErrorConfigInvalid
{
    Zstring filePath;
    try
    {
        filePath = filePath_ ? *filePath_ : getDefaultAccountFilePath(); //throw FileError
    }
    catch (const FileError& e)
    {
        throw ErrorConfigMissing(e.toString() + L"\n\n" + _("Pass the login with --user and --password or use --account."));
    }

    std::string byteStream;
    try
    {
        if (!getItemTypeIfExists(filePath)) //throw FileError
            throw ErrorConfigMissing(replaceCpy(_("Cannot find the FTP account file %x."), L"%x", fmtPath(filePath)),
                                     _("Pass the login with --user and --password or create the account file."));

        byteStream = getFileContent(filePath); //throw FileError
    }
    catch (const ErrorConfigMissing&) { throw; }
    catch (const FileError& e) { throw ErrorConfigInvalid(e.toString()); }

    return parseAccountDocument(byteStream, filePath); //throw ErrorConfigInvalid
}


Zstring fmr::getDefaultAccountFilePath() //throw FileError
{
    return appendPath(appendPath(getUserDataPath(), Zstr("FtpMirror")), Zstr("FtpAccount.json")); //throw FileError
}


Credentials fmr::resolveCredentials(const std::optional<std::string>& host,
                                    const std::optional<std::string>& username,
                                    const std::optional<std::string>& password,
                                    const CredentialSource& fallback) //throw ErrorConfigMissing, ErrorConfigInvalid
{
    if (!username || username->empty() ||
        !password || password->empty())
        return fallback.loadCredentials(); //throw ErrorConfigMissing, ErrorConfigInvalid

    Credentials cred;
    cred.host = host ? trimCpy(*host) : std::string();
    cred.username = *username;
    cred.password = *password;

    if (cred.host.empty())
        cred.host = fallback.loadCredentials().host; //throw ErrorConfigMissing, ErrorConfigInvalid

    return cred;
}
