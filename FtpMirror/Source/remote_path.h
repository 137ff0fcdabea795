// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef REMOTE_PATH_H_3019283746501928
#define REMOTE_PATH_H_3019283746501928

#include <optional>
#include <mirr/sys_error.h>


namespace fmr
{
/*  "ftp://server:2121/folder/sub/"     folder
    "ftp://server:2121/folder/file.txt" file

    - path is relative to the login folder of the FTP account
    - forward slashes only, no empty segments
    - trailing slash <=> folder                              */
struct RemoteAddress
{
    std::string serverPrefix; //scheme and authority: "ftp://server:2121"
    std::string path = "/";   //starting with '/'

    bool isFolder() const { return mirr::endsWith(path, '/'); }
    bool isRoot() const { return path == "/"; }

    std::string toString() const { return serverPrefix + path; }

    bool operator==(const RemoteAddress&) const = default;
};

enum class RemoteItemType
{
    folder,
    file,
};

//host: "server", "server:2121", "ftp://server", "ftps://server/base/folder"
RemoteAddress formatRemoteAddress(const std::string& host, const std::string& relPath, RemoteItemType type = RemoteItemType::folder); //throw SysError

//join a folder address with a relative path ("name" or "sub/name"): same slash rules as formatRemoteAddress(), but names are not trimmed
//fails if relPath has no name component or contains "." or ".."
RemoteAddress appendRemotePath(const RemoteAddress& folderAddr, const std::string& relPath, RemoteItemType type); //throw SysError

//parent folder; no value for the root folder
std::optional<RemoteAddress> getParentAddress(const RemoteAddress& addr);

//"folder/sub" as sent in FTP commands: no leading or trailing slash, not escaped
std::string getServerRelPath(const RemoteAddress& addr);
}

#endif //REMOTE_PATH_H_3019283746501928
