// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "remote_path.h"
#include <algorithm>
#include <cctype>
#include <mirr/file_error.h>

using namespace mirr;
using namespace fmr;


namespace
{
//"/a//b/" "a/b" => {"a", "b"}; item names are taken as-is: " a.txt" != "a.txt"
std::vector<std::string> getPathComponents(const std::string& path)
{
    return splitCpy(path, '/', SplitOnEmpty::skip);
}


std::string buildPath(const std::vector<std::string>& components, RemoteItemType type)
{
    std::string path = "/";
    for (const std::string& comp : components)
        path += comp + '/';

    if (type == RemoteItemType::file && path.size() > 1)
        path.pop_back();
    return path;
}
}


RemoteAddress fmr::formatRemoteAddress(const std::string& host, const std::string& relPath, RemoteItemType type) //throw SysError
{
    std::string server = trimCpy(host);

    std::string scheme = "ftp";
    if (contains(server, "://"))
    {
        scheme = beforeFirst(server, "://", IfNotFoundReturn::none);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
        server = afterFirst(server, "://", IfNotFoundReturn::none);
    }
    if (scheme != "ftp" && scheme != "ftps")
        throw SysError(replaceCpy(_("Unsupported protocol %x."), L"%x", fmtPath(scheme)));

    //"server/base/folder": the host may carry a base folder
    std::vector<std::string> components = getPathComponents(afterFirst(server, '/', IfNotFoundReturn::none));
    server = beforeFirst(server, '/', IfNotFoundReturn::all);

    if (server.empty())
        throw SysError(_("Server name must not be empty."));

    for (const std::string& comp : getPathComponents(trimCpy(relPath))) //user input: ignore surrounding blanks
        components.push_back(comp);

    return {scheme + "://" + server, buildPath(components, type)};
}


RemoteAddress fmr::appendRemotePath(const RemoteAddress& folderAddr, const std::string& relPath, RemoteItemType type) //throw SysError
{
    std::vector<std::string> components = getPathComponents(folderAddr.path);

    const std::vector<std::string> relComponents = getPathComponents(relPath);
    if (relComponents.empty())
        throw SysError(replaceCpy(_("Invalid item name %x."), L"%x", fmtPath(relPath)));

    for (const std::string& comp : relComponents)
    {
        if (comp == "." || comp == "..")
            throw SysError(replaceCpy(_("Invalid item name %x."), L"%x", fmtPath(relPath)));
        components.push_back(comp);
    }

    return {folderAddr.serverPrefix, buildPath(components, type)};
}


std::optional<RemoteAddress> fmr::getParentAddress(const RemoteAddress& addr)
{
    std::string path = addr.path;
    if (endsWith(path, '/'))
        path.pop_back();

    if (path.empty()) //root folder
        return std::nullopt;

    const size_t pos = path.rfind('/');
    if (pos == std::string::npos)
        return std::nullopt;

    return RemoteAddress{addr.serverPrefix, path.substr(0, pos + 1)};
}


std::string fmr::getServerRelPath(const RemoteAddress& addr)
{
    std::string relPath = addr.path;
    trim(relPath, TrimSide::both, [](char c) { return c == '/'; });
    return relPath;
}
