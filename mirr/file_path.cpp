// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "file_path.h"
#include <cstdlib>
#include "thread.h"

using namespace mirr;


std::optional<Zstring> mirr::getParentFolderPath(const Zstring& itemPath)
{
    const Zstring path = removeTrailingSeparator(itemPath);
    if (path == Zstr("/") || !contains(path, FILE_NAME_SEPARATOR))
        return std::nullopt;

    const Zstring parentPath = beforeLast(path, FILE_NAME_SEPARATOR, IfNotFoundReturn::none);
    if (parentPath.empty()) //"/dir" => "/"
        return Zstring(1, FILE_NAME_SEPARATOR);
    return parentPath;
}


Zstring mirr::getFileExtension(const Zstring& filePath)
{
    const Zstring fileName = getItemName(filePath);
    return afterLast(fileName, Zstr('.'), IfNotFoundReturn::none);
}


Zstring mirr::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (relPath.empty())
        return basePath;
    if (basePath.empty())
        return relPath;

    if (startsWith(relPath, FILE_NAME_SEPARATOR))
    {
        if (relPath.size() == 1)
            return basePath;

        if (endsWith(basePath, FILE_NAME_SEPARATOR))
            return basePath + (relPath.c_str() + 1);
    }
    else if (!endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + FILE_NAME_SEPARATOR + relPath;

    return basePath + relPath;
}


Zstring mirr::removeTrailingSeparator(Zstring path)
{
    while (path.size() > 1 && endsWith(path, FILE_NAME_SEPARATOR))
        path.pop_back();
    return path;
}


std::optional<Zstring> mirr::getEnvironmentVar(const Zstring& name)
{
    assert(runningOnMainThread());

    const char* buffer = ::getenv(name.c_str());
    if (!buffer)
        return std::nullopt;

    Zstring value(buffer);

    //some environment variables are quoted by the shell
    if (value.size() >= 2 && startsWith(value, Zstr('"')) && endsWith(value, Zstr('"')))
        value = value.substr(1, value.size() - 2);

    return value;
}
