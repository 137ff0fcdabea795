// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef FILE_PATH_H_6172839405617283
#define FILE_PATH_H_6172839405617283

#include <optional>
#include "zstring.h"
#include "string_tools.h"


namespace mirr
{
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no value for "/" and for relative paths without separator
inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

Zstring getFileExtension(const Zstring& filePath); //without dot, e.g. "meta" for "a.txt.meta"; empty if none

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//"/home/user/dir/" => "/home/user/dir"; keeps "/"
Zstring removeTrailingSeparator(Zstring path);

//main thread only: ::getenv() is not thread-safe
std::optional<Zstring> getEnvironmentVar(const Zstring& name);
}

#endif //FILE_PATH_H_6172839405617283
