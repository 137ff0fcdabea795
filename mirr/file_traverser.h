// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef FILE_TRAVERSER_H_8273610293847561
#define FILE_TRAVERSER_H_8273610293847561

#include <cstdint>
#include <functional>
#include "file_error.h"
#include "zstring.h"


namespace mirr
{
struct FileInfo
{
    Zstring itemName;
    Zstring fullPath;
    uint64_t fileSize = 0; //[bytes]
};

struct FolderInfo
{
    Zstring itemName;
    Zstring fullPath;
};

struct SymlinkInfo
{
    Zstring itemName;
    Zstring fullPath;
};

//- non-recursive
//- "." and ".." are skipped
void traverseFolder(const Zstring& dirPath,
                    const std::function<void(const FileInfo&    fi)>& onFile,  /*optional*/
                    const std::function<void(const FolderInfo&  fi)>& onFolder,/*optional*/
                    const std::function<void(const SymlinkInfo& si)>& onSymlink/*optional*/); //throw FileError
}

#endif //FILE_TRAVERSER_H_8273610293847561
