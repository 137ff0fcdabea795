// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef FILE_ACCESS_H_5019283746510293
#define FILE_ACCESS_H_5019283746510293

#include <cstdint>
#include <optional>
#include "file_error.h"
#include "file_path.h"


namespace mirr
{
enum class ItemType
{
    file,
    folder,
    symlink,
};
//(hopefully) fast: does not distinguish between error/not existing
ItemType getItemType(const Zstring& itemPath); //throw FileError
//execute potentially SLOW folder traversal but distinguish error/not existing
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

//resolve symlinks: never returns ItemType::symlink
ItemType getItemTypeFollowLink(const Zstring& itemPath); //throw FileError

uint64_t getFileSize(const Zstring& filePath); //throw FileError

void removeFilePlain(const Zstring& filePath); //throw FileError
void removeDirectoryPlainRecursion(const Zstring& dirPath); //throw FileError

void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_5019283746510293
