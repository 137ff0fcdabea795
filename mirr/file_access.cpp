// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "file_access.h"
#include <vector>
#include "file_traverser.h"

    #include <sys/stat.h>
    #include <unistd.h>

using namespace mirr;


namespace
{
struct SysErrorCode : public SysError
{
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};


ItemType getItemTypeImpl(const Zstring& itemPath) //throw SysErrorCode
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        throw SysErrorCode("lstat", errno);

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}
}


ItemType mirr::getItemType(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString()); }
}


std::optional<ItemType> mirr::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysErrorCode& e)
    {
        if (e.errorCode == ENOENT || e.errorCode == ENOTDIR) //ENOTDIR: parent component is a file
            return std::nullopt;
        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString());
    }
}


ItemType mirr::getItemTypeFollowLink(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::stat(itemPath.c_str(), &itemInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot resolve symbolic link %x."), L"%x", fmtPath(itemPath)), "stat");

    return S_ISDIR(itemInfo.st_mode) ? ItemType::folder : ItemType::file;
}


uint64_t mirr::getFileSize(const Zstring& filePath) //throw FileError
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), "stat");

    return fileInfo.st_size;
}


void mirr::removeFilePlain(const Zstring& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), "unlink");
}


void mirr::removeDirectoryPlainRecursion(const Zstring& dirPath) //throw FileError
{
    if (getItemType(dirPath) == ItemType::symlink) //throw FileError
        return removeFilePlain(dirPath); //throw FileError

    std::vector<Zstring> folderPaths;
    traverseFolder(dirPath,
    [&](const    FileInfo& fi) { removeFilePlain(fi.fullPath); }, //throw FileError
    [&](const  FolderInfo& fi) { folderPaths.push_back(fi.fullPath); },
    [&](const SymlinkInfo& si) { removeFilePlain(si.fullPath); }); //throw FileError

    for (const Zstring& subFolderPath : folderPaths)
        removeDirectoryPlainRecursion(subFolderPath); //throw FileError

    if (::rmdir(dirPath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dirPath)), "rmdir");
}


void mirr::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    if (const std::optional<ItemType> type = getItemTypeIfExists(dirPath)) //throw FileError
    {
        if (*type == ItemType::file)
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)),
                            replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPath))));
        return;
    }

    if (const std::optional<Zstring> parentPath = getParentFolderPath(dirPath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

    if (::mkdir(dirPath.c_str(), mode) != 0)
    {
        const ErrorCode ec = errno; //copy before making other system calls!
        if (ec == EEXIST) //created in the meantime
            return;
        throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
    }
}
