// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef FILE_IO_H_9182736450918273
#define FILE_IO_H_9182736450918273

#include <cstdint>
#include <string_view>
#include <utility>
#include "file_error.h"
#include "zstring.h"


namespace mirr
{
/*  OS-buffered file I/O:
    - sequential read/write accesses
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    const Zstring& getFilePath() const { return filePath_; }

    static constexpr size_t defaultBlockSize = 256 * 1024;

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

    FileHandle getHandle() { return hFile_; }
    void closeHandle(); //throw SysError

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const Zstring filePath_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const Zstring& filePath); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError

    uint64_t getFileSize() const { return fileSize_; }

private:
    FileInputPlain(const std::pair<FileHandle, uint64_t>& fileDetails, const Zstring& filePath);

    const uint64_t fileSize_;
};


class FileOutputPlain : public FileBase
{
public:
    explicit FileOutputPlain(const Zstring& filePath); //throw FileError; overwrites existing file

    void write(const void* buffer, size_t bytesToWrite); //throw FileError

    void close(); //throw FileError => report close() errors here instead of ignoring them in the destructor
};

//-----------------------------------------------------------------------------------------------

[[nodiscard]] std::string getFileContent(const Zstring& filePath); //throw FileError

void setFileContent(const Zstring& filePath, std::string_view bytes); //throw FileError
}

#endif //FILE_IO_H_9182736450918273
