// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include "file_io.h"
#include <stdexcept>
    #include <sys/stat.h>
    #include <fcntl.h>  //open
    #include <unistd.h> //close, read, write

using namespace mirr;


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        ::close(hFile_); //not closed explicitly => error path: nothing left to report
}


void FileBase::closeHandle() //throw SysError
{
    if (hFile_ == invalidFileHandle)
        throw SysError(L"Contract error: close() called more than once.");

    const FileHandle hTmp = std::exchange(hFile_, invalidFileHandle); //Linux: file descriptor is released even if close() fails
    if (::close(hTmp) != 0)
        THROW_LAST_SYS_ERROR("close");
}

//----------------------------------------------------------------------------------------------------

namespace
{
std::pair<FileBase::FileHandle, uint64_t /*file size*/> openHandleForRead(const Zstring& filePath) //throw FileError
{
    try
    {
        //caveat: character devices, block devices and named pipes block during open()
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode))
            throw SysError(_("Unsupported item type."));

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");

        return {fdFile /*pass ownership*/, fileInfo.st_size};
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
}


FileInputPlain::FileInputPlain(const Zstring& filePath) :
    FileInputPlain(openHandleForRead(filePath), filePath) {} //throw FileError


FileInputPlain::FileInputPlain(const std::pair<FileHandle, uint64_t>& fileDetails, const Zstring& filePath) :
    FileBase(fileDetails.first, filePath),
    fileSize_(fileDetails.second)
{
    //optimize read-ahead on input file:
    if (::posix_fadvise(getHandle(), 0 /*offset*/, 0 /*len*/, POSIX_FADV_SEQUENTIAL) != 0) //"len == 0" means "end of the file"
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), "posix_fadvise(POSIX_FADV_SEQUENTIAL)");
}


size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR);

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");
        if (static_cast<size_t>(bytesRead) > bytesToRead) //better safe than sorry
            throw SysError(formatSystemError("read", L"", L"Buffer overflow."));

        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForWrite(const Zstring& filePath) //throw FileError
{
    const mode_t lockFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

    const int fdFile = ::open(filePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, lockFileMode);
    if (fdFile == -1)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), "open");
    return fdFile; //pass ownership
}
}


FileOutputPlain::FileOutputPlain(const Zstring& filePath) :
    FileBase(openHandleForWrite(filePath), filePath) {} //throw FileError


void FileOutputPlain::write(const void* buffer, size_t bytesToWrite) //throw FileError
{
    try
    {
        const char* it = static_cast<const char*>(buffer);
        while (bytesToWrite > 0)
        {
            const ssize_t bytesWritten = ::write(getHandle(), it, bytesToWrite);
            if (bytesWritten < 0)
            {
                if (errno == EINTR)
                    continue;
                THROW_LAST_SYS_ERROR("write");
            }
            if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                throw SysError(formatSystemError("write", L"", L"Zero bytes processed."));

            it           += bytesWritten;
            bytesToWrite -= bytesWritten;
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}


void FileOutputPlain::close() //throw FileError
{
    try
    {
        closeHandle(); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

std::string mirr::getFileContent(const Zstring& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string content;
    content.reserve(fileIn.getFileSize());

    std::string buffer(FileBase::defaultBlockSize, '\0');
    for (;;)
    {
        const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
        if (bytesRead == 0) //end of file
            return content;
        content.append(buffer.data(), bytesRead);
    }
}


void mirr::setFileContent(const Zstring& filePath, std::string_view bytes) //throw FileError
{
    FileOutputPlain fileOut(filePath); //throw FileError
    if (!bytes.empty())
        fileOut.write(bytes.data(), bytes.size()); //throw FileError
    fileOut.close(); //throw FileError
}
