// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_io.h"
    #include <fcntl.h>  //open
    #include <unistd.h> //close, read, write

using namespace duo;


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        ::close(hFile_); //call close() explicitly to get error reporting
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError("Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), "%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
std::pair<FileBase::FileHandle, struct stat>
openHandleForRead(const std::string& filePath) //throw FileError
{
    try
    {
        //caveat: check for file types that block during open(): character device, block device, named pipe
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (S_ISDIR(fileInfo.st_mode))
            throw SysError(_("The item is a folder."));
        if (!S_ISREG(fileInfo.st_mode))
            throw SysError(_("Unsupported item type.") + " [" + printNumber("0%06o", static_cast<unsigned int>(fileInfo.st_mode & S_IFMT)) + ']');

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        return {fdFile /*pass ownership*/, fileInfo};
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot open file %x."), "%x", fmtPath(filePath)), e.toString()); }
}
}


FileInputPlain::FileInputPlain(const std::string& filePath, uint64_t offset) :
    FileInputPlain(openHandleForRead(filePath), filePath, offset) {} //throw FileError


FileInputPlain::FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const std::string& filePath, uint64_t offset) :
    FileBase(fileDetails.first, filePath),
    fileSize_(fileDetails.second.st_size)
{
    if (offset > 0)
        if (::lseek(getHandle(), static_cast<off_t>(offset), SEEK_SET) == -1)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), "%x", fmtPath(filePath)), "lseek");

    //optimize read-ahead on input file:
    if (::posix_fadvise(getHandle(), 0 /*offset*/, 0 /*len*/, POSIX_FADV_SEQUENTIAL) != 0) //"len == 0" means "end of the file"
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), "%x", fmtPath(filePath)), "posix_fadvise(POSIX_FADV_SEQUENTIAL)");
}


//may return short, only 0 means EOF! =>  CONTRACT: bytesToRead > 0!
size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<int>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR); //if ::read is interrupted (EINTR) right in the middle, it will return successfully with "bytesRead < bytesToRead"

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");

        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead); //better safe than sorry
        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), "%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForWrite(const std::string& filePath, std::optional<uint64_t> offset) //throw FileError
{
    try
    {
        const mode_t fileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

        const int fdFile = ::open(filePath.c_str(), //const char* pathname
                                  O_CREAT | O_WRONLY | O_CLOEXEC |
                                  (offset ? 0 : O_TRUNC),
                                  fileMode);        //mode_t mode
        if (fdFile == -1)
            THROW_LAST_SYS_ERROR("open");
        DUO_ON_SCOPE_FAIL(::close(fdFile));

        if (offset)
        {
            //discard whatever followed the restart position
            if (::ftruncate(fdFile, static_cast<off_t>(*offset)) != 0)
                THROW_LAST_SYS_ERROR("ftruncate");

            if (::lseek(fdFile, static_cast<off_t>(*offset), SEEK_SET) == -1)
                THROW_LAST_SYS_ERROR("lseek");
        }
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), "%x", fmtPath(filePath)), e.toString()); }
}
}


FileOutputPlain::FileOutputPlain(const std::string& filePath, std::optional<uint64_t> offset) :
    FileBase(openHandleForWrite(filePath, offset), filePath) {} //throw FileError


//may return short! CONTRACT: bytesToWrite > 0
size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<int>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesWritten = 0;
        do
        {
            bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
        }
        while (bytesWritten < 0 && errno == EINTR);

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                errno = ENOSPC;

            THROW_LAST_SYS_ERROR("write");
        }
        ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry
        return bytesWritten;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), "%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

std::string duo::getFileContent(const std::string& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string content = unbufferedLoad<std::string>([&](void* buffer, size_t bytesToRead)
    {
        return fileIn.tryRead(buffer, bytesToRead); //throw FileError; may return short, only 0 means EOF!
    },
    FileBase::defaultBlockSize); //throw FileError

    fileIn.close(); //throw FileError
    return content;
}


void duo::setFileContent(const std::string& filePath, std::string_view bytes) //throw FileError
{
    FileOutputPlain fileOut(filePath, std::nullopt /*truncate*/); //throw FileError

    unbufferedSave(bytes, [&](const void* buffer, size_t bytesToWrite)
    {
        return fileOut.tryWrite(buffer, bytesToWrite); //throw FileError; may return short
    },
    FileBase::defaultBlockSize); //throw FileError

    fileOut.close(); //throw FileError
}
