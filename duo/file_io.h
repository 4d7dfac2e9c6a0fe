// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_3302918475610293
#define FILE_IO_H_3302918475610293

#include <optional>
#include <sys/stat.h>
#include "file_error.h"
#include "serialize.h"


namespace duo
{
/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const std::string& getFilePath() const { return filePath_; }

    static constexpr size_t defaultBlockSize = 256 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

protected:
    FileBase(FileHandle handle, const std::string& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const std::string filePath_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    //start reading at byte position "offset"
    FileInputPlain(const std::string& filePath, uint64_t offset = 0); //throw FileError

    uint64_t getFileSize() const { return fileSize_; }

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError

private:
    FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const std::string& filePath, uint64_t offset);

    uint64_t fileSize_ = 0;
};


class FileOutputPlain : public FileBase
{
public:
    //- no offset: create or truncate
    //- offset: keep first "offset" bytes and continue writing from there
    FileOutputPlain(const std::string& filePath, std::optional<uint64_t> offset); //throw FileError

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError
};

//-----------------------------------------------------------------------------------------------

[[nodiscard]] std::string getFileContent(const std::string& filePath); //throw FileError

//create or overwrite
void setFileContent(const std::string& filePath, std::string_view bytes); //throw FileError
}

#endif //FILE_IO_H_3302918475610293
