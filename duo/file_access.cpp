// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
#include <algorithm>
#include <vector>
#include "file_path.h"
#include "file_traverser.h"

    #include <sys/stat.h>
    #include <unistd.h>
    #include <cstdio> //rename

using namespace duo;


namespace
{
struct SysErrorCode : public duo::SysError
{
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};

ItemType getItemTypeImpl(const std::string& itemPath) //throw SysErrorCode
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        throw SysErrorCode("lstat", getLastError());
    }

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}
}


ItemType duo::getItemType(const std::string& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), "%x", fmtPath(itemPath)), e.toString()); }
}


std::optional<ItemType> duo::getItemTypeIfExists(const std::string& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysErrorCode& e)
    {
        if (e.errorCode == ENOENT || e.errorCode == ENOTDIR) //ENOTDIR: some parent is a file
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), "%x", fmtPath(itemPath)), e.toString());
    }
}


uint64_t duo::getFileSize(const std::string& filePath) //throw FileError
{
    try
    {
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0)
            THROW_LAST_SYS_ERROR("stat");

        return fileInfo.st_size;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), "%x", fmtPath(filePath)), e.toString()); }
}


void duo::removeFilePlain(const std::string& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete file %x."), "%x", fmtPath(filePath)), e.toString()); }
}


void duo::removeDirectoryPlain(const std::string& dirPath) //throw FileError
{
    try
    {
        if (::rmdir(dirPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rmdir");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete directory %x."), "%x", fmtPath(dirPath)), e.toString()); }
}


void duo::removeSymlinkPlain(const std::string& linkPath) //throw FileError
{
    try
    {
        if (::unlink(linkPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete symbolic link %x."), "%x", fmtPath(linkPath)), e.toString()); }
}


namespace
{
void removeDirectoryImpl(const std::string& folderPath) //throw FileError
{
    std::vector<std::string> folderPaths;
    {
        std::vector<std::string> filePaths;
        std::vector<std::string> symlinkPaths;

        //get all files and directories from current directory (WITHOUT subdirectories!)
        traverseFolder(folderPath,
        [&](const    FileInfo& fi) {    filePaths.push_back(fi.fullPath); },
        [&](const  FolderInfo& fi) {  folderPaths.push_back(fi.fullPath); },
        [&](const SymlinkInfo& si) { symlinkPaths.push_back(si.fullPath); }); //throw FileError

        for (const std::string& filePath : filePaths)
            removeFilePlain(filePath); //throw FileError

        for (const std::string& symlinkPath : symlinkPaths)
            removeSymlinkPlain(symlinkPath); //throw FileError
    } //=> save stack space and allow deletion of extremely deep hierarchies!

    for (const std::string& subFolderPath : folderPaths)
        removeDirectoryImpl(subFolderPath); //throw FileError; call recursively to correctly handle symbolic links

    removeDirectoryPlain(folderPath); //throw FileError
}
}


void duo::removeDirectoryPlainRecursion(const std::string& dirPath) //throw FileError
{
    try
    {
        if (getItemTypeImpl(dirPath) == ItemType::symlink) //throw SysErrorCode
            removeSymlinkPlain(dirPath); //throw FileError
        else
            removeDirectoryImpl(dirPath); //throw FileError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete directory %x."), "%x", fmtPath(dirPath)), e.toString()); }
}


void duo::moveAndRenameItem(const std::string& pathFrom, const std::string& pathTo) //throw FileError
{
    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
    {
        const std::string errorMsg = getParentFolderPath(pathFrom) == getParentFolderPath(pathTo) ? //pure "rename"
                                     replaceCpy(replaceCpy(_("Cannot rename %x to %y."), "%x", fmtPath(pathFrom)), "%y", fmtPath(getItemName(pathTo))) :
                                     replaceCpy(replaceCpy(_("Cannot move %x to %y."),   "%x", fmtPath(pathFrom)), "%y", fmtPath(pathTo));

        THROW_LAST_FILE_ERROR(errorMsg, "rename");
    }
}


void duo::createDirectory(const std::string& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        //don't allow creating irregular folders!
        const std::string dirName = getItemName(dirPath);

        if (std::all_of(dirName.begin(), dirName.end(), [](char c) { return c == '.'; }))
        /**/throw SysError(replaceCpy("Invalid folder name %x.", "%x", fmtPath(dirName)));

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const int ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(_("Cannot create directory %x."), "%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot create directory %x."), "%x", fmtPath(dirPath)), e.toString()); }
}
