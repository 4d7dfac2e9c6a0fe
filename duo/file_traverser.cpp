// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_traverser.h"
#include "file_path.h"

    #include <sys/stat.h>
    #include <dirent.h>

using namespace duo;


void duo::traverseFolder(const std::string& dirPath,
                         const std::function<void(const FileInfo&    fi)>& onFile,
                         const std::function<void(const FolderInfo&  fi)>& onFolder,
                         const std::function<void(const SymlinkInfo& si)>& onSymlink) //throw FileError
{
    DIR* folder = ::opendir(dirPath.c_str()); //directory must NOT end with path separator, except "/"
    if (!folder)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open directory %x."), "%x", fmtPath(dirPath)), "opendir");
    DUO_ON_SCOPE_EXIT(::closedir(folder)); //never close nullptr handles! -> crash

    for (;;)
    {
        errno = 0;
        const dirent* dirEntry = ::readdir(folder);
        if (!dirEntry)
        {
            if (errno == 0) //errno left unchanged => no more items
                return;

            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read directory %x."), "%x", fmtPath(dirPath)), "readdir");
        }

        const char* itemNameRaw = dirEntry->d_name;

        if (itemNameRaw[0] == '.' &&
            (itemNameRaw[1] == 0 || (itemNameRaw[1] == '.' && itemNameRaw[2] == 0)))
            continue;

        const std::string itemName = itemNameRaw;
        const std::string itemPath = appendPath(dirPath, itemName);

        struct stat statData = {};
        if (::lstat(itemPath.c_str(), &statData) != 0) //lstat() does not resolve symlinks
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), "%x", fmtPath(itemPath)), "lstat");

        const mode_t perm = statData.st_mode & 07777;

        if (S_ISLNK(statData.st_mode)) //on Linux there is no distinction between file and directory symlinks!
        {
            if (onSymlink)
                onSymlink({itemName, itemPath, statData.st_mtime, perm});
        }
        else if (S_ISDIR(statData.st_mode))
        {
            if (onFolder)
                onFolder({itemName, itemPath, statData.st_mtime, perm});
        }
        else //a file or named pipe, etc. S_ISREG, S_ISCHR, S_ISBLK, S_ISFIFO, S_ISSOCK
        {
            if (onFile)
                onFile({itemName, itemPath, static_cast<uint64_t>(statData.st_size), statData.st_mtime, perm});
        }
    }
}
