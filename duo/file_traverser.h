// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILER_TRAVERSER_H_5839201746382910
#define FILER_TRAVERSER_H_5839201746382910

#include <functional>
#include <sys/types.h>
#include "file_error.h"


namespace duo
{
struct FileInfo
{
    std::string itemName;
    std::string fullPath;
    uint64_t fileSize = 0; //[bytes]
    time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
    mode_t mode = 0; //permission bits
};

struct FolderInfo
{
    std::string itemName;
    std::string fullPath;
    time_t modTime = 0;
    mode_t mode = 0;
};

struct SymlinkInfo
{
    std::string itemName;
    std::string fullPath;
    time_t modTime = 0;
    mode_t mode = 0;
};

//- non-recursive
//- "." and ".." are not reported
void traverseFolder(const std::string& dirPath,
                    const std::function<void(const FileInfo&    fi)>& onFile,  /*optional*/
                    const std::function<void(const FolderInfo&  fi)>& onFolder,/*optional*/
                    const std::function<void(const SymlinkInfo& si)>& onSymlink/*optional*/); //throw FileError
}

#endif //FILER_TRAVERSER_H_5839201746382910
