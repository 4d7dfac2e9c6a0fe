// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ACCESS_H_2093847561029384
#define FILE_ACCESS_H_2093847561029384

#include <optional>
#include "file_error.h"


namespace duo
{
enum class ItemType
{
    file,
    folder,
    symlink,
};
//(hard) symlinks are not followed
ItemType getItemType(const std::string& itemPath); //throw FileError

//- no value if item does not exist
//- a file in the parent path chain means "not existing", too
std::optional<ItemType> getItemTypeIfExists(const std::string& itemPath); //throw FileError

inline bool itemExists(const std::string& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

//symlinks are followed
uint64_t getFileSize(const std::string& filePath); //throw FileError

void removeFilePlain     (const std::string& filePath);         //throw FileError; ERROR if not existing
void removeSymlinkPlain  (const std::string& linkPath);         //throw FileError; ERROR if not existing
void removeDirectoryPlain(const std::string& dirPath );         //throw FileError; ERROR if not existing
void removeDirectoryPlainRecursion(const std::string& dirPath); //throw FileError; ERROR if not existing

//rename file or folder: no copying!!! an existing target file is replaced
void moveAndRenameItem(const std::string& pathFrom, const std::string& pathTo); //throw FileError

void createDirectory(const std::string& dirPath); //throw FileError, ErrorTargetExisting
}

#endif //FILE_ACCESS_H_2093847561029384
