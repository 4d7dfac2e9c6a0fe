// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_PATH_H_6610293847561029
#define FILE_PATH_H_6610293847561029

#include <optional>
#include "string_tools.h"


namespace duo
{
const char FILE_NAME_SEPARATOR = '/';

inline std::string getItemName(const std::string& itemPath) { return afterLast<std::string>(itemPath, std::string_view(&FILE_NAME_SEPARATOR, 1), IfNotFoundReturn::all); }

//no value for "/" or a plain item name
inline
std::optional<std::string> getParentFolderPath(const std::string& itemPath)
{
    const size_t pos = itemPath.rfind(FILE_NAME_SEPARATOR);
    if (pos == std::string::npos || itemPath.size() == 1)
        return std::nullopt;
    if (pos == 0)
        return std::string(1, FILE_NAME_SEPARATOR); //parent of "/folder" is the root
    return itemPath.substr(0, pos);
}


inline
std::string appendPath(const std::string& basePath, const std::string& relPath)
{
    if (relPath.empty())
        return basePath;
    if (basePath.empty())
        return relPath;

    if (relPath[0] == FILE_NAME_SEPARATOR)
    {
        if (basePath.back() == FILE_NAME_SEPARATOR)
            return basePath + (relPath.c_str() + 1);
    }
    else if (basePath.back() != FILE_NAME_SEPARATOR)
        return basePath + FILE_NAME_SEPARATOR + relPath;

    return basePath + relPath;
}
}

#endif //FILE_PATH_H_6610293847561029
