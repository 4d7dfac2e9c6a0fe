// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#ifndef LISTING_CODEC_H_9012837465019283
#define LISTING_CODEC_H_9012837465019283

#include <optional>
#include <vector>
#include <sys/types.h>
#include <duo/file_error.h>


namespace fdo
{
enum class FtpItemType
{
    file,
    folder,
    symlink,
};

//one item of a "LIST" reply as seen by the client
struct FtpEntry
{
    std::string name;
    FtpItemType type = FtpItemType::file;
    uint64_t fileSize = 0; //files only
    time_t modTime = 0; //UTC
};

/*  "ls -l" style listing line:
        -rw-r--r--  1 user  group     1084 Sep  2 01:17 Unit Test.txt
        drwxr-xr-x  1 user  group        0 Feb 28  2016 version

    - "HH:MM" means current year, a year means 00:00
    - no value: line not understood                          */
std::optional<FtpEntry> parseListLine(std::string_view line, int currentYear);

//skips lines that cannot be parsed
std::vector<FtpEntry> parseListing(std::string_view text);

//------------------------------------------------------------------------------

//one item of a local folder as sent by the server
struct ListingItem
{
    std::string itemName;
    FtpItemType type = FtpItemType::file;
    uint64_t fileSize = 0;
    time_t modTime = 0;
    mode_t permissions = 0;
};

//sorted by name; "." and ".." are not included
std::vector<ListingItem> getListingItems(const std::string& folderPath); //throw FileError

std::string formatPermissions(FtpItemType type, mode_t permissions); //e.g. "drwxr-xr-x"

//CRLF-terminated lines; an empty folder is reported as "." and ".."
std::string formatListDetailed(const std::vector<ListingItem>& items);
std::string formatListShort   (const std::vector<ListingItem>& items);
}

#endif //LISTING_CODEC_H_9012837465019283
