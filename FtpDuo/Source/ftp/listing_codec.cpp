// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include "listing_codec.h"
#include <algorithm>
#include <duo/file_traverser.h>
#include <duo/time.h>

using namespace duo;
using namespace fdo;


namespace
{
//listing of an empty folder; clients expect at least one line
const char emptyListing[] = "drwxrwxrwx 1 user group 0 Apr  1 00:00 .\r\n"
                            "drwxrwxrwx 1 user group 0 Apr  1 00:00 ..\r\n";


std::optional<int> parseListingYear(std::string_view yearStr)
{
    unsigned int year = 0;
    if (!parseUnsigned(yearStr, year))
        return std::nullopt;

    if (yearStr.size() == 4)
        return year;

    if (yearStr.size() == 2) //two-digit years: same pivot as POSIX strptime("%y")
        return year >= 69 ? 1900 + year : 2000 + year;

    return std::nullopt;
}
}


std::optional<FtpEntry> fdo::parseListLine(std::string_view line, int currentYear)
{
    std::vector<std::string_view> fields;
    split2(line, [](char c) { return isWhiteSpace(c); }, [&](std::string_view field)
    {
        if (!field.empty())
            fields.push_back(field);
    });

    if (fields.size() < 9)
        return std::nullopt;

    FtpEntry entry;

    switch (fields[0][0])
    {
        //*INDENT-OFF*
        case '-': entry.type = FtpItemType::file;    break;
        case 'd': entry.type = FtpItemType::folder;  break;
        case 'l': entry.type = FtpItemType::symlink; break;
        default: return std::nullopt;
        //*INDENT-ON*
    }

    if (entry.type == FtpItemType::file)
        if (!parseUnsigned(fields[4], entry.fileSize))
            return std::nullopt;
    //------------------------------------------------------------------------------------
    TimeComp tc;

    const int monthIdx = getMonthIndex(fields[5]);
    if (monthIdx < 0)
        return std::nullopt;
    tc.month = monthIdx + 1;

    unsigned int day = 0;
    if (!parseUnsigned(fields[6], day))
        return std::nullopt;
    tc.day = day;

    const std::string_view timeOrYear = fields[7];
    if (contains(timeOrYear, ':')) //item modified within the last six months
    {
        unsigned int hour = 0;
        unsigned int minute = 0;
        if (!parseUnsigned(beforeFirst(timeOrYear, ":", IfNotFoundReturn::none), hour) ||
            !parseUnsigned(afterFirst (timeOrYear, ":", IfNotFoundReturn::none), minute))
            return std::nullopt;

        tc.year   = currentYear;
        tc.hour   = hour;
        tc.minute = minute;
    }
    else
    {
        const std::optional<int> year = parseListingYear(timeOrYear);
        if (!year)
            return std::nullopt;
        tc.year = *year;
    }

    const auto [modTime, timeValid] = utcToTimeT(tc);
    if (!timeValid)
        return std::nullopt;
    entry.modTime = modTime;
    //------------------------------------------------------------------------------------
    for (auto it = fields.begin() + 8; it != fields.end(); ++it)
    {
        if (it != fields.begin() + 8)
            entry.name += ' ';
        entry.name += *it;
    }
    return entry;
}


std::vector<FtpEntry> fdo::parseListing(std::string_view text)
{
    const int currentYear = getUtcTime().year;

    std::vector<FtpEntry> output;
    split2(text, [](char c) { return isLineBreak(c); }, [&](std::string_view line)
    {
        if (!line.empty()) //consider <CR><LF>
            if (std::optional<FtpEntry> entry = parseListLine(line, currentYear))
                output.push_back(std::move(*entry));
    });
    return output;
}


std::vector<ListingItem> fdo::getListingItems(const std::string& folderPath) //throw FileError
{
    std::vector<ListingItem> items;

    traverseFolder(folderPath,
    [&](const    FileInfo& fi) { items.push_back({fi.itemName, FtpItemType::file,    fi.fileSize, fi.modTime, fi.mode}); },
    [&](const  FolderInfo& fi) { items.push_back({fi.itemName, FtpItemType::folder,  0,           fi.modTime, fi.mode}); },
    [&](const SymlinkInfo& si) { items.push_back({si.itemName, FtpItemType::symlink, 0,           si.modTime, si.mode}); }); //throw FileError

    std::sort(items.begin(), items.end(), [](const ListingItem& lhs, const ListingItem& rhs) { return lhs.itemName < rhs.itemName; });
    return items;
}


std::string fdo::formatPermissions(FtpItemType type, mode_t permissions)
{
    std::string output;
    switch (type)
    {
        //*INDENT-OFF*
        case FtpItemType::file:    output += '-'; break;
        case FtpItemType::folder:  output += 'd'; break;
        case FtpItemType::symlink: output += 'l'; break;
        //*INDENT-ON*
    }

    const char rwx[] = "rwx";
    for (int i = 0; i < 9; ++i)
        output += (permissions & (0400 >> i)) ? rwx[i % 3] : '-';

    return output;
}


std::string fdo::formatListDetailed(const std::vector<ListingItem>& items)
{
    if (items.empty())
        return emptyListing;

    std::string output;
    for (const ListingItem& item : items)
    {
        const TimeComp tc = getUtcTime(item.modTime);

        output += formatPermissions(item.type, item.permissions) + "\t1 user\tgroup\t" +
                  printNumber("%8llu", static_cast<unsigned long long>(item.fileSize)) + ' ' +
                  getMonthName(tc.month) + ' ' +
                  printNumber("%2d", tc.day) + ' ' +
                  printNumber("%02d", tc.hour) + ':' + printNumber("%02d", tc.minute) + ' ' +
                  item.itemName + "\r\n";
    }
    return output;
}


std::string fdo::formatListShort(const std::vector<ListingItem>& items)
{
    if (items.empty())
        return emptyListing;

    std::string output;
    for (const ListingItem& item : items)
        output += item.itemName + "\r\n";
    return output;
}
