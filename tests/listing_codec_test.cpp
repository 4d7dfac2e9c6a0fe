// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include <cppunit/extensions/HelperMacros.h>
#include <duo/time.h>
#include <ftp/listing_codec.h>

using namespace duo;
using namespace fdo;


class ListingCodecTest final : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(ListingCodecTest);
    CPPUNIT_TEST(testParseFile);
    CPPUNIT_TEST(testParseFolderAndSymlink);
    CPPUNIT_TEST(testParseYears);
    CPPUNIT_TEST(testParseFailures);
    CPPUNIT_TEST(testParseListing);
    CPPUNIT_TEST(testFormatRoundTrip);
    CPPUNIT_TEST(testEmptyListing);
    CPPUNIT_TEST(testPermissions);
    CPPUNIT_TEST_SUITE_END();

public:
    void setUp() {}
    void tearDown() {}

    void testParseFile();
    void testParseFolderAndSymlink();
    void testParseYears();
    void testParseFailures();
    void testParseListing();
    void testFormatRoundTrip();
    void testEmptyListing();
    void testPermissions();
};

CPPUNIT_TEST_SUITE_REGISTRATION(ListingCodecTest);


namespace
{
time_t makeUtc(int year, int month, int day, int hour, int minute)
{
    const auto [utc, valid] = utcToTimeT({year, month, day, hour, minute, 0});
    CPPUNIT_ASSERT(valid);
    return utc;
}
}


void ListingCodecTest::testParseFile()
{
    const std::optional<FtpEntry> entry = parseListLine("-rw-r--r--  1 user  group     1084 Sep  2 01:17 Unit Test.txt", 2020);

    CPPUNIT_ASSERT(entry);
    CPPUNIT_ASSERT(entry->type == FtpItemType::file);
    CPPUNIT_ASSERT_EQUAL(std::string("Unit Test.txt"), entry->name);
    CPPUNIT_ASSERT_EQUAL(uint64_t(1084), entry->fileSize);
    CPPUNIT_ASSERT_EQUAL(makeUtc(2020, 9, 2, 1, 17), entry->modTime);
}


void ListingCodecTest::testParseFolderAndSymlink()
{
    std::optional<FtpEntry> entry = parseListLine("drwxr-xr-x\t1 user\tgroup\t       0 Feb 28  2016 version", 2020);
    CPPUNIT_ASSERT(entry);
    CPPUNIT_ASSERT(entry->type == FtpItemType::folder);
    CPPUNIT_ASSERT_EQUAL(std::string("version"), entry->name);
    CPPUNIT_ASSERT_EQUAL(makeUtc(2016, 2, 28, 0, 0), entry->modTime);

    //size of non-files is not evaluated
    entry = parseListLine("lrwxrwxrwx 1 user group n/a Mar  1 12:00 link", 2021);
    CPPUNIT_ASSERT(entry);
    CPPUNIT_ASSERT(entry->type == FtpItemType::symlink);
    CPPUNIT_ASSERT_EQUAL(uint64_t(0), entry->fileSize);
}


void ListingCodecTest::testParseYears()
{
    std::optional<FtpEntry> entry = parseListLine("-rw-r--r-- 1 user group 5 Jan  1 99 old.txt", 2020);
    CPPUNIT_ASSERT(entry);
    CPPUNIT_ASSERT_EQUAL(makeUtc(1999, 1, 1, 0, 0), entry->modTime);

    entry = parseListLine("-rw-r--r-- 1 user group 5 Jan  1 69 old.txt", 2020);
    CPPUNIT_ASSERT(entry);
    CPPUNIT_ASSERT_EQUAL(makeUtc(1969, 1, 1, 0, 0), entry->modTime);

    entry = parseListLine("-rw-r--r-- 1 user group 5 Jan  1 68 new.txt", 2020);
    CPPUNIT_ASSERT(entry);
    CPPUNIT_ASSERT_EQUAL(makeUtc(2068, 1, 1, 0, 0), entry->modTime);

    entry = parseListLine("-rw-r--r-- 1 user group 5 Dec 31 2001 new.txt", 2020);
    CPPUNIT_ASSERT(entry);
    CPPUNIT_ASSERT_EQUAL(makeUtc(2001, 12, 31, 0, 0), entry->modTime);

    //midnight is a valid time
    entry = parseListLine("-rw-r--r-- 1 user group 5 Jun 15 00:00 midnight.txt", 2022);
    CPPUNIT_ASSERT(entry);
    CPPUNIT_ASSERT_EQUAL(makeUtc(2022, 6, 15, 0, 0), entry->modTime);
}


void ListingCodecTest::testParseFailures()
{
    CPPUNIT_ASSERT(!parseListLine("", 2020));
    CPPUNIT_ASSERT(!parseListLine("-rw-r--r-- 1 user group 1084 Sep  2 01:17", 2020)); //8 fields
    CPPUNIT_ASSERT(!parseListLine("crw-r--r-- 1 user group 1084 Sep  2 01:17 device", 2020));
    CPPUNIT_ASSERT(!parseListLine("-rw-r--r-- 1 user group big Sep  2 01:17 file.txt", 2020));
    CPPUNIT_ASSERT(!parseListLine("-rw-r--r-- 1 user group 1084 Foo  2 01:17 file.txt", 2020));
    CPPUNIT_ASSERT(!parseListLine("-rw-r--r-- 1 user group 1084 Sep xx 01:17 file.txt", 2020));
    CPPUNIT_ASSERT(!parseListLine("-rw-r--r-- 1 user group 1084 Sep  2 25:17 file.txt", 2020));
    CPPUNIT_ASSERT(!parseListLine("-rw-r--r-- 1 user group 1084 Feb 30 2020 file.txt", 2020));
    CPPUNIT_ASSERT(!parseListLine("-rw-r--r-- 1 user group 1084 Sep  2 202 file.txt", 2020));
}


void ListingCodecTest::testParseListing()
{
    const std::vector<FtpEntry> entries = parseListing("total 2\r\n"
                                                       "-rw-r--r-- 1 user group 3 Sep  2  2019 a.txt\r\n"
                                                       "garbage\r\n"
                                                       "drwxr-xr-x 1 user group 0 Sep  2  2019 sub dir\r\n");
    CPPUNIT_ASSERT_EQUAL(size_t(2), entries.size());
    CPPUNIT_ASSERT_EQUAL(std::string("a.txt"), entries[0].name);
    CPPUNIT_ASSERT_EQUAL(std::string("sub dir"), entries[1].name);
    CPPUNIT_ASSERT(entries[1].type == FtpItemType::folder);
}


void ListingCodecTest::testFormatRoundTrip()
{
    const int currentYear = getUtcTime().year;

    const std::vector<ListingItem> items
    {
        {"file 1.txt", FtpItemType::file,    123456, makeUtc(currentYear, 3, 4, 5, 6),   0644},
        {"folder",     FtpItemType::folder,  0,      makeUtc(currentYear, 11, 30, 23, 59), 0755},
        {"link",       FtpItemType::symlink, 0,      makeUtc(currentYear, 1, 1, 0, 0),    0777},
    };

    const std::vector<FtpEntry> entries = parseListing(formatListDetailed(items));
    CPPUNIT_ASSERT_EQUAL(items.size(), entries.size());

    for (size_t i = 0; i < items.size(); ++i)
    {
        CPPUNIT_ASSERT_EQUAL(items[i].itemName, entries[i].name);
        CPPUNIT_ASSERT(items[i].type == entries[i].type);
        CPPUNIT_ASSERT_EQUAL(items[i].fileSize, entries[i].fileSize);
        CPPUNIT_ASSERT_EQUAL(items[i].modTime, entries[i].modTime);
    }

    CPPUNIT_ASSERT_EQUAL(std::string("file 1.txt\r\nfolder\r\nlink\r\n"), formatListShort(items));
}


void ListingCodecTest::testEmptyListing()
{
    const std::string expected = "drwxrwxrwx 1 user group 0 Apr  1 00:00 .\r\n"
                                 "drwxrwxrwx 1 user group 0 Apr  1 00:00 ..\r\n";

    CPPUNIT_ASSERT_EQUAL(expected, formatListDetailed({}));
    CPPUNIT_ASSERT_EQUAL(expected, formatListShort({}));

    const std::vector<FtpEntry> entries = parseListing(expected);
    CPPUNIT_ASSERT_EQUAL(size_t(2), entries.size());
    CPPUNIT_ASSERT_EQUAL(std::string("."),  entries[0].name);
    CPPUNIT_ASSERT_EQUAL(std::string(".."), entries[1].name);
}


void ListingCodecTest::testPermissions()
{
    CPPUNIT_ASSERT_EQUAL(std::string("-rw-r--r--"), formatPermissions(FtpItemType::file,    0644));
    CPPUNIT_ASSERT_EQUAL(std::string("drwxr-x---"), formatPermissions(FtpItemType::folder,  0750));
    CPPUNIT_ASSERT_EQUAL(std::string("lrwxrwxrwx"), formatPermissions(FtpItemType::symlink, 0777));
}
