// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include <cppunit/extensions/HelperMacros.h>
#include <base/session_log.h>

using namespace duo;
using namespace fdo;


class SessionLogTest final : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(SessionLogTest);
    CPPUNIT_TEST(testRetainsMostRecent);
    CPPUNIT_TEST(testSinkOnly);
    CPPUNIT_TEST(testFormatMessage);
    CPPUNIT_TEST_SUITE_END();

public:
    void setUp() {}
    void tearDown() {}

    void testRetainsMostRecent();
    void testSinkOnly();
    void testFormatMessage();
};

CPPUNIT_TEST_SUITE_REGISTRATION(SessionLogTest);


void SessionLogTest::testRetainsMostRecent()
{
    SessionLog log(3 /*maxEntries*/);
    for (int i = 0; i < 1000; ++i)
        log.logInfo("message " + numberTo(i));
    log.logError("last");

    const ErrorLog entries = log.fetchLog();
    CPPUNIT_ASSERT_EQUAL(size_t(3), entries.size());
    CPPUNIT_ASSERT_EQUAL(std::string("message 998"), entries[0].message);
    CPPUNIT_ASSERT_EQUAL(std::string("message 999"), entries[1].message);
    CPPUNIT_ASSERT_EQUAL(std::string("last"),        entries[2].message);

    const ErrorLogStats stats = getStats(entries);
    CPPUNIT_ASSERT_EQUAL(2, stats.info);
    CPPUNIT_ASSERT_EQUAL(1, stats.error);
}


void SessionLogTest::testSinkOnly()
{
    std::vector<std::string> output;
    SessionLog log(0 /*maxEntries*/, [&](const LogEntry& entry) { output.push_back(entry.message); });

    for (int i = 0; i < 100; ++i)
        log.logWarning("warning " + numberTo(i));

    CPPUNIT_ASSERT_EQUAL(size_t(100), output.size());
    CPPUNIT_ASSERT_EQUAL(std::string("warning 99"), output.back());
    CPPUNIT_ASSERT(log.fetchLog().empty());
}


void SessionLogTest::testFormatMessage()
{
    const std::string formatted = formatMessage({std::time(nullptr), MSG_TYPE_ERROR, "first line\n\nsecond line\n"});

    CPPUNIT_ASSERT(startsWith(formatted, "["));
    CPPUNIT_ASSERT(contains(formatted, "]  Error:  first line\n"));
    CPPUNIT_ASSERT(endsWith(formatted, " second line"));
    CPPUNIT_ASSERT_EQUAL(size_t(1), static_cast<size_t>(std::count(formatted.begin(), formatted.end(), '\n')));

    //continuation line is aligned below the first one
    const size_t prefixLen = formatted.find("first line");
    CPPUNIT_ASSERT_EQUAL(prefixLen, formatted.find("second line") - formatted.find('\n') - 1);
}
