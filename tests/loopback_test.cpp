// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include <cstring>
#include <cppunit/extensions/HelperMacros.h>
#include <duo/file_access.h>
#include <duo/file_io.h>
#include <duo/file_path.h>
#include <ftp/ftp_client.h>
#include <ftp/ftp_server.h>
#include <ftp/ftp_status.h>

using namespace duo;
using namespace fdo;

/*
 * Client and server talking to each other over the loopback interface.
 * Every test gets a fresh server root folder and a logged-in client.
 */

class LoopbackTest final : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(LoopbackTest);
    CPPUNIT_TEST(testStoreRetrieve);
    CPPUNIT_TEST(testRestart);
    CPPUNIT_TEST(testEmptyListing);
    CPPUNIT_TEST(testListing);
    CPPUNIT_TEST(testListingOptions);
    CPPUNIT_TEST(testRename);
    CPPUNIT_TEST(testChangeDir);
    CPPUNIT_TEST(testMakeRemoveDir);
    CPPUNIT_TEST(testDeleteAndSize);
    CPPUNIT_TEST(testMissingDataChannel);
    CPPUNIT_TEST(testRetrieveMissingFile);
    CPPUNIT_TEST(testPassiveModes);
    CPPUNIT_TEST(testPassiveHostNames);
    CPPUNIT_TEST(testSessionCommands);
    CPPUNIT_TEST(testBareLineFeed);
    CPPUNIT_TEST(testLogout);
    CPPUNIT_TEST(testConnectFailure);
    CPPUNIT_TEST(testConnectWithLoginPhrase);
    CPPUNIT_TEST_SUITE_END();

public:
    void setUp();
    void tearDown();

    void testStoreRetrieve();
    void testRestart();
    void testEmptyListing();
    void testListing();
    void testListingOptions();
    void testRename();
    void testChangeDir();
    void testMakeRemoveDir();
    void testDeleteAndSize();
    void testMissingDataChannel();
    void testRetrieveMissingFile();
    void testPassiveModes();
    void testPassiveHostNames();
    void testSessionCommands();
    void testBareLineFeed();
    void testLogout();
    void testConnectFailure();
    void testConnectWithLoginPhrase();

private:
    std::string localPath(const std::string& relPath) const { return appendPath(rootFolder_, relPath); }

    int getFtpStatus(const std::function<void()>& clientCall /*throw SysErrorFtpProtocol*/);

    std::string rootFolder_;
    std::shared_ptr<SessionLog> serverLog_;
    std::unique_ptr<SessionLog> clientLog_;
    std::unique_ptr<FtpServer> server_;
    std::unique_ptr<FtpClient> client_;
};

CPPUNIT_TEST_SUITE_REGISTRATION(LoopbackTest);


void LoopbackTest::setUp()
{
    char tempFolder[] = "/tmp/ftp_duo_test_XXXXXX";
    CPPUNIT_ASSERT(::mkdtemp(tempFolder));
    rootFolder_ = tempFolder;

    ServerConfig cfg;
    cfg.port = 0;
    cfg.rootFolder = rootFolder_;
    cfg.acceptTimeoutSec = 5;

    serverLog_ = std::make_shared<SessionLog>();
    clientLog_ = std::make_unique<SessionLog>();
    server_ = std::make_unique<FtpServer>(cfg, serverLog_);
    client_ = FtpClient::connectWithLogin("127.0.0.1", server_->getPort(), 5 /*timeoutSec*/, "tester", "top secret", *clientLog_);
}


void LoopbackTest::tearDown()
{
    if (client_)
        client_->quit();
    client_.reset();
    server_.reset();
    removeDirectoryPlainRecursion(rootFolder_);
}


int LoopbackTest::getFtpStatus(const std::function<void()>& clientCall /*throw SysErrorFtpProtocol*/)
{
    try
    {
        clientCall(); //throw SysErrorFtpProtocol
    }
    catch (const SysErrorFtpProtocol& e) { return e.ftpStatusCode; }

    CPPUNIT_FAIL("FTP command did not fail");
    return 0;
}


void LoopbackTest::testStoreRetrieve()
{
    std::string content;
    for (int i = 0; i < 300000; ++i)
        content += static_cast<char>(i * 7 % 256); //binary: contains \0, \r and \n

    client_->storeFromString("/data.bin", content);

    CPPUNIT_ASSERT(getFileContent(localPath("data.bin")) == content);
    CPPUNIT_ASSERT(client_->retrieveToString("data.bin") == content);
    CPPUNIT_ASSERT_EQUAL(uint64_t(content.size()), client_->fileSize("data.bin"));

    //empty file
    client_->storeFromString("empty.txt", "");
    CPPUNIT_ASSERT(itemExists(localPath("empty.txt")));
    CPPUNIT_ASSERT_EQUAL(std::string(), client_->retrieveToString("empty.txt"));

    //overwrite
    client_->storeFromString("data.bin", "short");
    CPPUNIT_ASSERT_EQUAL(std::string("short"), getFileContent(localPath("data.bin")));
}


void LoopbackTest::testRestart()
{
    setFileContent(localPath("r.txt"), "0123456789");

    {
        std::unique_ptr<FtpDataResponse> response = client_->retrieve("r.txt", 4 /*offset*/);
        std::string tail;
        char buffer[3] = {};
        while (const size_t bytesRead = response->tryRead(buffer, sizeof(buffer)))
            tail.append(buffer, bytesRead);
        response->close();

        CPPUNIT_ASSERT_EQUAL(std::string("456789"), tail);
    }

    const std::string_view upload = "abc";
    bool uploaded = false;
    client_->store("r.txt", [&](void* buffer, size_t bytesToRead)
    {
        if (uploaded)
            return size_t(0);
        uploaded = true;
        std::memcpy(buffer, upload.data(), upload.size());
        return upload.size();
    }, 2 /*offset*/);

    CPPUNIT_ASSERT_EQUAL(std::string("01abc"), getFileContent(localPath("r.txt")));
}


void LoopbackTest::testEmptyListing()
{
    const std::vector<FtpEntry> entries = client_->list("");
    CPPUNIT_ASSERT_EQUAL(size_t(2), entries.size());
    CPPUNIT_ASSERT_EQUAL(std::string("."),  entries[0].name);
    CPPUNIT_ASSERT_EQUAL(std::string(".."), entries[1].name);
    CPPUNIT_ASSERT(entries[0].type == FtpItemType::folder);

    CPPUNIT_ASSERT_EQUAL(size_t(2), client_->nameList("").size());
}


void LoopbackTest::testListing()
{
    client_->makeDir("sub");
    client_->storeFromString("sub/a.txt", "abc");
    client_->storeFromString("sub/b c.txt", "12345");

    const std::vector<FtpEntry> entries = client_->list("sub");
    CPPUNIT_ASSERT_EQUAL(size_t(2), entries.size());
    CPPUNIT_ASSERT_EQUAL(std::string("a.txt"), entries[0].name);
    CPPUNIT_ASSERT_EQUAL(uint64_t(3), entries[0].fileSize);
    CPPUNIT_ASSERT(entries[0].type == FtpItemType::file);
    CPPUNIT_ASSERT_EQUAL(std::string("b c.txt"), entries[1].name);
    CPPUNIT_ASSERT_EQUAL(uint64_t(5), entries[1].fileSize);

    const std::vector<std::string> names = client_->nameList("/sub");
    CPPUNIT_ASSERT(names == std::vector<std::string>({"a.txt", "b c.txt"}));

    const std::vector<FtpEntry> rootEntries = client_->list("/");
    CPPUNIT_ASSERT_EQUAL(size_t(1), rootEntries.size());
    CPPUNIT_ASSERT_EQUAL(std::string("sub"), rootEntries[0].name);
    CPPUNIT_ASSERT(rootEntries[0].type == FtpItemType::folder);

    //listing a missing folder
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->list("missing"); }));
}


void LoopbackTest::testListingOptions()
{
    client_->makeDir("sub");
    client_->storeFromString("sub/a.txt", "abc");
    client_->changeDir("sub");

    //"ls" style flags are ignored: the working directory is listed
    const std::vector<FtpEntry> entries = client_->list("-la");
    CPPUNIT_ASSERT_EQUAL(size_t(1), entries.size());
    CPPUNIT_ASSERT_EQUAL(std::string("a.txt"), entries[0].name);

    CPPUNIT_ASSERT(client_->nameList("-a") == std::vector<std::string>({"a.txt"}));

    //flags followed by a path
    client_->changeDir("/");
    CPPUNIT_ASSERT(client_->nameList("-l sub") == std::vector<std::string>({"a.txt"}));
}


void LoopbackTest::testRename()
{
    client_->storeFromString("a.txt", "content");
    client_->rename("a.txt", "b.txt");

    CPPUNIT_ASSERT(!itemExists(localPath("a.txt")));
    CPPUNIT_ASSERT_EQUAL(std::string("content"), getFileContent(localPath("b.txt")));

    //RNTO needs a preceding RNFR
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_BAD_SEQUENCE), client_->runCommand("RNTO c.txt", std::nullopt).code);

    //pending source is consumed even if the rename fails
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->rename("missing.txt", "c.txt"); }));
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_BAD_SEQUENCE), client_->runCommand("RNTO c.txt", std::nullopt).code);
}


void LoopbackTest::testChangeDir()
{
    client_->makeDir("dir");
    client_->storeFromString("file.txt", "1");

    client_->changeDir("dir");
    CPPUNIT_ASSERT_EQUAL(std::string("/dir"), client_->currentDir());

    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->changeDir("missing"); }));
    CPPUNIT_ASSERT_EQUAL(std::string("/dir"), client_->currentDir());

    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->changeDir("/file.txt"); }));
    CPPUNIT_ASSERT_EQUAL(std::string("/dir"), client_->currentDir());

    //relative paths follow the working directory
    client_->storeFromString("inner.txt", "2");
    CPPUNIT_ASSERT(itemExists(localPath("dir/inner.txt")));

    client_->changeDirToParent();
    CPPUNIT_ASSERT_EQUAL(std::string("/"), client_->currentDir());

    //can't escape the root folder
    client_->changeDirToParent();
    CPPUNIT_ASSERT_EQUAL(std::string("/"), client_->currentDir());
    client_->changeDir("../../dir");
    CPPUNIT_ASSERT_EQUAL(std::string("/dir"), client_->currentDir());
}


void LoopbackTest::testMakeRemoveDir()
{
    client_->makeDir("x");
    CPPUNIT_ASSERT(getItemType(localPath("x")) == ItemType::folder);
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->makeDir("x"); }));

    client_->makeDir("x/y");
    client_->storeFromString("x/y/f.txt", "1");

    client_->removeDir("x"); //recursive
    CPPUNIT_ASSERT(!itemExists(localPath("x")));

    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->removeDir("x"); }));

    client_->storeFromString("f.txt", "1");
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->removeDir("f.txt"); }));
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->removeDir("/"); }));
}


void LoopbackTest::testDeleteAndSize()
{
    client_->storeFromString("f.txt", "12345");
    client_->makeDir("folder");

    CPPUNIT_ASSERT_EQUAL(uint64_t(5),    client_->fileSize("f.txt"));
    CPPUNIT_ASSERT_EQUAL(uint64_t(1024), client_->fileSize("folder"));

    client_->deleteFile("f.txt");
    CPPUNIT_ASSERT(!itemExists(localPath("f.txt")));

    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->fileSize("f.txt"); }));
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->deleteFile("f.txt"); }));
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->deleteFile("folder"); }));
}


void LoopbackTest::testMissingDataChannel()
{
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_TRANSFER_ABORTED), client_->runCommand("LIST",       std::nullopt).code);
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_CANNOT_OPEN_DATA), client_->runCommand("RETR a.txt", std::nullopt).code);
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_CANNOT_OPEN_DATA), client_->runCommand("STOR a.txt", std::nullopt).code);
    CPPUNIT_ASSERT(!itemExists(localPath("a.txt")));
}


void LoopbackTest::testRetrieveMissingFile()
{
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_UNAVAILABLE), getFtpStatus([&] { client_->retrieveToString("missing.txt"); }));

    //session is still usable
    client_->noop();
    client_->storeFromString("ok.txt", "ok");
    CPPUNIT_ASSERT_EQUAL(std::string("ok"), client_->retrieveToString("ok.txt"));
}


void LoopbackTest::testPassiveModes()
{
    const int port = parsePasvPort(client_->runCommand("PASV", FTP_STATUS_PASSIVE_MODE).message);
    CPPUNIT_ASSERT(port > 0);

    //a new negotiation replaces the pending data channel
    const int port2 = parseEpsvPort(client_->runCommand("EPSV", FTP_STATUS_EXTENDED_PASSIVE_MODE).message);
    CPPUNIT_ASSERT(port2 > 0);

    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_BAD_ARGUMENTS), client_->runCommand("REST abc", std::nullopt).code);
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_FILE_ACTION_PENDING), client_->runCommand("REST 10", std::nullopt).code);
    client_->noop();
}


void LoopbackTest::testPassiveHostNames()
{
    //host name and wildcard address both end up as a numeric IPv4 in the 227 reply
    for (const char* passiveHost : {"localhost", "0.0.0.0"})
    {
        ServerConfig cfg;
        cfg.port = 0;
        cfg.rootFolder = rootFolder_;
        cfg.passiveHost = passiveHost;
        cfg.acceptTimeoutSec = 5;
        FtpServer server(cfg, serverLog_);

        SessionLog log;
        std::unique_ptr<FtpClient> client = FtpClient::connectWithLogin("127.0.0.1", server.getPort(), 5 /*timeoutSec*/, "tester", "secret", log);

        const FtpReply reply = client->runCommand("PASV", FTP_STATUS_PASSIVE_MODE);
        CPPUNIT_ASSERT(contains(reply.message, "(127,0,0,1,"));
        const int port = parsePasvPort(reply.message);

        //the announced port accepts the data connection
        Socket dataSocket("127.0.0.1", numberTo(port), 5 /*timeoutSec*/);
        client->quit();
    }
}


void LoopbackTest::testSessionCommands()
{
    CPPUNIT_ASSERT_EQUAL(std::string("UNIX Type: L8"), client_->system());
    client_->noop();

    for (const char* feature : {"UTF8", "EPSV", "PASV", "SIZE", "REST"})
        CPPUNIT_ASSERT(client_->hasFeature(feature));
    CPPUNIT_ASSERT_EQUAL(std::string("STREAM"), client_->getFeatures().at("REST"));

    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_NOT_IMPLEMENTED), client_->runCommand("XYZZY", std::nullopt).code);
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_BAD_ARGUMENTS),   client_->runCommand("TYPE X", std::nullopt).code);
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_BAD_ARGUMENTS),   client_->runCommand("OPTS MLST type;", std::nullopt).code);
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_COMMAND_OK),      client_->runCommand("type a", std::nullopt).code);
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_COMMAND_OK),      client_->runCommand("TYPE A N", std::nullopt).code);
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_COMMAND_OK),      client_->runCommand("TYPE I", std::nullopt).code);

    //passwords never show up in the logs
    for (const LogEntry& entry : clientLog_->fetchLog())
        CPPUNIT_ASSERT(entry.message.find("top secret") == std::string::npos);
    for (const LogEntry& entry : serverLog_->fetchLog())
        CPPUNIT_ASSERT(entry.message.find("top secret") == std::string::npos);

    const ErrorLogStats stats = getStats(clientLog_->fetchLog());
    CPPUNIT_ASSERT(stats.info > 0);
    CPPUNIT_ASSERT_EQUAL(0, stats.error);
}


void LoopbackTest::testBareLineFeed()
{
    Socket controlSocket("127.0.0.1", numberTo(server_->getPort()), 5 /*timeoutSec*/);
    LineReader reader(controlSocket.get());
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_SERVICE_READY), readReply(reader).code);

    //commands terminated by LF only, sent in one piece
    const std::string_view commands = "NOOP\nSYST\n";
    for (size_t bytesWritten = 0; bytesWritten < commands.size(); )
        bytesWritten += tryWriteSocket(controlSocket.get(), commands.data() + bytesWritten, commands.size() - bytesWritten);

    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_COMMAND_OK), readReply(reader).code);

    const FtpReply reply = readReply(reader);
    CPPUNIT_ASSERT_EQUAL(int(FTP_STATUS_SYSTEM_TYPE), reply.code);
    CPPUNIT_ASSERT_EQUAL(std::string("UNIX Type: L8"), reply.message);
}


void LoopbackTest::testLogout()
{
    client_->makeDir("dir");
    client_->changeDir("dir");

    client_->logout();
    client_->login("other", "password");

    //session state is reset
    CPPUNIT_ASSERT_EQUAL(std::string("/"), client_->currentDir());
}


void LoopbackTest::testConnectFailure()
{
    const int port = server_->getPort();
    {
        SessionLog log;
        std::unique_ptr<FtpClient> anonClient = FtpClient::connectAnonymous("127.0.0.1", port, 5 /*timeoutSec*/, log);
        CPPUNIT_ASSERT_EQUAL(std::string("/"), anonClient->currentDir());
        anonClient->quit();
    }
    server_.reset(); //nobody is listening anymore

    SessionLog log;
    CPPUNIT_ASSERT_THROW(FtpClient::connectAnonymous("127.0.0.1", port, 2 /*timeoutSec*/, log), SysError);
}


void LoopbackTest::testConnectWithLoginPhrase()
{
    client_->makeDir("home dir");

    FtpLogin login;
    login.server = "127.0.0.1";
    login.portCfg = server_->getPort();
    login.username = "tester";
    login.password = "pass:word";
    login.folderPath = "/home dir";
    login.timeoutSec = 5;

    SessionLog log;
    std::unique_ptr<FtpClient> client = FtpClient::connect(parseFtpLoginPhrase(concatenateFtpLoginPhrase(login)), log);

    CPPUNIT_ASSERT_EQUAL(std::string("127.0.0.1"), client->getHost());
    CPPUNIT_ASSERT_EQUAL(std::string("/home dir"), client->currentDir());
    client->quit();
    client->quit(); //no-op

    CPPUNIT_ASSERT_THROW(client->noop(), SysError); //connection is closed
}
