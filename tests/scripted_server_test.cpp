// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include <chrono>
#include <future>
#include <thread>
#include <cppunit/extensions/HelperMacros.h>
#include <ftp/ftp_client.h>
#include <ftp/ftp_status.h>

using namespace duo;
using namespace fdo;

/*
 * Client against a stand-in server whose replies are scripted per test:
 * covers server behavior the FtpDuo server never shows (rejected EPSV, REST, transfer confirmation).
 */

namespace
{
class ScriptedServer
{
public:
    //called on the server thread for every command line received
    using Script = std::function<void(const std::string& cmd, ScriptedServer& server)>;

    explicit ScriptedServer(const Script& script) :
        listenSocket_("127.0.0.1", "0"), //throw SysError
        script_(script),
        thread_([this] { run(); }) {}

    ~ScriptedServer() { join(); }

    int getPort() const { return listenSocket_.getPort(); }

    //returns after the client has disconnected
    void join() { if (thread_.joinable()) thread_.join(); }
    const std::vector<std::string>& getCommands() const { assert(!thread_.joinable()); return commands_; }

    //for use within the script:
    void reply(const std::string& line) { sendLine(controlSocket_->get(), line); } //throw SysError

    int openDataPort() //throw SysError
    {
        dataListener_ = std::make_unique<ListenSocket>("127.0.0.1", "0"); //throw SysError
        return dataListener_->getPort();
    }

    std::unique_ptr<Socket> acceptData() { return dataListener_->accept(5 /*timeoutSec*/, nullptr); } //throw SysError

private:
    void run()
    {
        try
        {
            controlSocket_ = listenSocket_.accept(5 /*timeoutSec*/, nullptr); //throw SysError
            reply("220 Scripted server ready."); //throw SysError

            LineReader reader(controlSocket_->get());
            while (const std::optional<std::string> line = reader.readLine()) //throw SysError
            {
                commands_.push_back(*line);
                script_(*line, *this); //throw SysError
            }
        }
        catch (const SysError&) {} //client is gone: the test checks what it has seen
    }

    ListenSocket listenSocket_;
    const Script script_;
    std::unique_ptr<Socket> controlSocket_;
    std::unique_ptr<ListenSocket> dataListener_;
    std::vector<std::string> commands_;
    std::thread thread_;
};


//login, TYPE, NOOP; no FEAT support
void replyToSessionCommand(const std::string& cmd, ScriptedServer& server) //throw SysError
{
    if (startsWith(cmd, "USER"))
        server.reply("230 Logged in.");
    else if (startsWith(cmd, "TYPE"))
        server.reply("200 Type set.");
    else if (startsWith(cmd, "NOOP"))
        server.reply("200 NOOP ok.");
    else if (!startsWith(cmd, "QUIT")) //client does not wait for the QUIT reply
        server.reply("502 Command not implemented.");
}


void sendAll(SocketType socket, std::string_view bytes) //throw SysError
{
    for (size_t bytesWritten = 0; bytesWritten < bytes.size(); )
        bytesWritten += tryWriteSocket(socket, bytes.data() + bytesWritten, bytes.size() - bytesWritten); //throw SysError
}


//until the peer closes the connection
std::string receiveAll(SocketType socket)
{
    std::string bytes;
    try
    {
        char buffer[1024];
        while (const size_t bytesRead = tryReadSocket(socket, buffer, sizeof(buffer))) //throw SysError
            bytes.append(buffer, bytesRead);
    }
    catch (const SysError&) {} //connection reset counts as closed
    return bytes;
}


std::string getEpsvReply(ScriptedServer& server) //throw SysError
{
    return "229 Entering Extended Passive Mode (|||" + numberTo(server.openDataPort()) + "|)";
}
}


class ScriptedServerTest final : public CppUnit::TestFixture
{
    CPPUNIT_TEST_SUITE(ScriptedServerTest);
    CPPUNIT_TEST(testPasvFallback);
    CPPUNIT_TEST(testPassiveModesRejected);
    CPPUNIT_TEST(testRestRejected);
    CPPUNIT_TEST(testTransferNotConfirmed);
    CPPUNIT_TEST(testPassiveAcceptTimeout);
    CPPUNIT_TEST_SUITE_END();

public:
    void setUp() {}
    void tearDown() {}

    void testPasvFallback();
    void testPassiveModesRejected();
    void testRestRejected();
    void testTransferNotConfirmed();
    void testPassiveAcceptTimeout();

private:
    SessionLog log_;
};

CPPUNIT_TEST_SUITE_REGISTRATION(ScriptedServerTest);


void ScriptedServerTest::testPasvFallback()
{
    ScriptedServer server([](const std::string& cmd, ScriptedServer& srv)
    {
        if (startsWith(cmd, "EPSV"))
            srv.reply("502 EPSV not implemented.");
        else if (startsWith(cmd, "PASV"))
        {
            const int port = srv.openDataPort();
            srv.reply("227 Entering Passive Mode (127,0,0,1," + numberTo(port / 256) + ',' + numberTo(port % 256) + ")");
        }
        else if (startsWith(cmd, "NLST"))
        {
            std::unique_ptr<Socket> dataSocket = srv.acceptData();
            srv.reply("150 Here comes the directory listing.");
            sendAll(dataSocket->get(), "a.txt\r\nb.txt\r\n");
            dataSocket.reset();
            srv.reply("226 Directory send OK.");
        }
        else
            replyToSessionCommand(cmd, srv);
    });

    std::unique_ptr<FtpClient> client = FtpClient::connectWithLogin("127.0.0.1", server.getPort(), 5 /*timeoutSec*/, "tester", "secret", log_);
    CPPUNIT_ASSERT(client->getFeatures().empty());

    CPPUNIT_ASSERT(client->nameList("") == std::vector<std::string>({"a.txt", "b.txt"}));

    client->quit();
    server.join();

    const std::vector<std::string>& commands = server.getCommands();
    const auto itEpsv = std::find(commands.begin(), commands.end(), "EPSV");
    CPPUNIT_ASSERT(itEpsv != commands.end());
    CPPUNIT_ASSERT(itEpsv + 1 != commands.end() && *(itEpsv + 1) == "PASV");
}


void ScriptedServerTest::testPassiveModesRejected()
{
    ScriptedServer server([](const std::string& cmd, ScriptedServer& srv)
    {
        if (startsWith(cmd, "EPSV"))
            srv.reply("500 No extended passive here.");
        else if (startsWith(cmd, "PASV"))
            srv.reply("421 No passive here either.");
        else
            replyToSessionCommand(cmd, srv);
    });

    std::unique_ptr<FtpClient> client = FtpClient::connectWithLogin("127.0.0.1", server.getPort(), 5 /*timeoutSec*/, "tester", "secret", log_);
    try
    {
        client->nameList("");
        CPPUNIT_FAIL("listing without data connection did not fail");
    }
    catch (const SysError& e)
    {
        const std::string msg = e.toString();
        const size_t posEpsv = msg.find("No extended passive here.");
        const size_t posPasv = msg.find("No passive here either.");
        CPPUNIT_ASSERT(posEpsv != std::string::npos);
        CPPUNIT_ASSERT(posPasv != std::string::npos);
        CPPUNIT_ASSERT(posEpsv < posPasv);
    }

    //control connection is still usable
    client->noop();
    client->quit();
}


void ScriptedServerTest::testRestRejected()
{
    std::promise<std::string> dataAfterRest;
    std::future<std::string> dataAfterRestFut = dataAfterRest.get_future();

    ScriptedServer server([&](const std::string& cmd, ScriptedServer& srv)
    {
        if (startsWith(cmd, "EPSV"))
            srv.reply(getEpsvReply(srv));
        else if (startsWith(cmd, "REST"))
        {
            std::unique_ptr<Socket> dataSocket = srv.acceptData(); //client has connected before REST
            srv.reply("502 REST not implemented.");
            dataAfterRest.set_value(receiveAll(dataSocket->get())); //returns once the client closed its side
        }
        else
            replyToSessionCommand(cmd, srv);
    });

    std::unique_ptr<FtpClient> client = FtpClient::connectWithLogin("127.0.0.1", server.getPort(), 5 /*timeoutSec*/, "tester", "secret", log_);

    try
    {
        client->retrieve("file.bin", 100 /*offset*/);
        CPPUNIT_FAIL("retrieve with rejected REST did not fail");
    }
    catch (const SysErrorFtpProtocol& e) { CPPUNIT_ASSERT_EQUAL(502, e.ftpStatusCode); }

    //the data connection opened for the transfer has been closed
    CPPUNIT_ASSERT(dataAfterRestFut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    CPPUNIT_ASSERT_EQUAL(std::string(), dataAfterRestFut.get());

    client->quit();
    server.join();

    //RETR was never sent
    for (const std::string& cmd : server.getCommands())
        CPPUNIT_ASSERT(!startsWith(cmd, "RETR"));
}


void ScriptedServerTest::testTransferNotConfirmed()
{
    std::string received;

    ScriptedServer server([&](const std::string& cmd, ScriptedServer& srv)
    {
        if (startsWith(cmd, "EPSV"))
            srv.reply(getEpsvReply(srv));
        else if (startsWith(cmd, "STOR"))
        {
            std::unique_ptr<Socket> dataSocket = srv.acceptData();
            srv.reply("150 Ok to send data.");
            received = receiveAll(dataSocket->get());
            srv.reply("451 Disk full.");
        }
        else
            replyToSessionCommand(cmd, srv);
    });

    std::unique_ptr<FtpClient> client = FtpClient::connectWithLogin("127.0.0.1", server.getPort(), 5 /*timeoutSec*/, "tester", "secret", log_);

    //all bytes arrive, but the missing 226 still fails the upload
    try
    {
        client->storeFromString("upload.bin", "payload");
        CPPUNIT_FAIL("unconfirmed upload did not fail");
    }
    catch (const SysErrorFtpProtocol& e)
    {
        CPPUNIT_ASSERT_EQUAL(451, e.ftpStatusCode);
        CPPUNIT_ASSERT_EQUAL(std::string("Disk full."), e.serverMessage);
    }

    client->quit();
    server.join();
    CPPUNIT_ASSERT_EQUAL(std::string("payload"), received);
}


void ScriptedServerTest::testPassiveAcceptTimeout()
{
    PassiveDataChannel dataChannel("127.0.0.1", 1 /*acceptTimeoutSec*/);
    CPPUNIT_ASSERT(dataChannel.getPort() > 0);

    char buffer[16] = {};
    CPPUNIT_ASSERT_THROW(dataChannel.tryRead(buffer, sizeof(buffer)), SysError); //nobody connects

    //outcome is cached: no second wait
    const auto startTime = std::chrono::steady_clock::now();
    CPPUNIT_ASSERT_THROW(dataChannel.tryWrite("x", 1), SysError);
    CPPUNIT_ASSERT_THROW(dataChannel.shutdownSend(), SysError);
    CPPUNIT_ASSERT(std::chrono::steady_clock::now() - startTime < std::chrono::milliseconds(500));

    dataChannel.close();
    dataChannel.close();
    CPPUNIT_ASSERT_THROW(dataChannel.tryRead(buffer, sizeof(buffer)), SysError);
}
