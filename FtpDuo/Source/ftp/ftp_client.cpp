// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include "ftp_client.h"
#include <duo/serialize.h>
#include "ftp_status.h"

using namespace duo;
using namespace fdo;


namespace
{
//don't leak passwords into the log
std::string maskCommand(const std::string& cmd)
{
    if (startsWithAsciiNoCase(cmd, "PASS "))
        return "PASS ***";
    return cmd;
}


[[noreturn]] void throwFtpProtocolError(const std::string& cmd, const FtpReply& reply) //throw SysErrorFtpProtocol
{
    std::string msg = formatFtpStatus(reply.code);
    if (!cmd.empty())
        msg = fmtPath(maskCommand(cmd)) + ": " + msg;

    throw SysErrorFtpProtocol(msg + '\n' + _("Server response:") + ' ' + reply.message, reply.code, reply.message);
}


[[noreturn]] void throwFtpFormatError(std::string_view replyMsg) //throw SysErrorFtpFormat
{
    throw SysErrorFtpFormat(_("Unexpected FTP response.") + " (" + std::string(replyMsg) + ')');
}


std::string appendArgument(const char* cmd, const std::string& arg)
{
    if (arg.empty())
        return cmd;
    return cmd + (' ' + arg);
}
}


int fdo::parseEpsvPort(std::string_view replyMsg) //throw SysErrorFtpFormat
{
    const size_t posStart = replyMsg.find("|||");
    const size_t posEnd   = replyMsg.rfind('|');
    if (posStart == std::string_view::npos || posEnd < posStart + 3)
        throwFtpFormatError(replyMsg); //throw SysErrorFtpFormat

    unsigned int port = 0;
    if (!parseUnsigned(replyMsg.substr(posStart + 3, posEnd - posStart - 3), port) || port == 0 || port > 65535)
        throwFtpFormatError(replyMsg); //throw SysErrorFtpFormat

    return static_cast<int>(port);
}


int fdo::parsePasvPort(std::string_view replyMsg) //throw SysErrorFtpFormat
{
    const size_t posStart = replyMsg.find('(');
    const size_t posEnd   = replyMsg.rfind(')');
    if (posStart == std::string_view::npos || posEnd == std::string_view::npos || posEnd < posStart)
        throwFtpFormatError(replyMsg); //throw SysErrorFtpFormat

    //h1,h2,h3,h4,p1,p2
    std::vector<unsigned int> numbers;
    split(replyMsg.substr(posStart + 1, posEnd - posStart - 1), ',', [&](std::string_view item)
    {
        unsigned int number = 0;
        if (!parseUnsigned(trimCpy(item), number) || number > 255)
            throwFtpFormatError(replyMsg); //throw SysErrorFtpFormat
        numbers.push_back(number);
    });

    if (numbers.size() != 6)
        throwFtpFormatError(replyMsg); //throw SysErrorFtpFormat

    const int port = static_cast<int>(numbers[4] * 256 + numbers[5]);
    if (port == 0)
        throwFtpFormatError(replyMsg); //throw SysErrorFtpFormat

    return port;
}


std::map<std::string, std::string> fdo::parseFeatLines(std::string_view replyMsg)
{
    std::map<std::string, std::string> features;

    split(replyMsg, '\n', [&](std::string_view line)
    {
        if (!startsWith(line, " ")) //features are indented, the first and last line are not
            return;

        line = trimCpy(line);
        if (!line.empty())
            features[asciiToUpper(beforeFirst(line, " ", IfNotFoundReturn::all))] =
                std::string(afterFirst(line, " ", IfNotFoundReturn::none));
    });
    return features;
}


std::string fdo::parsePwdReply(std::string_view replyMsg) //throw SysErrorFtpFormat
{
    //RFC 959: embedded double quotes are doubled
    const size_t posStart = replyMsg.find('"');
    if (posStart == std::string_view::npos)
        throwFtpFormatError(replyMsg); //throw SysErrorFtpFormat

    std::string path;
    for (size_t i = posStart + 1; i < replyMsg.size(); ++i)
        if (replyMsg[i] == '"')
        {
            if (i + 1 < replyMsg.size() && replyMsg[i + 1] == '"')
            {
                path += '"';
                ++i;
            }
            else
                return path;
        }
        else
            path += replyMsg[i];

    throwFtpFormatError(replyMsg); //throw SysErrorFtpFormat
}

//-------------------------------------------------------------------------------------------

FtpDataResponse::~FtpDataResponse()
{
    if (!closed_)
        try
        {
            close(); //throw SysError, SysErrorFtpProtocol
        }
        catch (const SysError& e) { client_.log_.logWarning(e.toString()); }
}


void FtpDataResponse::close() //throw SysError, SysErrorFtpProtocol
{
    if (closed_)
        return;
    closed_ = true;

    dataChannel_->close();
    client_.log_.logInfo(replaceCpy(_("Data connection to port %x closed."), "%x", numberTo(dataChannel_->getPort())));

    client_.readReply(FTP_STATUS_CLOSING_DATA, "" /*cmd*/); //throw SysError, SysErrorFtpProtocol
}

//-------------------------------------------------------------------------------------------

FtpClient::FtpClient(const std::string& server, int port, int timeoutSec, SessionLog& log) : //throw SysError, SysErrorFtpProtocol
    timeoutSec_(timeoutSec),
    log_(log),
    controlSocket_(std::make_unique<Socket>(server, numberTo(port), timeoutSec)), //throw SysError
    lineReader_(std::make_unique<LineReader>(controlSocket_->get())),
    resolvedHost_(getPeerAddress(controlSocket_->get())) //throw SysError; same server for all data connections, even if DNS changes
{
    log_.logInfo(replaceCpy(replaceCpy(_("Connected to %x (%y)."), "%x", server + ':' + numberTo(port)), "%y", resolvedHost_));

    //connection is closed by member destructors if anything below fails
    readReply(FTP_STATUS_SERVICE_READY, "" /*cmd*/); //throw SysError, SysErrorFtpProtocol

    //RFC 2389: no FEAT support means no extra features
    if (const FtpReply reply = runCommand("FEAT", std::nullopt); //throw SysError
        reply.code == FTP_STATUS_SYSTEM_STATUS)
        features_ = parseFeatLines(reply.message);

    if (hasFeature("UTF8"))
        runCommand("OPTS UTF8 ON", FTP_STATUS_COMMAND_OK); //throw SysError, SysErrorFtpProtocol
}


FtpClient::~FtpClient() {} //=> close control connection without "QUIT": call quit() explicitly


std::unique_ptr<FtpClient> FtpClient::connectWithLogin(const std::string& server, int port, int timeoutSec, //throw SysError, SysErrorFtpProtocol
                                                       const std::string& username, const std::string& password, SessionLog& log)
{
    auto client = std::make_unique<FtpClient>(server, port, timeoutSec, log); //throw SysError, SysErrorFtpProtocol
    client->login(username, password); //throw SysError, SysErrorFtpProtocol
    return client;
}


std::unique_ptr<FtpClient> FtpClient::connectAnonymous(const std::string& server, int port, int timeoutSec, SessionLog& log) //throw SysError, SysErrorFtpProtocol
{
    return connectWithLogin(server, port, timeoutSec, "anonymous", "anonymous", log); //throw SysError, SysErrorFtpProtocol
}


std::unique_ptr<FtpClient> FtpClient::connect(const FtpLogin& login, SessionLog& log) //throw SysError, SysErrorFtpProtocol
{
    std::unique_ptr<FtpClient> client = login.username.empty() ?
                                        connectAnonymous(login.server, getEffectivePort(login), login.timeoutSec, log) : //throw SysError, SysErrorFtpProtocol
                                        connectWithLogin(login.server, getEffectivePort(login), login.timeoutSec, login.username, login.password, log); //

    if (login.folderPath != "/")
        client->changeDir(login.folderPath); //throw SysError, SysErrorFtpProtocol
    return client;
}


SocketType FtpClient::getControlSocket() const //throw SysError
{
    if (!controlSocket_)
        throw SysError(_("Connection is already closed."));
    return controlSocket_->get();
}


FtpReply FtpClient::readReply(std::optional<int> expectedCode, const std::string& cmd) //throw SysError, SysErrorFtpProtocol
{
    getControlSocket(); //throw SysError

    const FtpReply reply = fdo::readReply(*lineReader_); //throw SysError
    log_.logInfo("< " + numberTo(reply.code) + ' ' + reply.message);

    if (expectedCode && reply.code != *expectedCode)
        throwFtpProtocolError(cmd, reply); //throw SysErrorFtpProtocol

    return reply;
}


FtpReply FtpClient::runCommand(const std::string& cmd, std::optional<int> expectedCode) //throw SysError, SysErrorFtpProtocol
{
    log_.logInfo("> " + maskCommand(cmd));
    sendLine(getControlSocket(), cmd); //throw SysError

    return readReply(expectedCode, cmd); //throw SysError, SysErrorFtpProtocol
}


void FtpClient::login(const std::string& username, const std::string& password) //throw SysError, SysErrorFtpProtocol
{
    const std::string cmdUser = "USER " + username;
    const FtpReply reply = runCommand(cmdUser, std::nullopt); //throw SysError

    switch (reply.code)
    {
        case FTP_STATUS_LOGGED_IN:
            break;
        case FTP_STATUS_USER_OK_NEED_PASSWORD:
            runCommand("PASS " + password, FTP_STATUS_LOGGED_IN); //throw SysError, SysErrorFtpProtocol
            break;
        default:
            throwFtpProtocolError(cmdUser, reply); //throw SysErrorFtpProtocol
    }

    runCommand("TYPE I", FTP_STATUS_COMMAND_OK); //throw SysError, SysErrorFtpProtocol
    log_.logInfo(replaceCpy(_("User %x logged in."), "%x", fmtPath(username)));
}


void FtpClient::logout() //throw SysError, SysErrorFtpProtocol
{
    runCommand("REIN", FTP_STATUS_SERVICE_READY); //throw SysError, SysErrorFtpProtocol
}


void FtpClient::quit() //noexcept
{
    if (!controlSocket_)
        return;

    try
    {
        log_.logInfo("> QUIT");
        sendLine(controlSocket_->get(), "QUIT"); //throw SysError; don't wait for reply
    }
    catch (const SysError& e) { log_.logWarning(e.toString()); }

    lineReader_.reset();
    controlSocket_.reset();
    log_.logInfo(replaceCpy(_("Disconnected from %x."), "%x", resolvedHost_));
}


int FtpClient::negotiatePassivePort() //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
{
    try
    {
        return parseEpsvPort(runCommand("EPSV", FTP_STATUS_EXTENDED_PASSIVE_MODE).message); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
    }
    catch (const SysError& eEpsv)
    {
        try
        {
            return parsePasvPort(runCommand("PASV", FTP_STATUS_PASSIVE_MODE).message); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
        }
        catch (const SysError& ePasv) { throw SysError(eEpsv.toString() + '\n' + ePasv.toString()); }
    }
}


std::unique_ptr<FtpDataResponse> FtpClient::openDataCommand(const std::string& cmd, uint64_t offset) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
{
    const int port = negotiatePassivePort(); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat

    //data channel is closed by its destructor if anything below fails
    auto dataChannel = std::make_unique<OutboundDataChannel>(resolvedHost_, port, timeoutSec_); //throw SysError
    log_.logInfo(replaceCpy(_("Data connection to port %x opened."), "%x", numberTo(port)));

    if (offset > 0)
        runCommand("REST " + numberTo(offset), FTP_STATUS_FILE_ACTION_PENDING); //throw SysError, SysErrorFtpProtocol

    const FtpReply reply = runCommand(cmd, std::nullopt); //throw SysError
    if (reply.code != FTP_STATUS_DATA_CONNECTION_OPEN &&
        reply.code != FTP_STATUS_FILE_STATUS_OK)
        throwFtpProtocolError(cmd, reply); //throw SysErrorFtpProtocol

    return std::make_unique<FtpDataResponse>(std::move(dataChannel), *this);
}


std::string FtpClient::readAllLines(const std::string& cmd) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
{
    std::unique_ptr<FtpDataResponse> response = openDataCommand(cmd, 0 /*offset*/); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat

    std::string rawListing = unbufferedLoad<std::string>([&](void* buffer, size_t bytesToRead)
    {
        return response->tryRead(buffer, bytesToRead); //throw SysError
    },
    DataChannel::blockSize); //throw SysError

    response->close(); //throw SysError, SysErrorFtpProtocol
    return rawListing;
}


std::vector<std::string> FtpClient::nameList(const std::string& path) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
{
    std::vector<std::string> names;
    split2(readAllLines(appendArgument("NLST", path)), [](char c) { return isLineBreak(c); }, [&](std::string_view line)
    {
        if (!line.empty()) //consider <CR><LF>
            names.emplace_back(line);
    });
    return names;
}


std::vector<FtpEntry> FtpClient::list(const std::string& path) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
{
    return parseListing(readAllLines(appendArgument("LIST", path))); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
}


std::unique_ptr<FtpDataResponse> FtpClient::retrieve(const std::string& filePath, uint64_t offset) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
{
    return openDataCommand("RETR " + filePath, offset); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
}


std::string FtpClient::retrieveToString(const std::string& filePath) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
{
    std::unique_ptr<FtpDataResponse> response = retrieve(filePath); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat

    std::string content = unbufferedLoad<std::string>([&](void* buffer, size_t bytesToRead)
    {
        return response->tryRead(buffer, bytesToRead); //throw SysError
    },
    DataChannel::blockSize); //throw SysError

    response->close(); //throw SysError, SysErrorFtpProtocol
    return content;
}


void FtpClient::store(const std::string& filePath, const TryReadFun& tryRead /*throw X*/, uint64_t offset) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, X
{
    std::unique_ptr<FtpDataResponse> response = openDataCommand("STOR " + filePath, offset); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat

    const uint64_t bytesSent = unbufferedStreamCopy(tryRead, DataChannel::blockSize, //throw SysError, X
                                                    [&](const void* buffer, size_t bytesToWrite)
    {
        return response->tryWrite(buffer, bytesToWrite); //throw SysError
    },
    DataChannel::blockSize);

    response->shutdownSend(); //throw SysError; send FIN => server knows upload is complete
    response->close(); //throw SysError, SysErrorFtpProtocol; confirmation failure wins over successful copy

    log_.logInfo(replaceCpy(replaceCpy(_("Stored %x bytes to %y."), "%x", numberTo(bytesSent)), "%y", fmtPath(filePath)));
}


void FtpClient::storeFromString(const std::string& filePath, std::string_view bytes) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
{
    size_t bytesRead = 0;
    store(filePath, [&](void* buffer, size_t bytesToRead) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
    {
        const size_t blockSize = std::min(bytesToRead, bytes.size() - bytesRead);
        std::memcpy(buffer, bytes.data() + bytesRead, blockSize);
        bytesRead += blockSize;
        return blockSize;
    });
}


void FtpClient::changeDir(const std::string& path) //throw SysError, SysErrorFtpProtocol
{
    runCommand("CWD " + path, FTP_STATUS_FILE_ACTION_OK); //throw SysError, SysErrorFtpProtocol
}


void FtpClient::changeDirToParent() //throw SysError, SysErrorFtpProtocol
{
    runCommand("CDUP", FTP_STATUS_FILE_ACTION_OK); //throw SysError, SysErrorFtpProtocol
}


std::string FtpClient::currentDir() //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
{
    return parsePwdReply(runCommand("PWD", FTP_STATUS_PATH_CREATED).message); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
}


void FtpClient::rename(const std::string& pathFrom, const std::string& pathTo) //throw SysError, SysErrorFtpProtocol
{
    runCommand("RNFR " + pathFrom, FTP_STATUS_FILE_ACTION_PENDING); //throw SysError, SysErrorFtpProtocol
    runCommand("RNTO " + pathTo,   FTP_STATUS_FILE_ACTION_OK);      //
}


void FtpClient::makeDir(const std::string& path) //throw SysError, SysErrorFtpProtocol
{
    runCommand("MKD " + path, FTP_STATUS_PATH_CREATED); //throw SysError, SysErrorFtpProtocol
}


void FtpClient::removeDir(const std::string& path) //throw SysError, SysErrorFtpProtocol
{
    runCommand("RMD " + path, FTP_STATUS_FILE_ACTION_OK); //throw SysError, SysErrorFtpProtocol
}


void FtpClient::deleteFile(const std::string& path) //throw SysError, SysErrorFtpProtocol
{
    runCommand("DELE " + path, FTP_STATUS_FILE_ACTION_OK); //throw SysError, SysErrorFtpProtocol
}


uint64_t FtpClient::fileSize(const std::string& path) //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
{
    const FtpReply reply = runCommand("SIZE " + path, FTP_STATUS_FILE_STATUS); //throw SysError, SysErrorFtpProtocol

    uint64_t size = 0;
    if (!parseUnsigned(trimCpy(reply.message), size))
        throwFtpFormatError(reply.message); //throw SysErrorFtpFormat
    return size;
}


std::string FtpClient::system() //throw SysError, SysErrorFtpProtocol
{
    return runCommand("SYST", FTP_STATUS_SYSTEM_TYPE).message; //throw SysError, SysErrorFtpProtocol
}


void FtpClient::noop() //throw SysError, SysErrorFtpProtocol
{
    runCommand("NOOP", FTP_STATUS_COMMAND_OK); //throw SysError, SysErrorFtpProtocol
}
