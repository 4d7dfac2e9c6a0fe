// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include "server_session.h"
#include <duo/file_access.h>
#include <duo/file_io.h>
#include <duo/file_path.h>
#include "ftp_status.h"
#include "listing_codec.h"

using namespace duo;
using namespace fdo;


namespace
{
//a reply is a single line: FileError messages span several
std::string flattenErrorText(const std::string& msg)
{
    std::string output;
    split(msg, '\n', [&](std::string_view line)
    {
        line = trimCpy(line);
        if (!line.empty())
        {
            if (!output.empty())
                output += ' ';
            output += line;
        }
    });
    return output;
}


void writeAll(DataChannel& dataChannel, std::string_view bytes) //throw SysError
{
    for (size_t bytesWritten = 0; bytesWritten < bytes.size(); )
        bytesWritten += dataChannel.tryWrite(bytes.data() + bytesWritten, bytes.size() - bytesWritten); //throw SysError
}


std::string quotePath(const std::string& virtualPath)
{
    return '"' + replaceCpy(virtualPath, "\"", "\"\"") + '"'; //RFC 959: embedded quotes are doubled
}
}


const std::map<std::string, ServerSession::CommandHandler, std::less<>> ServerSession::commandTable_
{
    //*INDENT-OFF*
    {"USER", &ServerSession::cmdUser},
    {"PASS", &ServerSession::cmdPass},
    {"REIN", &ServerSession::cmdRein},
    {"SYST", &ServerSession::cmdSyst},
    {"NOOP", &ServerSession::cmdNoop},
    {"QUIT", &ServerSession::cmdQuit},
    {"FEAT", &ServerSession::cmdFeat},
    {"OPTS", &ServerSession::cmdOpts},
    {"TYPE", &ServerSession::cmdType},
    {"PWD",  &ServerSession::cmdPwd },
    {"XPWD", &ServerSession::cmdPwd },
    {"CWD",  &ServerSession::cmdCwd },
    {"XCWD", &ServerSession::cmdCwd },
    {"CDUP", &ServerSession::cmdCdup},
    {"XCUP", &ServerSession::cmdCdup},
    {"MKD",  &ServerSession::cmdMkd },
    {"XMKD", &ServerSession::cmdMkd },
    {"RMD",  &ServerSession::cmdRmd },
    {"XRMD", &ServerSession::cmdRmd },
    {"DELE", &ServerSession::cmdDele},
    {"SIZE", &ServerSession::cmdSize},
    {"RNFR", &ServerSession::cmdRnfr},
    {"RNTO", &ServerSession::cmdRnto},
    {"EPSV", &ServerSession::cmdEpsv},
    {"PASV", &ServerSession::cmdPasv},
    {"REST", &ServerSession::cmdRest},
    {"LIST", &ServerSession::cmdList},
    {"NLST", &ServerSession::cmdNlst},
    {"RETR", &ServerSession::cmdRetr},
    {"STOR", &ServerSession::cmdStor},
    //*INDENT-ON*
};


ServerSession::ServerSession(std::unique_ptr<Socket>&& controlSocket, const ServerConfig& cfg, SessionLog& log) : //throw SysError
    controlSocket_(std::move(controlSocket)),
    lineReader_(controlSocket_->get()),
    cfg_(cfg),
    log_(log),
    peerAddress_(getPeerAddress(controlSocket_->get())) {} //throw SysError


std::string ServerSession::resolveVirtualPath(const std::string& workingPath, const std::string& path)
{
    std::vector<std::string_view> components;

    auto addComponents = [&](std::string_view relPath)
    {
        split(relPath, FILE_NAME_SEPARATOR, [&](std::string_view comp)
        {
            if (comp == "..")
            {
                if (!components.empty()) //never above the root
                    components.pop_back();
            }
            else if (!comp.empty() && comp != ".")
                components.push_back(comp);
        });
    };

    if (!startsWith(path, "/"))
        addComponents(workingPath);
    addComponents(path);

    std::string virtualPath;
    for (const std::string_view comp : components)
        (virtualPath += FILE_NAME_SEPARATOR) += comp;

    return virtualPath.empty() ? std::string(1, FILE_NAME_SEPARATOR) : virtualPath;
}


std::string ServerSession::getLocalPath(const std::string& virtualPath) const
{
    if (virtualPath == "/")
        return cfg_.rootFolder;
    return appendPath(cfg_.rootFolder, virtualPath);
}


void ServerSession::run() //noexcept
{
    log_.logInfo(replaceCpy(_("Client %x connected."), "%x", peerAddress_));
    try
    {
        replyStatusText(FTP_STATUS_SERVICE_READY); //throw SysError

        while (!quitRequested_)
        {
            const std::optional<std::string> line = lineReader_.readLine(); //throw SysError
            if (!line)
                break; //client hung up

            processCommand(*line); //throw SysError
        }
    }
    catch (const SysError& e) { log_.logError(replaceCpy(_("Connection to client %x failed."), "%x", peerAddress_) + '\n' + e.toString()); }

    resetState();
    log_.logInfo(replaceCpy(_("Client %x disconnected."), "%x", peerAddress_));
}


void ServerSession::processCommand(const std::string& line) //throw SysError
{
    const std::vector<std::string_view> tokens = splitCpy(line, ' ', SplitOnEmpty::skip);
    if (tokens.empty())
        return reply(FTP_STATUS_BAD_ARGUMENTS, _("Empty command."));

    const std::string cmdName = asciiToUpper(tokens[0]);

    std::string args;
    for (auto it = tokens.begin() + 1; it != tokens.end(); ++it)
    {
        if (!args.empty())
            args += ' ';
        args += *it;
    }

    log_.logInfo("> " + (cmdName == "PASS" ? std::string("PASS ***") : cmdName + (args.empty() ? "" : ' ' + args)));

    auto it = commandTable_.find(cmdName);
    if (it == commandTable_.end())
        return replyStatusText(FTP_STATUS_NOT_IMPLEMENTED);

    try
    {
        (this->*(it->second))(args); //throw FileError, SysError
    }
    catch (const FileError& e) { reply(FTP_STATUS_FILE_UNAVAILABLE, flattenErrorText(e.toString())); }
}


void ServerSession::reply(int code, const std::string& msg) //throw SysError
{
    const std::string line = numberTo(code) + ' ' + msg;
    log_.logInfo("< " + line);
    sendLine(controlSocket_->get(), line); //throw SysError
}


void ServerSession::replyStatusText(int code) //throw SysError
{
    reply(code, getFtpStatusText(code));
}


std::unique_ptr<DataChannel> ServerSession::takeDataChannel()
{
    return std::move(activeDataChannel_); //moved-from unique_ptr is guaranteed empty
}


void ServerSession::resetState()
{
    if (activeDataChannel_)
        activeDataChannel_->close();
    activeDataChannel_.reset();
    renamePendingSource_.reset();
    restartOffset_.reset();
    workingPath_ = "/";
}

//----------------------------------------------------------------------------------------

void ServerSession::cmdUser(const std::string& args) { replyStatusText(FTP_STATUS_USER_OK_NEED_PASSWORD); }
void ServerSession::cmdPass(const std::string& args) { replyStatusText(FTP_STATUS_LOGGED_IN); }
void ServerSession::cmdSyst(const std::string& args) { reply(FTP_STATUS_SYSTEM_TYPE, "UNIX Type: L8"); }
void ServerSession::cmdNoop(const std::string& args) { replyStatusText(FTP_STATUS_COMMAND_OK); }


void ServerSession::cmdRein(const std::string& args)
{
    resetState();
    replyStatusText(FTP_STATUS_SERVICE_READY);
}


void ServerSession::cmdQuit(const std::string& args)
{
    quitRequested_ = true;
    replyStatusText(FTP_STATUS_CLOSING_CONTROL);
}


void ServerSession::cmdFeat(const std::string& args)
{
    const char* features[] = {"UTF8", "EPSV", "PASV", "SIZE", "REST STREAM"};

    log_.logInfo("< 211-Features:");
    sendLine(controlSocket_->get(), "211-Features:"); //throw SysError
    for (const char* feature : features)
        sendLine(controlSocket_->get(), std::string(" ") + feature); //throw SysError

    reply(FTP_STATUS_SYSTEM_STATUS, "End");
}


void ServerSession::cmdOpts(const std::string& args)
{
    if (equalAsciiNoCase(args, "UTF8 ON"))
        reply(FTP_STATUS_COMMAND_OK, _("UTF8 mode enabled."));
    else
        replyStatusText(FTP_STATUS_BAD_ARGUMENTS);
}


void ServerSession::cmdType(const std::string& args)
{
    //"TYPE A N": format control (N, T, C) does not matter for data sent as is
    const std::string_view typeCode = beforeFirst(args, " ", IfNotFoundReturn::all);

    if (equalAsciiNoCase(typeCode, "A"))
        reply(FTP_STATUS_COMMAND_OK, "Type set to ASCII.");
    else if (equalAsciiNoCase(typeCode, "I"))
        reply(FTP_STATUS_COMMAND_OK, "Type set to binary.");
    else
        reply(FTP_STATUS_BAD_ARGUMENTS, "Invalid type.");
}

//----------------------------------------------------------------------------------------

void ServerSession::cmdPwd(const std::string& args)
{
    reply(FTP_STATUS_PATH_CREATED, quotePath(workingPath_) + " is current directory.");
}


void ServerSession::cmdCwd(const std::string& args)
{
    const std::string virtualPath = resolveVirtualPath(workingPath_, args);

    if (getItemTypeIfExists(getLocalPath(virtualPath)) != ItemType::folder) //throw FileError
        return reply(FTP_STATUS_FILE_UNAVAILABLE, replaceCpy(_("Directory %x not found."), "%x", fmtPath(virtualPath)));

    workingPath_ = virtualPath;
    reply(FTP_STATUS_FILE_ACTION_OK, "Directory changed to " + workingPath_);
}


void ServerSession::cmdCdup(const std::string& args) { cmdCwd(".."); }


void ServerSession::cmdMkd(const std::string& args)
{
    const std::string virtualPath = resolveVirtualPath(workingPath_, args);

    createDirectory(getLocalPath(virtualPath)); //throw FileError, ErrorTargetExisting
    reply(FTP_STATUS_PATH_CREATED, quotePath(virtualPath) + " created.");
}


void ServerSession::cmdRmd(const std::string& args)
{
    const std::string virtualPath = resolveVirtualPath(workingPath_, args);
    const std::string localPath = getLocalPath(virtualPath);

    if (virtualPath == "/" || getItemTypeIfExists(localPath) != ItemType::folder) //throw FileError
        return reply(FTP_STATUS_FILE_UNAVAILABLE, replaceCpy(_("Directory %x not found."), "%x", fmtPath(virtualPath)));

    removeDirectoryPlainRecursion(localPath); //throw FileError
    reply(FTP_STATUS_FILE_ACTION_OK, "Directory deleted.");
}


void ServerSession::cmdDele(const std::string& args)
{
    const std::string virtualPath = resolveVirtualPath(workingPath_, args);
    const std::string localPath = getLocalPath(virtualPath);

    const std::optional<ItemType> type = getItemTypeIfExists(localPath); //throw FileError
    if (!type || *type == ItemType::folder)
        return reply(FTP_STATUS_FILE_UNAVAILABLE, replaceCpy(_("File %x not found."), "%x", fmtPath(virtualPath)));

    if (*type == ItemType::symlink)
        removeSymlinkPlain(localPath); //throw FileError
    else
        removeFilePlain(localPath); //throw FileError
    reply(FTP_STATUS_FILE_ACTION_OK, "File deleted.");
}


void ServerSession::cmdSize(const std::string& args)
{
    const std::string virtualPath = resolveVirtualPath(workingPath_, args);
    const std::string localPath = getLocalPath(virtualPath);

    const std::optional<ItemType> type = getItemTypeIfExists(localPath); //throw FileError
    if (!type)
        return reply(FTP_STATUS_FILE_UNAVAILABLE, replaceCpy(_("File %x not found."), "%x", fmtPath(virtualPath)));

    if (*type == ItemType::folder)
        reply(FTP_STATUS_FILE_STATUS, "1024");
    else
        reply(FTP_STATUS_FILE_STATUS, numberTo(getFileSize(localPath))); //throw FileError
}


void ServerSession::cmdRnfr(const std::string& args)
{
    renamePendingSource_ = resolveVirtualPath(workingPath_, args);
    replyStatusText(FTP_STATUS_FILE_ACTION_PENDING);
}


void ServerSession::cmdRnto(const std::string& args)
{
    if (!renamePendingSource_)
        return reply(FTP_STATUS_BAD_SEQUENCE, "Bad sequence of commands.");

    const std::string virtualPathFrom = *renamePendingSource_;
    renamePendingSource_.reset(); //consumed by any outcome

    moveAndRenameItem(getLocalPath(virtualPathFrom), getLocalPath(resolveVirtualPath(workingPath_, args))); //throw FileError
    reply(FTP_STATUS_FILE_ACTION_OK, "File renamed.");
}

//----------------------------------------------------------------------------------------

void ServerSession::openPassiveChannel(bool extended) //throw SysError
{
    if (activeDataChannel_)
        activeDataChannel_->close();
    activeDataChannel_.reset();

    try
    {
        activeDataChannel_ = std::make_unique<PassiveDataChannel>(cfg_.passiveHost, cfg_.acceptTimeoutSec); //throw SysError
    }
    catch (const SysError& e)
    {
        log_.logWarning(e.toString());
        return replyStatusText(FTP_STATUS_CANNOT_OPEN_DATA);
    }

    const int port = activeDataChannel_->getPort();
    log_.logInfo(replaceCpy(_("Passive data connection listening on %x."), "%x", activeDataChannel_->getHost() + ':' + numberTo(port)));

    if (extended)
        return reply(FTP_STATUS_EXTENDED_PASSIVE_MODE, "Entering Extended Passive Mode (|||" + numberTo(port) + "|)");

    //227 needs a numeric IPv4: "0.0.0.0" is no destination, so announce the address the client already reached
    std::string advertisedHost = activeDataChannel_->getHost();
    if (advertisedHost == "0.0.0.0")
        advertisedHost = getLocalAddress(controlSocket_->get()); //throw SysError

    reply(FTP_STATUS_PASSIVE_MODE, "Entering Passive Mode (" + replaceCpy(advertisedHost, ".", ",") + ',' +
          numberTo(port / 256) + ',' + numberTo(port % 256) + ')');
}


void ServerSession::cmdEpsv(const std::string& args) { openPassiveChannel(true  /*extended*/); }
void ServerSession::cmdPasv(const std::string& args) { openPassiveChannel(false /*extended*/); }


void ServerSession::cmdRest(const std::string& args)
{
    uint64_t offset = 0;
    if (!parseUnsigned(args, offset))
        return replyStatusText(FTP_STATUS_BAD_ARGUMENTS);

    restartOffset_ = offset;
    reply(FTP_STATUS_FILE_ACTION_PENDING, "Restarting at " + numberTo(offset) + '.');
}


void ServerSession::sendListing(const std::string& args, bool detailed) //throw SysError
{
    std::unique_ptr<DataChannel> dataChannel = takeDataChannel();
    restartOffset_.reset();
    if (!dataChannel)
        return reply(FTP_STATUS_TRANSFER_ABORTED, _("No data connection."));

    std::vector<ListingItem> items;
    try
    {
        //"LIST -la": options are not supported and ignored
        std::string_view path = args;
        while (startsWith(path, "-"))
            path = trimCpy(afterFirst(path, " ", IfNotFoundReturn::none));

        items = getListingItems(getLocalPath(resolveVirtualPath(workingPath_, std::string(path)))); //throw FileError
    }
    catch (const FileError& e)
    {
        dataChannel->close();
        return reply(FTP_STATUS_FILE_UNAVAILABLE, flattenErrorText(e.toString()));
    }

    const std::string listing = detailed ? formatListDetailed(items) : formatListShort(items);

    reply(FTP_STATUS_FILE_STATUS_OK, "Opening ASCII mode data connection for file list");
    try
    {
        DUO_ON_SCOPE_EXIT(dataChannel->close());

        writeAll(*dataChannel, listing); //throw SysError
        dataChannel->shutdownSend(); //throw SysError
    }
    catch (const SysError& e) { return reply(FTP_STATUS_TRANSFER_ABORTED, flattenErrorText(e.toString())); }

    reply(FTP_STATUS_CLOSING_DATA, "Closing data connection, sent " + numberTo(listing.size()) + " bytes.");
}


void ServerSession::cmdList(const std::string& args) { sendListing(args, true  /*detailed*/); }
void ServerSession::cmdNlst(const std::string& args) { sendListing(args, false /*detailed*/); }


void ServerSession::cmdRetr(const std::string& args)
{
    std::unique_ptr<DataChannel> dataChannel = takeDataChannel();
    const uint64_t offset = restartOffset_ ? *restartOffset_ : 0;
    restartOffset_.reset();
    if (!dataChannel)
        return reply(FTP_STATUS_CANNOT_OPEN_DATA, _("No data connection."));

    std::unique_ptr<FileInputPlain> fileIn;
    try
    {
        fileIn = std::make_unique<FileInputPlain>(getLocalPath(resolveVirtualPath(workingPath_, args)), offset); //throw FileError
    }
    catch (const FileError& e)
    {
        dataChannel->close();
        return reply(FTP_STATUS_FILE_UNAVAILABLE, flattenErrorText(e.toString()));
    }

    const uint64_t bytesExpected = fileIn->getFileSize() > offset ? fileIn->getFileSize() - offset : 0;
    reply(FTP_STATUS_FILE_STATUS_OK, "Data transfer starting " + numberTo(bytesExpected) + " bytes");

    uint64_t bytesSent = 0;
    try
    {
        DUO_ON_SCOPE_EXIT(dataChannel->close());

        bytesSent = unbufferedStreamCopy([&](void* buffer, size_t bytesToRead)
        {
            return fileIn->tryRead(buffer, bytesToRead); //throw FileError
        },
        FileBase::defaultBlockSize,
        [&](const void* buffer, size_t bytesToWrite)
        {
            return dataChannel->tryWrite(buffer, bytesToWrite); //throw SysError
        },
        DataChannel::blockSize); //throw FileError, SysError

        dataChannel->shutdownSend(); //throw SysError
    }
    catch (const FileError& e) { return reply(FTP_STATUS_TRANSFER_ABORTED, flattenErrorText(e.toString())); }
    catch (const SysError&  e) { return reply(FTP_STATUS_TRANSFER_ABORTED, flattenErrorText(e.toString())); }

    reply(FTP_STATUS_CLOSING_DATA, "Closing data connection, sent " + numberTo(bytesSent) + " bytes.");
}


void ServerSession::cmdStor(const std::string& args)
{
    std::unique_ptr<DataChannel> dataChannel = takeDataChannel();
    const std::optional<uint64_t> offset = restartOffset_;
    restartOffset_.reset();
    if (!dataChannel)
        return reply(FTP_STATUS_CANNOT_OPEN_DATA, _("No data connection."));

    std::unique_ptr<FileOutputPlain> fileOut;
    try
    {
        fileOut = std::make_unique<FileOutputPlain>(getLocalPath(resolveVirtualPath(workingPath_, args)), offset); //throw FileError
    }
    catch (const FileError& e)
    {
        dataChannel->close();
        return reply(FTP_STATUS_FILE_ACTION_NOT_TAKEN, flattenErrorText(e.toString()));
    }

    reply(FTP_STATUS_FILE_STATUS_OK, "Data transfer starting.");

    uint64_t bytesReceived = 0;
    try
    {
        DUO_ON_SCOPE_EXIT(dataChannel->close());

        bytesReceived = unbufferedStreamCopy([&](void* buffer, size_t bytesToRead)
        {
            return dataChannel->tryRead(buffer, bytesToRead); //throw SysError
        },
        DataChannel::blockSize,
        [&](const void* buffer, size_t bytesToWrite)
        {
            return fileOut->tryWrite(buffer, bytesToWrite); //throw FileError
        },
        FileBase::defaultBlockSize); //throw SysError, FileError

        fileOut->close(); //throw FileError
    }
    catch (const FileError& e) { return reply(FTP_STATUS_TRANSFER_ABORTED, flattenErrorText(e.toString())); }
    catch (const SysError&  e) { return reply(FTP_STATUS_TRANSFER_ABORTED, flattenErrorText(e.toString())); }

    reply(FTP_STATUS_CLOSING_DATA, "OK, received " + numberTo(bytesReceived) + " bytes.");
}
