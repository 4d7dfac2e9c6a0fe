// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#ifndef SERVER_SESSION_H_6620938475610294
#define SERVER_SESSION_H_6620938475610294

#include <map>
#include "control_line.h"
#include "data_channel.h"
#include "../base/ftp_config.h"
#include "../base/session_log.h"


namespace fdo
{
/*  one client connection: commands are processed strictly one after another
    - all paths are virtual ("/" = ServerConfig::rootFolder) and can't escape the root
    - local file errors are reported to the client and never end the session          */
class ServerSession
{
public:
    ServerSession(std::unique_ptr<duo::Socket>&& controlSocket, const ServerConfig& cfg, SessionLog& log); //throw SysError

    void run(); //noexcept; returns when client quits or disconnects

    //virtual path resolution: exposed for testing
    static std::string resolveVirtualPath(const std::string& workingPath, const std::string& path);

private:
    ServerSession           (const ServerSession&) = delete;
    ServerSession& operator=(const ServerSession&) = delete;

    void processCommand(const std::string& line); //throw SysError

    void reply(int code, const std::string& msg); //throw SysError
    void replyStatusText(int code); //throw SysError

    std::string getLocalPath(const std::string& virtualPath) const;
    std::unique_ptr<DataChannel> takeDataChannel();
    void resetState();

    //*INDENT-OFF*
    void cmdUser(const std::string& args);
    void cmdPass(const std::string& args);
    void cmdRein(const std::string& args);
    void cmdSyst(const std::string& args);
    void cmdNoop(const std::string& args);
    void cmdQuit(const std::string& args);
    void cmdFeat(const std::string& args);
    void cmdOpts(const std::string& args);
    void cmdType(const std::string& args);
    void cmdPwd (const std::string& args);
    void cmdCwd (const std::string& args);
    void cmdCdup(const std::string& args);
    void cmdMkd (const std::string& args);
    void cmdRmd (const std::string& args);
    void cmdDele(const std::string& args);
    void cmdSize(const std::string& args);
    void cmdRnfr(const std::string& args);
    void cmdRnto(const std::string& args);
    void cmdEpsv(const std::string& args);
    void cmdPasv(const std::string& args);
    void cmdRest(const std::string& args);
    void cmdList(const std::string& args);
    void cmdNlst(const std::string& args);
    void cmdRetr(const std::string& args);
    void cmdStor(const std::string& args);
    //*INDENT-ON*

    void sendListing(const std::string& args, bool detailed); //throw SysError
    void openPassiveChannel(bool extended); //throw SysError

    using CommandHandler = void (ServerSession::*)(const std::string& args);
    static const std::map<std::string, CommandHandler, std::less<>> commandTable_;

    const std::unique_ptr<duo::Socket> controlSocket_;
    LineReader lineReader_;
    const ServerConfig cfg_;
    SessionLog& log_;
    const std::string peerAddress_;

    std::string workingPath_ = "/";
    std::optional<std::string> renamePendingSource_; //RNFR => RNTO
    std::unique_ptr<DataChannel> activeDataChannel_; //EPSV/PASV => transfer command
    std::optional<uint64_t> restartOffset_;          //REST => RETR/STOR
    bool quitRequested_ = false;
};
}

#endif //SERVER_SESSION_H_6620938475610294
