// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include "ftp_server.h"
#include <duo/file_error.h>
#include "server_session.h"

using namespace duo;
using namespace fdo;


FtpServer::FtpServer(const ServerConfig& cfg, const std::shared_ptr<SessionLog>& log) : //throw SysError
    cfg_(cfg),
    log_(log),
    listenSocket_(std::make_shared<ListenSocket>(cfg.listenHost, numberTo(cfg.port))), //throw SysError
    acceptThread_([cfg = cfg_, log = log_, listenSocket = listenSocket_]
{
    setCurrentThreadName("FTP accept");
    for (;;)
        try
        {
            std::unique_ptr<Socket> controlSocket = listenSocket->accept(0 /*timeoutSec*/, [] { interruptionPoint(); }); //throw SysError, ThreadStopRequest

            //session owns its socket; log outlives all sessions via shared_ptr
            std::thread([controlSocket = std::move(controlSocket), cfg, log]() mutable
            {
                setCurrentThreadName("FTP session");
                try
                {
                    ServerSession(std::move(controlSocket), cfg, *log).run(); //throw SysError
                }
                catch (const SysError& e) { log->logError(e.toString()); }
            }).detach();
        }
        catch (const SysError& e) { log->logError(e.toString()); }
})
{
    log_->logInfo(replaceCpy(replaceCpy(_("Serving folder %x on port %y."), "%x", fmtPath(cfg_.rootFolder)), "%y", numberTo(listenSocket_->getPort())));
}


FtpServer::~FtpServer()
{
    acceptThread_.requestStop();
    acceptThread_.join();
    log_->logInfo(replaceCpy(_("Stopped listening on port %x."), "%x", numberTo(listenSocket_->getPort())));
}
