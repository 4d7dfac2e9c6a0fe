// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#ifndef FTP_SERVER_H_7719203846510293
#define FTP_SERVER_H_7719203846510293

#include <duo/socket.h>
#include <duo/thread.h>
#include "../base/ftp_config.h"
#include "../base/session_log.h"


namespace fdo
{
/*  listens for FTP clients until destroyed:
    - each connection is served by its own detached thread running a ServerSession
    - sessions share nothing but the log                                             */
class FtpServer
{
public:
    FtpServer(const ServerConfig& cfg, const std::shared_ptr<SessionLog>& log); //throw SysError
    ~FtpServer();

    int getPort() const { return listenSocket_->getPort(); } //the actual port if ServerConfig::port == 0

private:
    FtpServer           (const FtpServer&) = delete;
    FtpServer& operator=(const FtpServer&) = delete;

    const ServerConfig cfg_;
    const std::shared_ptr<SessionLog> log_;
    const std::shared_ptr<duo::ListenSocket> listenSocket_;
    duo::InterruptibleThread acceptThread_;
};
}

#endif //FTP_SERVER_H_7719203846510293
