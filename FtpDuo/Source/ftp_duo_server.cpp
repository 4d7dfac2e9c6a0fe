// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include <iostream>
#include <signal.h>
#include "ftp/ftp_server.h"

using namespace duo;
using namespace fdo;


int main(int argc, char* argv[])
{
    //usage: ftp_duo_server root=<folder> [host=127.0.0.1] [port=2121] [passive=127.0.0.1] [timeout=30]
    std::vector<std::string> args(argv + 1, argv + argc);

    //block before any thread is started: all threads inherit the mask, so only sigwait() sees the signal
    sigset_t stopSignals = {};
    ::sigemptyset(&stopSignals);
    ::sigaddset(&stopSignals, SIGINT);
    ::sigaddset(&stopSignals, SIGTERM);
    ::sigaddset(&stopSignals, SIGHUP);
    ::pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    try
    {
        const ServerConfig cfg = parseServerConfig(args); //throw SysError

        auto log = std::make_shared<SessionLog>(0 /*maxEntries: console only*/, [](const LogEntry& entry) { std::cerr << formatMessage(entry) << std::endl; });

        FtpServer server(cfg, log); //throw SysError

        int sig = 0;
        if (const int rv = ::sigwait(&stopSignals, &sig);
            rv != 0)
            throw SysError(formatSystemError("sigwait", rv));

        log->logInfo(replaceCpy(_("Received signal %x, shutting down."), "%x", numberTo(sig)));
        return 0;
    }
    catch (const SysError& e)
    {
        std::cerr << e.toString() << std::endl;
        return 1;
    }
}
