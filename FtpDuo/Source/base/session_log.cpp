// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include "session_log.h"

using namespace duo;
using namespace fdo;


void SessionLog::logMsg(const std::string& msg, MessageType type)
{
    const LogEntry entry{std::time(nullptr), type, msg};

    log_.access([&](ErrorLog& log)
    {
        if (onEntry_)
            onEntry_(entry);

        if (maxEntries_ == 0)
            return;

        if (log.size() >= maxEntries_) //long-running server: drop the oldest
            log.erase(log.begin(), log.begin() + (log.size() - maxEntries_ + 1));
        log.push_back(entry);
    });
}


ErrorLog SessionLog::fetchLog()
{
    return log_.access([](const ErrorLog& log) { return log; });
}
