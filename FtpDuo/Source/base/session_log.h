// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#ifndef SESSION_LOG_H_8830192847561029
#define SESSION_LOG_H_8830192847561029

#include <functional>
#include <duo/error_log.h>
#include <duo/thread.h>


namespace fdo
{
//thread-safe log shared by all sessions of a client or server
class SessionLog
{
public:
    /* maxEntries: number of most recent entries kept for fetchLog(); 0: keep none
       onEntry:    optional sink, e.g. console output; called for every new entry (serialized) */
    explicit SessionLog(size_t maxEntries = 10000, const std::function<void(const duo::LogEntry& entry)>& onEntry = nullptr) :
        maxEntries_(maxEntries), onEntry_(onEntry) {}

    void logInfo   (const std::string& msg) { logMsg(msg, duo::MSG_TYPE_INFO); }
    void logWarning(const std::string& msg) { logMsg(msg, duo::MSG_TYPE_WARNING); }
    void logError  (const std::string& msg) { logMsg(msg, duo::MSG_TYPE_ERROR); }

    duo::ErrorLog fetchLog(); //snapshot of the retained entries, oldest first

private:
    SessionLog           (const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    void logMsg(const std::string& msg, duo::MessageType type);

    duo::Protected<duo::ErrorLog> log_;
    const size_t maxEntries_;
    const std::function<void(const duo::LogEntry& entry)> onEntry_;
};
}

#endif //SESSION_LOG_H_8830192847561029
