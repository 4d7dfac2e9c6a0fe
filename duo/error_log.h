// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_1182930475610293
#define ERROR_LOG_H_1182930475610293

#include <cassert>
#include <vector>
#include "time.h"
#include "i18n.h"


namespace duo
{
enum MessageType
{
    MSG_TYPE_INFO,
    MSG_TYPE_WARNING,
    MSG_TYPE_ERROR,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message;
};
using ErrorLog = std::vector<LogEntry>;

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);

//"[14:55:02]  Error:  msg"; no trailing line break
std::string formatMessage(const LogEntry& entry);






//######################## implementation ##########################
inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats stats;
    for (const LogEntry& entry : log)
        ++(entry.type == MSG_TYPE_INFO    ? stats.info :
           entry.type == MSG_TYPE_WARNING ? stats.warning : stats.error);
    return stats;
}


inline
std::string formatMessage(const LogEntry& entry)
{
    std::string typeLabel;
    switch (entry.type)
    {
        //*INDENT-OFF*
        case MSG_TYPE_INFO:    typeLabel = _("Info");    break;
        case MSG_TYPE_WARNING: typeLabel = _("Warning"); break;
        case MSG_TYPE_ERROR:   typeLabel = _("Error");   break;
        //*INDENT-ON*
    }
    assert(!typeLabel.empty());

    const std::string prefix = '[' + formatTime(formatIsoTimeTag, getLocalTime(entry.time)) + "]  " + typeLabel + ":  ";
    const std::string indent(prefix.size(), ' ');

    //align follow-up lines below the first one
    std::string output;
    for (const std::string_view line : splitCpy(trimCpy(entry.message), '\n', SplitOnEmpty::skip))
        output += (output.empty() ? prefix : '\n' + indent) + std::string(line);

    return output.empty() ? prefix : output;
}
}

#endif //ERROR_LOG_H_1182930475610293
