// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include "ftp_status.h"
#include <duo/string_tools.h>

using namespace duo;


const char* fdo::getFtpStatusText(int sc)
{
    switch (sc)
    {
        //*INDENT-OFF*
        case 125: return "Data connection already open; transfer starting.";
        case 150: return "File status okay; about to open data connection.";

        case 200: return "The requested action has been successfully completed.";
        case 211: return "System status, or system help reply.";
        case 213: return "File status.";
        case 215: return "NAME system type.";
        case 220: return "Service ready for new user.";
        case 221: return "Service closing control connection.";
        case 226: return "Closing data connection. Requested file action successful.";
        case 227: return "Entering Passive Mode.";
        case 229: return "Entering Extended Passive Mode.";
        case 230: return "User logged in, proceed.";
        case 250: return "Requested file action okay, completed.";
        case 257: return "Pathname created.";

        case 331: return "User name okay, need password.";
        case 350: return "Requested file action pending further information.";

        case 400: return "The command was not accepted but the error condition is temporary.";
        case 421: return "Service not available, closing control connection.";
        case 425: return "Cannot open data connection.";
        case 426: return "Connection closed; transfer aborted.";
        case 430: return "Invalid username or password.";
        case 450: return "Requested file action not taken.";
        case 451: return "Local error in processing.";
        case 452: return "Insufficient storage space in system. File unavailable, e.g. file busy.";

        case 500: return "Syntax error, command unrecognized or command line too long.";
        case 501: return "Syntax error in parameters or arguments.";
        case 502: return "Command not implemented.";
        case 503: return "Bad sequence of commands.";
        case 504: return "Command not implemented for that parameter.";
        case 530: return "User not logged in.";
        case 550: return "File unavailable, e.g. file not found, no access.";
        case 552: return "Requested file action aborted. Exceeded storage allocation.";
        case 553: return "File name not allowed.";

        default:  return "";
        //*INDENT-ON*
    }
}


std::string fdo::formatFtpStatus(int sc)
{
    const char* statusText = getFtpStatusText(sc);
    if (*statusText == 0)
        return replaceCpy("FTP status %x.", "%x", numberTo(sc));
    else
        return replaceCpy("FTP status %x: ", "%x", numberTo(sc)) + statusText;
}
