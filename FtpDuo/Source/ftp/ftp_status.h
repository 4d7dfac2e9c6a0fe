// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#ifndef FTP_STATUS_H_3810293847561920
#define FTP_STATUS_H_3810293847561920

#include <string>


namespace fdo
{
//reply codes used by client and server: https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
enum FtpStatus
{
    FTP_STATUS_DATA_CONNECTION_OPEN   = 125,
    FTP_STATUS_FILE_STATUS_OK         = 150,

    FTP_STATUS_COMMAND_OK             = 200,
    FTP_STATUS_SYSTEM_STATUS          = 211,
    FTP_STATUS_FILE_STATUS            = 213,
    FTP_STATUS_SYSTEM_TYPE            = 215,
    FTP_STATUS_SERVICE_READY          = 220,
    FTP_STATUS_CLOSING_CONTROL        = 221,
    FTP_STATUS_CLOSING_DATA           = 226,
    FTP_STATUS_PASSIVE_MODE           = 227,
    FTP_STATUS_EXTENDED_PASSIVE_MODE  = 229,
    FTP_STATUS_LOGGED_IN              = 230,
    FTP_STATUS_FILE_ACTION_OK         = 250,
    FTP_STATUS_PATH_CREATED           = 257,

    FTP_STATUS_USER_OK_NEED_PASSWORD  = 331,
    FTP_STATUS_FILE_ACTION_PENDING    = 350,

    FTP_STATUS_CANNOT_OPEN_DATA       = 425,
    FTP_STATUS_TRANSFER_ABORTED       = 426,
    FTP_STATUS_FILE_ACTION_NOT_TAKEN  = 450,

    FTP_STATUS_BAD_ARGUMENTS          = 501,
    FTP_STATUS_NOT_IMPLEMENTED        = 502,
    FTP_STATUS_BAD_SEQUENCE           = 503,
    FTP_STATUS_FILE_UNAVAILABLE       = 550,
};

//e.g. "File unavailable, e.g. file not found, no access."; empty string if unknown
const char* getFtpStatusText(int sc);

//e.g. "FTP status 550: File unavailable, e.g. file not found, no access."
std::string formatFtpStatus(int sc);
}

#endif //FTP_STATUS_H_3810293847561920
