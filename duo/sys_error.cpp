// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"
    #include <glib.h>

using namespace duo;


namespace
{
std::string formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes seen with sockets and local file access on Linux
    {
            DUO_CHECK_CASE_FOR_CONSTANT(EPERM);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOENT);
            DUO_CHECK_CASE_FOR_CONSTANT(EINTR);
            DUO_CHECK_CASE_FOR_CONSTANT(EIO);
            DUO_CHECK_CASE_FOR_CONSTANT(EBADF);
            DUO_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            DUO_CHECK_CASE_FOR_CONSTANT(EACCES);
            DUO_CHECK_CASE_FOR_CONSTANT(EFAULT);
            DUO_CHECK_CASE_FOR_CONSTANT(EBUSY);
            DUO_CHECK_CASE_FOR_CONSTANT(EEXIST);
            DUO_CHECK_CASE_FOR_CONSTANT(EXDEV);
            DUO_CHECK_CASE_FOR_CONSTANT(ENODEV);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            DUO_CHECK_CASE_FOR_CONSTANT(EISDIR);
            DUO_CHECK_CASE_FOR_CONSTANT(EINVAL);
            DUO_CHECK_CASE_FOR_CONSTANT(ENFILE);
            DUO_CHECK_CASE_FOR_CONSTANT(EMFILE);
            DUO_CHECK_CASE_FOR_CONSTANT(ETXTBSY);
            DUO_CHECK_CASE_FOR_CONSTANT(EFBIG);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            DUO_CHECK_CASE_FOR_CONSTANT(ESPIPE);
            DUO_CHECK_CASE_FOR_CONSTANT(EROFS);
            DUO_CHECK_CASE_FOR_CONSTANT(EMLINK);
            DUO_CHECK_CASE_FOR_CONSTANT(EPIPE);
            DUO_CHECK_CASE_FOR_CONSTANT(ERANGE);
            DUO_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            DUO_CHECK_CASE_FOR_CONSTANT(ELOOP);
            DUO_CHECK_CASE_FOR_CONSTANT(EOVERFLOW);
            DUO_CHECK_CASE_FOR_CONSTANT(EILSEQ);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            DUO_CHECK_CASE_FOR_CONSTANT(EDESTADDRREQ);
            DUO_CHECK_CASE_FOR_CONSTANT(EMSGSIZE);
            DUO_CHECK_CASE_FOR_CONSTANT(EPROTOTYPE);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOPROTOOPT);
            DUO_CHECK_CASE_FOR_CONSTANT(EPROTONOSUPPORT);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOTSUP);
            DUO_CHECK_CASE_FOR_CONSTANT(EAFNOSUPPORT);
            DUO_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            DUO_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            DUO_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            DUO_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            DUO_CHECK_CASE_FOR_CONSTANT(ENETRESET);
            DUO_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            DUO_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOBUFS);
            DUO_CHECK_CASE_FOR_CONSTANT(EISCONN);
            DUO_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            DUO_CHECK_CASE_FOR_CONSTANT(ESHUTDOWN);
            DUO_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            DUO_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            DUO_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
            DUO_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            DUO_CHECK_CASE_FOR_CONSTANT(EALREADY);
            DUO_CHECK_CASE_FOR_CONSTANT(EINPROGRESS);
            DUO_CHECK_CASE_FOR_CONSTANT(ESTALE);
            DUO_CHECK_CASE_FOR_CONSTANT(EDQUOT);
            DUO_CHECK_CASE_FOR_CONSTANT(ECANCELED);
        default:
            return replaceCpy(_("Error code %x"), "%x", numberTo(ec));
    }
}
}


std::string duo::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    DUO_ON_SCOPE_EXIT(errno = ecCurrent);

    //... vs strerror(): "marginally improves thread safety, and marginally improves consistency"
    std::string errorMsg = ::g_strerror(ec); //UTF-8 encoded

    trim(errorMsg);
    return errorMsg;
}


std::string duo::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::string duo::formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg)
{
    std::string output(trimCpy(errorCode));

    const std::string_view errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += ": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += " [" + functionName + ']';

    return std::string(trimCpy(output));
}
