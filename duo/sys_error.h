// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SYS_ERROR_H_8391047561029384
#define SYS_ERROR_H_8391047561029384

#include <cerrno>
#include <string>
#include "scope_guard.h"  //
#include "i18n.h"         //not used by this header, but the "rest of the world" needs it!
#include "string_tools.h" //


namespace duo
{
//evaluate errno and assemble specific error message
using ErrorCode = int;

ErrorCode getLastError();

std::string formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg);
std::string formatSystemError(const std::string& functionName, ErrorCode ec);


//A low-level exception class giving (non-translated) detail information only - same conceptional level like "errno"!
class SysError
{
public:
    explicit SysError(const std::string& msg) : msg_(msg) {}
    virtual ~SysError() {}

    const std::string& toString() const { return msg_; }

private:
    std::string msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public duo::SysError { X(const std::string& msg) : SysError(msg) {} };


//better leave it as a macro (see comment in file_error.h)
#define THROW_LAST_SYS_ERROR(functionName)                           \
    do { const duo::ErrorCode ecInternal = duo::getLastError(); throw duo::SysError(duo::formatSystemError(functionName, ecInternal)); } while (false)


/* Example: ASSERT_SYSERROR(expr);

    Equivalent to:
        if (!expr)
            throw duo::SysError("Assertion failed: \"expr\"");            */
#define ASSERT_SYSERROR(expr) ASSERT_SYSERROR_IMPL(expr, #expr) //throw SysError



//######################## implementation ########################
inline
ErrorCode getLastError()
{
    return errno; //don't use "::" prefix, errno is a macro!
}


std::string getSystemErrorDescription(ErrorCode ec); //return empty string on error


namespace impl
{
inline bool validateBool(bool  b) { return b; }
inline bool validateBool(void* b) { return b; }
bool validateBool(int) = delete; //catch unintended bool conversions
}
#define ASSERT_SYSERROR_IMPL(expr, exprStr) \
    { if (!duo::impl::validateBool(expr))        \
            throw duo::SysError("Assertion failed: \"" exprStr "\""); }
}

#endif //SYS_ERROR_H_8391047561029384
