// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "thread.h"
#include <sys/prctl.h>

using namespace duo;


void duo::setCurrentThreadName(const std::string& threadName)
{
    //"The name can be up to 16 bytes long, including the terminating null byte."
    const std::string shortName = threadName.substr(0, 15);
    [[maybe_unused]] const int rv = ::prctl(PR_SET_NAME, shortName.c_str(), 0, 0, 0);
    assert(rv == 0);
}
