// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef I18_N_H_2093857102934857
#define I18_N_H_2093857102934857

#include <string>


//minimal layer marking user-visible text for translation - without platform/library dependencies!
//source texts use %x (and %y) as placeholders to be filled via replaceCpy()

#define _(s) duo::translate(s)

namespace duo
{
inline
std::string translate(const char* text) { return text; } //FtpDuo ships English only
}

#endif //I18_N_H_2093857102934857
