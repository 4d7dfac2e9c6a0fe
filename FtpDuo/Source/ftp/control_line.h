// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#ifndef CONTROL_LINE_H_1203948576102934
#define CONTROL_LINE_H_1203948576102934

#include <optional>
#include <duo/socket.h>


namespace fdo
{
//line reader over a control connection: CR LF, or a bare LF
class LineReader
{
public:
    explicit LineReader(duo::SocketType socket) : socket_(socket) {}

    //- line without trailing CR LF (or LF)
    //- no value: connection closed by peer (an incomplete last line is dropped)
    std::optional<std::string> readLine(); //throw SysError

private:
    LineReader           (const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    const duo::SocketType socket_;
    std::string buf_;
};


void sendLine(duo::SocketType socket, std::string_view line); //throw SysError; appends CR LF


struct FtpReply
{
    int code = 0;
    std::string message; //without status code; lines of a multi-line reply are separated by '\n'
};

/*  single-line:  "229 Entering Extended Passive Mode (|||65202|)"
    multi-line:   "211-Features:"
                  " UTF8"
                  "211 End"                                            */
FtpReply readReply(LineReader& reader); //throw SysError
}

#endif //CONTROL_LINE_H_1203948576102934
