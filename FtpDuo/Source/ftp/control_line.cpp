// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include "control_line.h"

using namespace duo;
using namespace fdo;


namespace
{
const size_t MAX_LINE_LENGTH = 64 * 1024; //bogus line length
const size_t BLOCK_SIZE_LINE = 4 * 1024;


//"DDD " or "DDD-"; a bare "DDD" counts as final line
std::optional<int> parseReplyCode(std::string_view line, char separator)
{
    if (line.size() < 3 || !isDigit(line[0]) || !isDigit(line[1]) || !isDigit(line[2]))
        return std::nullopt;

    if (line.size() == 3 ? separator != ' ' : line[3] != separator)
        return std::nullopt;

    return stringTo<int>(line.substr(0, 3));
}
}


std::optional<std::string> LineReader::readLine() //throw SysError
{
    for (;;)
    {
        //CR LF; tolerate a bare LF as sent by some clients
        if (const size_t pos = buf_.find('\n');
            pos != std::string::npos)
        {
            std::string line = buf_.substr(0, pos != 0 && buf_[pos - 1] == '\r' ? pos - 1 : pos);
            buf_.erase(0, pos + 1);
            return line;
        }

        if (buf_.size() >= MAX_LINE_LENGTH)
            throw SysError(formatSystemError("readLine", "", "Line length exceeds " + numberTo(MAX_LINE_LENGTH) + " bytes."));

        buf_.resize(buf_.size() + BLOCK_SIZE_LINE);
        const size_t bytesReceived = tryReadSocket(socket_, buf_.data() + buf_.size() - BLOCK_SIZE_LINE, BLOCK_SIZE_LINE); //throw SysError
        buf_.resize(buf_.size() - BLOCK_SIZE_LINE + bytesReceived); //caveat: unsigned arithmetics

        if (bytesReceived == 0) //EOF
            return std::nullopt;
    }
}


void fdo::sendLine(SocketType socket, std::string_view line) //throw SysError
{
    const std::string buf = std::string(line) + "\r\n";

    size_t bytesWritten = 0;
    while (bytesWritten < buf.size())
        bytesWritten += tryWriteSocket(socket, buf.data() + bytesWritten, buf.size() - bytesWritten); //throw SysError
}


FtpReply fdo::readReply(LineReader& reader) //throw SysError
{
    auto readNextLine = [&]
    {
        std::optional<std::string> line = reader.readLine(); //throw SysError
        if (!line)
            throw SysError(_("Connection closed by server."));
        return std::move(*line);
    };

    const std::string firstLine = readNextLine(); //throw SysError

    if (const std::optional<int> code = parseReplyCode(firstLine, ' '))
        return {*code, firstLine.size() > 4 ? firstLine.substr(4) : std::string()};

    const std::optional<int> code = parseReplyCode(firstLine, '-');
    if (!code)
        throw SysError(_("Unexpected FTP response.") + " (" + firstLine + ')');

    FtpReply reply{*code, firstLine.substr(4)};
    for (;;)
    {
        const std::string line = readNextLine(); //throw SysError

        if (parseReplyCode(line, ' ') == code) //end of multi-line reply
        {
            reply.message += '\n' + (line.size() > 4 ? line.substr(4) : std::string());
            return reply;
        }
        reply.message += '\n' + line; //intermediate lines verbatim
    }
}
