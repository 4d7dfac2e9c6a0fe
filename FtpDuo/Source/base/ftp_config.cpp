// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include "ftp_config.h"
#include <duo/base64.h>

using namespace duo;
using namespace fdo;


namespace
{
constexpr std::string_view ftpPrefix = "ftp:";

inline std::string fmtOpt(std::string_view opt) { return '"' + std::string(opt) + '"'; }


std::string encodeFtpUsername(std::string name)
{
    replace(name, "%", "%25"); //first!
    replace(name, "@", "%40");
    replace(name, ":", "%3A");
    return name;
}


std::string decodeFtpUsername(std::string name)
{
    replace(name, "%40", "@");
    replace(name, "%3A", ":");
    replace(name, "%3a", ":");
    replace(name, "%25", "%"); //last!
    return name;
}


int parsePositiveNumber(std::string_view optName, std::string_view value) //throw SysError
{
    unsigned int number = 0;
    if (!parseUnsigned(value, number) || number == 0 || number > 65535)
        throw SysError(replaceCpy(replaceCpy(_("Invalid value %y for option %x."), "%x", fmtOpt(optName)), "%y", fmtOpt(value)));
    return static_cast<int>(number);
}
}


FtpLogin fdo::parseFtpLoginPhrase(const std::string& loginPhrase) //throw SysError
{
    std::string_view pathPhrase = trimCpy(loginPhrase);

    if (!startsWithAsciiNoCase(pathPhrase, ftpPrefix))
        throw SysError(replaceCpy(_("%x is not an FTP path."), "%x", fmtOpt(pathPhrase)));

    pathPhrase.remove_prefix(ftpPrefix.size());
    while (startsWith(pathPhrase, "/") || startsWith(pathPhrase, "\\"))
        pathPhrase.remove_prefix(1);

    const std::string_view credentials = beforeFirst(pathPhrase, "@", IfNotFoundReturn::none);
    const std::string_view fullPathOpt =  afterFirst(pathPhrase, "@", IfNotFoundReturn::all);

    FtpLogin login;
    login.username = decodeFtpUsername(beforeFirst<std::string>(credentials, ":", IfNotFoundReturn::all)); //standard FTP syntax, even though
    login.password =                    afterFirst<std::string>(credentials, ":", IfNotFoundReturn::none); //concatenateFtpLoginPhrase() uses "pass64" instead

    const std::string_view fullPath = beforeFirst(fullPathOpt, "|", IfNotFoundReturn::all);
    const std::string_view options  =  afterFirst(fullPathOpt, "|", IfNotFoundReturn::none);

    const size_t posPath = fullPath.find_first_of("/\\");
    const std::string_view serverPort = fullPath.substr(0, posPath);
    if (posPath != std::string_view::npos)
        login.folderPath = replaceCpy(std::string(fullPath.substr(posPath)), "\\", "/");

    while (login.folderPath.size() > 1 && endsWith(login.folderPath, "/"))
        login.folderPath.pop_back();
    if (login.folderPath.empty())
        login.folderPath = "/";

    login.server = beforeLast<std::string>(serverPort, ":", IfNotFoundReturn::all);
    if (const std::string_view port = afterLast(serverPort, ":", IfNotFoundReturn::none);
        !port.empty())
        login.portCfg = parsePositiveNumber("port", port); //throw SysError

    if (trimCpy(login.server).empty())
        throw SysError(_("Server name must not be empty."));

    split(options, '|', [&](std::string_view optPhrase)
    {
        optPhrase = trimCpy(optPhrase);
        if (!optPhrase.empty())
        {
            if (startsWith(optPhrase, "timeout="))
                login.timeoutSec = parsePositiveNumber("timeout", afterFirst(optPhrase, "=", IfNotFoundReturn::none)); //throw SysError
            else if (startsWith(optPhrase, "pass64="))
                login.password = stringDecodeBase64(afterFirst(optPhrase, "=", IfNotFoundReturn::none));
            else
                throw SysError(replaceCpy(_("Unknown option %x."), "%x", fmtOpt(optPhrase)));
        }
    });
    return login;
}


std::string fdo::concatenateFtpLoginPhrase(const FtpLogin& login) //noexcept
{
    std::string username;
    if (!login.username.empty())
        username = encodeFtpUsername(login.username) + '@';

    std::string port;
    if (login.portCfg > 0)
        port = ':' + numberTo(login.portCfg);

    std::string relPath = login.folderPath;
    if (relPath == "/")
        relPath.clear();

    std::string options;
    if (login.timeoutSec != FtpLogin().timeoutSec)
        options += "|timeout=" + numberTo(login.timeoutSec);

    if (!login.password.empty()) //password always last => visually truncated by folder input field
        options += "|pass64=" + stringEncodeBase64(login.password);

    return std::string(ftpPrefix) + "//" + username + login.server + port + relPath + options;
}


ServerConfig fdo::parseServerConfig(const std::vector<std::string>& args) //throw SysError
{
    ServerConfig cfg;

    for (const std::string& arg : args)
    {
        const std::string_view optName = trimCpy(beforeFirst(arg, "=", IfNotFoundReturn::none));
        const std::string_view value   = trimCpy( afterFirst(arg, "=", IfNotFoundReturn::none));

        if (optName.empty() || value.empty())
            throw SysError(replaceCpy(_("Invalid command line argument %x."), "%x", fmtOpt(arg)));

        //*INDENT-OFF*
        if      (optName == "root"   ) cfg.rootFolder  = value;
        else if (optName == "host"   ) cfg.listenHost  = value;
        else if (optName == "passive") cfg.passiveHost = value;
        else if (optName == "port"   ) cfg.port        = value == "0" ? 0 : parsePositiveNumber(optName, value); //throw SysError
        else if (optName == "timeout") cfg.acceptTimeoutSec = parsePositiveNumber(optName, value);             //throw SysError
        else
            throw SysError(replaceCpy(_("Unknown option %x."), "%x", fmtOpt(optName)));
        //*INDENT-ON*
    }

    if (cfg.rootFolder.empty())
        throw SysError(replaceCpy(_("Missing command line argument %x."), "%x", fmtOpt("root")));

    while (cfg.rootFolder.size() > 1 && endsWith(cfg.rootFolder, "/"))
        cfg.rootFolder.pop_back();

    return cfg;
}
