// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "socket.h"
#include <chrono>
#include <iterator>
#include <optional>
#include <stdexcept>
    #include <fcntl.h>
    #include <poll.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h> //TCP_NODELAY
    #include <sys/select.h>

using namespace duo;


std::string duo::formatGaiErrorCode(int ec)
{
    switch (ec)
    {
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_ADDRFAMILY);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_AGAIN);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_BADFLAGS);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_FAIL);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_FAMILY);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_MEMORY);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_NODATA);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_NONAME);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_SERVICE);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_SOCKTYPE);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_SYSTEM);
            DUO_CHECK_CASE_FOR_CONSTANT(EAI_OVERFLOW);
        default:
            return replaceCpy(_("Error code %x"), "%x", numberTo<int>(ec));
    }
}


void duo::setNonBlocking(SocketType socket, bool nonBlocking) //throw SysError
{
    int flags = ::fcntl(socket, F_GETFL);
    if (flags == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_GETFL)");

    if (nonBlocking)
        flags |= O_NONBLOCK;
    else
        flags &= ~O_NONBLOCK;

    if (::fcntl(socket, F_SETFL, flags) != 0)
        THROW_LAST_SYS_ERROR(nonBlocking ? "fcntl(F_SETFL, O_NONBLOCK)" : "fcntl(F_SETFL, ~O_NONBLOCK)");
}


Socket::Socket(const std::string& server, const std::string& serviceName, int timeoutSec) //throw SysError
{
    if (trimCpy(server).empty())
        throw SysError(_("Server name must not be empty."));

    //no AI_ADDRCONFIG: loopback-only hosts would fail to resolve "127.0.0.1"
    const addrinfo hints
    {
        .ai_socktype = SOCK_STREAM,
    };

    addrinfo* servinfo = nullptr;
    DUO_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

    const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &servinfo);
    if (rcGai != 0)
        THROW_LAST_SYS_ERROR_GAI(rcGai);
    if (!servinfo)
        throw SysError(formatSystemError("getaddrinfo", "", "Empty server info."));

    const auto getConnectedSocket = [timeoutSec](const addrinfo& ai)
    {
        SocketType testSocket = ::socket(ai.ai_family,    //int socket_family
                                         SOCK_CLOEXEC | SOCK_NONBLOCK |
                                         ai.ai_socktype,  //int socket_type
                                         ai.ai_protocol); //int protocol
        if (testSocket == invalidSocket)
            THROW_LAST_SYS_ERROR("socket");
        DUO_ON_SCOPE_FAIL(closeSocket(testSocket));

        if (::connect(testSocket, ai.ai_addr, ai.ai_addrlen) != 0)
        {
            if (errno != EINPROGRESS)
                THROW_LAST_SYS_ERROR("connect");

            fd_set writefds{};
            fd_set exceptfds{};
            FD_SET(testSocket, &writefds);
            FD_SET(testSocket, &exceptfds);

            timeval tv{.tv_sec = timeoutSec};

            const int rv = ::select(testSocket + 1, //int nfds = "highest-numbered file descriptor in any of the three sets, plus 1"
                                    nullptr,        //fd_set* readfds
                                    &writefds,      //fd_set* writefds
                                    &exceptfds,     //fd_set* exceptfds
                                    &tv);           //timeval* timeout
            if (rv < 0)
                THROW_LAST_SYS_ERROR("select");

            if (rv == 0) //time-out!
                throw SysError(formatSystemError("select, " + replaceCpy(_("%x sec"), "%x", numberTo<int>(timeoutSec)), ETIMEDOUT));

            int error = 0;
            socklen_t optLen = sizeof(error);
            if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
                THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

            if (error != 0)
                throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error)));
        }

        setNonBlocking(testSocket, false); //throw SysError

        int noDelay = 1; //disable Nagle algorithm: control replies are tiny and latency-bound
        if (::setsockopt(testSocket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
            THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

        return testSocket;
    };

    //getaddrinfo() may return more than one address (e.g. AF_INET6 + AF_INET): use the first that connects
    std::optional<SysError> firstError;
    for (const addrinfo* si = servinfo; si; si = si->ai_next)
        try
        {
            socket_ = getConnectedSocket(*si); //throw SysError; pass ownership
            return;
        }
        catch (const SysError& e) { if (!firstError) firstError = e; }

    throw* firstError; //list was not empty, so there must have been an error!
}


ListenSocket::ListenSocket(const std::string& host, const std::string& serviceName) //throw SysError
{
    const addrinfo hints
    {
        .ai_flags    = AI_PASSIVE, //the returned socket addresses will be suitable for bind(2)ing a socket that will accept(2) connections.
        .ai_family   = AF_INET,    //passive mode replies (227) can only advertise IPv4
        .ai_socktype = SOCK_STREAM,
    };
    addrinfo* servinfo = nullptr;
    DUO_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

    const int rcGai = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), serviceName.c_str(), &hints, &servinfo);
    if (rcGai != 0)
        THROW_LAST_SYS_ERROR_GAI(rcGai);
    if (!servinfo)
        throw SysError(formatSystemError("getaddrinfo", "", "Empty server info."));

    const auto getBoundSocket = [](const addrinfo& ai)
    {
        SocketType testSocket = ::socket(ai.ai_family,    //int socket_family
                                         SOCK_CLOEXEC |
                                         ai.ai_socktype,  //int socket_type
                                         ai.ai_protocol); //int protocol
        if (testSocket == invalidSocket)
            THROW_LAST_SYS_ERROR("socket");
        DUO_ON_SCOPE_FAIL(closeSocket(testSocket));

        int reuseAddr = 1; //fixed server ports must be reusable right after a restart (TIME_WAIT)
        if (::setsockopt(testSocket, SOL_SOCKET, SO_REUSEADDR, &reuseAddr, sizeof(reuseAddr)) != 0)
            THROW_LAST_SYS_ERROR("setsockopt(SO_REUSEADDR)");

        if (::bind(testSocket, ai.ai_addr, ai.ai_addrlen) != 0)
            THROW_LAST_SYS_ERROR("bind");

        return testSocket;
    };

    std::optional<SysError> firstError;
    for (const addrinfo* si = servinfo; si; si = si->ai_next)
        try
        {
            socket_ = getBoundSocket(*si); //throw SysError; pass ownership
            break;
        }
        catch (const SysError& e) { if (!firstError) firstError = e; }

    if (socket_ == invalidSocket)
        throw* firstError; //list was not empty, so there must have been an error!

    DUO_ON_SCOPE_FAIL(closeSocket(socket_)); //destructor is not run if constructor fails

    sockaddr_storage addr = {}; //"sufficiently large to store address information for IPv4 (AF_INET) or IPv6 (AF_INET6)"
    socklen_t addrLen = sizeof(addr);
    if (::getsockname(socket_, reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0)
        THROW_LAST_SYS_ERROR("getsockname");

    if (addr.ss_family != AF_INET)
        throw SysError(formatSystemError("getsockname", "", "Unexpected protocol family: " + numberTo<int>(addr.ss_family)));

    port_ = ntohs(reinterpret_cast<const sockaddr_in&>(addr).sin_port);
    address_ = getLocalAddress(socket_); //throw SysError

    if (::listen(socket_, SOMAXCONN) != 0)
        THROW_LAST_SYS_ERROR("listen");
}


std::unique_ptr<Socket> ListenSocket::accept(int timeoutSec, const std::function<void()>& onPoll /*throw X*/) //throw SysError, X
{
    const auto startTime = std::chrono::steady_clock::now();

    for (;;) //::accept() blocks forever if no client connects => wait for incoming traffic with a time-out via ::poll()
    {
        if (onPoll) onPoll(); //throw X

        const int waitTimeMs = 100;
        pollfd fds[] = {{socket_, POLLIN}};

        const int rv = ::poll(fds, std::size(fds), waitTimeMs); //int timeout
        if (rv < 0)
        {
            if (errno == EINTR)
                continue;
            THROW_LAST_SYS_ERROR("poll");
        }
        else if (rv != 0)
            break;
        //else: time-out!

        if (timeoutSec > 0 && std::chrono::steady_clock::now() - startTime >= std::chrono::seconds(timeoutSec))
            throw SysError(formatSystemError("accept, " + replaceCpy(_("%x sec"), "%x", numberTo<int>(timeoutSec)), ETIMEDOUT));
    }

    //potential race! if the connection is gone right after ::poll() and before ::accept(), latter will hang
    const SocketType clientSocket = ::accept4(socket_,       //int sockfd
                                              nullptr,       //sockaddr* addr
                                              nullptr,       //socklen_t* addrlen
                                              SOCK_CLOEXEC); //int flags
    if (clientSocket == invalidSocket)
        THROW_LAST_SYS_ERROR("accept");

    return std::make_unique<Socket>(clientSocket); //pass ownership
}


size_t duo::tryReadSocket(SocketType socket, void* buffer, size_t bytesToRead) //throw SysError; may return short, only 0 means EOF!
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<int>(__LINE__) + "] Contract violation!");

    ssize_t bytesReceived = 0;
    for (;;)
    {
        bytesReceived = ::recv(socket, buffer, bytesToRead, 0 /*flags*/);
        if (bytesReceived >= 0 || errno != EINTR)
            break;
    }
    if (bytesReceived < 0)
        THROW_LAST_SYS_ERROR("recv");

    ASSERT_SYSERROR(static_cast<size_t>(bytesReceived) <= bytesToRead); //better safe than sorry

    return bytesReceived; //"zero indicates end of file"
}


size_t duo::tryWriteSocket(SocketType socket, const void* buffer, size_t bytesToWrite) //throw SysError; may return short! CONTRACT: bytesToWrite > 0
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<int>(__LINE__) + "] Contract violation!");

    ssize_t bytesWritten = 0;
    for (;;)
    {
        bytesWritten = ::send(socket, buffer, bytesToWrite, MSG_NOSIGNAL); //peer may have closed: no SIGPIPE, please
        if (bytesWritten >= 0 || errno != EINTR)
            break;
    }
    if (bytesWritten < 0)
        THROW_LAST_SYS_ERROR("send");

    if (bytesWritten == 0)
        throw SysError(formatSystemError("send", "", "Zero bytes processed."));

    ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry

    return bytesWritten;
}


void duo::shutdownSocketSend(SocketType socket) //throw SysError
{
    if (::shutdown(socket, SHUT_WR) != 0)
        THROW_LAST_SYS_ERROR("shutdown");
}


namespace
{
std::string getNumericHost(const sockaddr_storage& addr, socklen_t addrLen) //throw SysError
{
    char host[NI_MAXHOST] = {};
    const int rcGai = ::getnameinfo(reinterpret_cast<const sockaddr*>(&addr), addrLen,
                                    host, sizeof(host),
                                    nullptr, 0, //no service name
                                    NI_NUMERICHOST);
    if (rcGai != 0)
        throw SysError(formatSystemError("getnameinfo", formatGaiErrorCode(rcGai), ::gai_strerror(rcGai)));

    return host;
}
}


std::string duo::getPeerAddress(SocketType socket) //throw SysError
{
    sockaddr_storage addr = {};
    socklen_t addrLen = sizeof(addr);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0)
        THROW_LAST_SYS_ERROR("getpeername");

    return getNumericHost(addr, addrLen); //throw SysError
}


std::string duo::getLocalAddress(SocketType socket) //throw SysError
{
    sockaddr_storage addr = {};
    socklen_t addrLen = sizeof(addr);
    if (::getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0)
        THROW_LAST_SYS_ERROR("getsockname");

    return getNumericHost(addr, addrLen); //throw SysError
}
