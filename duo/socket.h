// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SOCKET_H_4471092836501748
#define SOCKET_H_4471092836501748

#include <functional>
#include <memory>
#include "sys_error.h"
    #include <unistd.h> //close
    #include <sys/socket.h>
    #include <netdb.h> //getaddrinfo


namespace duo
{
#define THROW_LAST_SYS_ERROR_GAI(rcGai)                        \
    do {                                                       \
        if (rcGai == EAI_SYSTEM) /*"check errno for details"*/ \
            THROW_LAST_SYS_ERROR("getaddrinfo");               \
        \
        throw duo::SysError(duo::formatSystemError("getaddrinfo", duo::formatGaiErrorCode(rcGai), ::gai_strerror(rcGai))); \
    } while (false)

std::string formatGaiErrorCode(int ec);

//patch up socket portability:
using SocketType = int;
const SocketType invalidSocket = -1;
inline void closeSocket(SocketType s) { ::close(s); }

void setNonBlocking(SocketType socket, bool value); //throw SysError


//connected TCP stream socket
class Socket //throw SysError
{
public:
    Socket(const std::string& server, const std::string& serviceName, int timeoutSec); //throw SysError
    explicit Socket(SocketType connected) : socket_(connected) {} //take ownership

    ~Socket() { closeSocket(socket_); }

    SocketType get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    SocketType socket_ = invalidSocket;
};


//bound + listening IPv4 socket; serviceName == "0": pick the next best free port
class ListenSocket //throw SysError
{
public:
    ListenSocket(const std::string& host, const std::string& serviceName); //throw SysError
    ~ListenSocket() { closeSocket(socket_); }

    int getPort() const { return port_; }
    const std::string& getAddress() const { return address_; } //numeric IPv4 the socket is bound to, e.g. "127.0.0.1" or "0.0.0.0"

    /* wait for the next incoming connection:
        - onPoll() is called every 100 ms and may throw to cancel the wait
        - timeoutSec <= 0: wait forever                                      */
    std::unique_ptr<Socket> accept(int timeoutSec, const std::function<void()>& onPoll /*throw X*/); //throw SysError, X

private:
    ListenSocket           (const ListenSocket&) = delete;
    ListenSocket& operator=(const ListenSocket&) = delete;

    SocketType socket_ = invalidSocket;
    int port_ = 0;
    std::string address_;
};


size_t tryReadSocket (SocketType socket,       void* buffer, size_t bytesToRead);  //throw SysError; may return short, only 0 means EOF!
size_t tryWriteSocket(SocketType socket, const void* buffer, size_t bytesToWrite); //throw SysError; may return short! CONTRACT: bytesToWrite > 0

//initiate termination of connection by sending TCP FIN package
void shutdownSocketSend(SocketType socket); //throw SysError

//numeric host address of the remote side, e.g. "127.0.0.1"
std::string getPeerAddress(SocketType socket); //throw SysError
//numeric host address of the local side
std::string getLocalAddress(SocketType socket); //throw SysError
}

#endif //SOCKET_H_4471092836501748
