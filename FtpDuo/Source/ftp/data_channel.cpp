// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#include "data_channel.h"
#include <duo/thread.h>

using namespace duo;
using namespace fdo;


OutboundDataChannel::OutboundDataChannel(const std::string& host, int port, int timeoutSec) : //throw SysError
    host_(host),
    port_(port),
    socket_(std::make_unique<Socket>(host, numberTo(port), timeoutSec)) {} //throw SysError


SocketType OutboundDataChannel::getSocket() const //throw SysError
{
    if (!socket_)
        throw SysError(_("Data connection is already closed."));
    return socket_->get();
}


size_t OutboundDataChannel::tryRead(void* buffer, size_t bytesToRead) //throw SysError
{
    return tryReadSocket(getSocket(), buffer, bytesToRead); //throw SysError
}


size_t OutboundDataChannel::tryWrite(const void* buffer, size_t bytesToWrite) //throw SysError
{
    return tryWriteSocket(getSocket(), buffer, bytesToWrite); //throw SysError
}


void OutboundDataChannel::shutdownSend() //throw SysError
{
    shutdownSocketSend(getSocket()); //throw SysError
}

//-----------------------------------------------------------------------------------------------

PassiveDataChannel::PassiveDataChannel(const std::string& host, int acceptTimeoutSec) //throw SysError
{
    auto listenSocket = std::make_shared<ListenSocket>(host, "0" /*any free port*/); //throw SysError
    host_ = listenSocket->getAddress(); //host name resolved
    port_ = listenSocket->getPort();

    //listener life time is bound to the accept: the port is released as soon as it completes
    acceptResult_ = runAsync([listenSocket, acceptTimeoutSec, canceled = acceptCanceled_]
    {
        setCurrentThreadName("Passive accept");

        return listenSocket->accept(acceptTimeoutSec, [&] //throw SysError
        {
            if (*canceled)
                throw SysError(_("Data connection was canceled."));
        });
    });
}


SocketType PassiveDataChannel::waitForConnection() //throw SysError
{
    if (closed_)
        throw SysError(_("Data connection is already closed."));

    if (!socket_ && !acceptError_)
        try
        {
            socket_ = acceptResult_.get(); //throw SysError; blocks until accept is done
        }
        catch (const SysError& e) { acceptError_ = e; }

    if (acceptError_)
        throw* acceptError_;

    return socket_->get();
}


size_t PassiveDataChannel::tryRead(void* buffer, size_t bytesToRead) //throw SysError
{
    return tryReadSocket(waitForConnection(), buffer, bytesToRead); //throw SysError
}


size_t PassiveDataChannel::tryWrite(const void* buffer, size_t bytesToWrite) //throw SysError
{
    return tryWriteSocket(waitForConnection(), buffer, bytesToWrite); //throw SysError
}


void PassiveDataChannel::shutdownSend() //throw SysError
{
    shutdownSocketSend(waitForConnection()); //throw SysError
}


void PassiveDataChannel::close()
{
    if (closed_)
        return;
    closed_ = true;

    *acceptCanceled_ = true;

    if (acceptResult_.valid()) //accept outcome not yet fetched
    {
        acceptResult_.wait(); //returns within one poll interval
        acceptResult_ = {};   //drop a connection accepted in the meantime
    }

    socket_.reset();
}
