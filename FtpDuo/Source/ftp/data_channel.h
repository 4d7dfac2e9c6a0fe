// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#ifndef DATA_CHANNEL_H_5501928374650192
#define DATA_CHANNEL_H_5501928374650192

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <duo/socket.h>


namespace fdo
{
//one transfer over one connection: never reused
class DataChannel
{
public:
    virtual ~DataChannel() {}

    virtual const std::string& getHost() const = 0;
    virtual int getPort() const = 0;

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw SysError
    //may return short! CONTRACT: bytesToWrite > 0
    virtual size_t tryWrite(const void* buffer, size_t bytesToWrite) = 0; //throw SysError

    virtual void shutdownSend() = 0; //throw SysError

    virtual void close() = 0; //noexcept; may be called more than once

    static constexpr size_t blockSize = 64 * 1024;
};


//client side: connect to the port the server announced via EPSV/PASV
class OutboundDataChannel : public DataChannel
{
public:
    OutboundDataChannel(const std::string& host, int port, int timeoutSec); //throw SysError

    const std::string& getHost() const override { return host_; }
    int getPort() const override { return port_; }

    size_t tryRead(void* buffer, size_t bytesToRead) override;        //throw SysError
    size_t tryWrite(const void* buffer, size_t bytesToWrite) override; //throw SysError
    void shutdownSend() override; //throw SysError
    void close() override { socket_.reset(); }

private:
    duo::SocketType getSocket() const; //throw SysError

    const std::string host_;
    const int port_;
    std::unique_ptr<duo::Socket> socket_;
};


//server side: listen on an ephemeral port and accept exactly one connection in the background
class PassiveDataChannel : public DataChannel
{
public:
    PassiveDataChannel(const std::string& host, int acceptTimeoutSec); //throw SysError
    ~PassiveDataChannel() { close(); }

    const std::string& getHost() const override { return host_; } //numeric IPv4 of the listener
    int getPort() const override { return port_; }

    size_t tryRead(void* buffer, size_t bytesToRead) override;        //throw SysError
    size_t tryWrite(const void* buffer, size_t bytesToWrite) override; //throw SysError
    void shutdownSend() override; //throw SysError
    void close() override;

private:
    duo::SocketType waitForConnection(); //throw SysError

    std::string host_;
    int port_ = 0;

    const std::shared_ptr<std::atomic<bool>> acceptCanceled_ = std::make_shared<std::atomic<bool>>(false);
    std::future<std::unique_ptr<duo::Socket>> acceptResult_; //the one and only ready gate

    //outcome of the accept, evaluated once:
    std::unique_ptr<duo::Socket> socket_;
    std::optional<duo::SysError> acceptError_;
    bool closed_ = false;
};
}

#endif //DATA_CHANNEL_H_5501928374650192
