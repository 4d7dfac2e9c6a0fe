// *****************************************************************************
// * This file is part of the FtpDuo project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpDuo Authors - All Rights Reserved                    *
// *****************************************************************************

#ifndef FTP_CLIENT_H_7730192846510293
#define FTP_CLIENT_H_7730192846510293

#include <functional>
#include <map>
#include "control_line.h"
#include "data_channel.h"
#include "listing_codec.h"
#include "../base/ftp_config.h"
#include "../base/session_log.h"


namespace fdo
{
//server replied with an unexpected status code
struct SysErrorFtpProtocol : public duo::SysError
{
    SysErrorFtpProtocol(const std::string& msg, int ftpStatus, const std::string& serverMsg) :
        SysError(msg), ftpStatusCode(ftpStatus), serverMessage(serverMsg) {}

    const int ftpStatusCode;
    const std::string serverMessage; //verbatim
};

//server reply cannot be interpreted
DEFINE_NEW_SYS_ERROR(SysErrorFtpFormat)

//-------------------------------------------------------------------------------------------

//reply parsing, exposed for testing:
int parseEpsvPort(std::string_view replyMsg); //throw SysErrorFtpFormat; "Entering Extended Passive Mode (|||65202|)"
int parsePasvPort(std::string_view replyMsg); //throw SysErrorFtpFormat; "Entering Passive Mode (192,168,150,90,254,179)"
std::map<std::string, std::string> parseFeatLines(std::string_view replyMsg); //feature name (upper case) => description
std::string parsePwdReply(std::string_view replyMsg); //throw SysErrorFtpFormat; "\"/some \"\"quoted\"\" dir\" is current directory."

//-------------------------------------------------------------------------------------------

class FtpClient;

//open data connection of a transfer command; the final "226" is read by close()
class FtpDataResponse
{
public:
    FtpDataResponse(std::unique_ptr<DataChannel>&& dataChannel, FtpClient& client) : dataChannel_(std::move(dataChannel)), client_(client) {}
    ~FtpDataResponse();

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead) { return dataChannel_->tryRead(buffer, bytesToRead); } //throw SysError
    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite) { return dataChannel_->tryWrite(buffer, bytesToWrite); } //throw SysError

    void shutdownSend() { dataChannel_->shutdownSend(); } //throw SysError

    //close data connection, then require transfer confirmation
    void close(); //throw SysError, SysErrorFtpProtocol

private:
    FtpDataResponse           (const FtpDataResponse&) = delete;
    FtpDataResponse& operator=(const FtpDataResponse&) = delete;

    const std::unique_ptr<DataChannel> dataChannel_;
    FtpClient& client_;
    bool closed_ = false;
};


//one FTP control connection (plain, passive mode only)
class FtpClient
{
public:
    FtpClient(const std::string& server, int port, int timeoutSec, SessionLog& log); //throw SysError, SysErrorFtpProtocol
    ~FtpClient();

    static std::unique_ptr<FtpClient> connectWithLogin(const std::string& server, int port, int timeoutSec, //throw SysError, SysErrorFtpProtocol
                                                       const std::string& username, const std::string& password, SessionLog& log);
    static std::unique_ptr<FtpClient> connectAnonymous(const std::string& server, int port, int timeoutSec, SessionLog& log); //throw SysError, SysErrorFtpProtocol

    //login + change into login.folderPath
    static std::unique_ptr<FtpClient> connect(const FtpLogin& login, SessionLog& log); //throw SysError, SysErrorFtpProtocol

    const std::string& getHost() const { return resolvedHost_; } //numeric address of the server
    const std::map<std::string, std::string>& getFeatures() const { return features_; }
    bool hasFeature(const std::string& name) const { return features_.contains(name); }

    void login(const std::string& username, const std::string& password); //throw SysError, SysErrorFtpProtocol
    void logout(); //throw SysError, SysErrorFtpProtocol
    void quit(); //noexcept; connection is closed afterwards

    //no expectedCode: caller evaluates FtpReply::code
    FtpReply runCommand(const std::string& cmd, std::optional<int> expectedCode); //throw SysError, SysErrorFtpProtocol

    std::unique_ptr<FtpDataResponse> openDataCommand(const std::string& cmd, uint64_t offset); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat

    std::vector<std::string> nameList(const std::string& path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
    std::vector<FtpEntry>    list    (const std::string& path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat

    std::unique_ptr<FtpDataResponse> retrieve(const std::string& filePath, uint64_t offset = 0); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
    std::string retrieveToString(const std::string& filePath); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat

    using TryReadFun = std::function<size_t(void* buffer, size_t bytesToRead)>; //throw X; may return short, only 0 means EOF!
    void store(const std::string& filePath, const TryReadFun& tryRead /*throw X*/, uint64_t offset = 0); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat, X
    void storeFromString(const std::string& filePath, std::string_view bytes); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat

    void changeDir(const std::string& path); //throw SysError, SysErrorFtpProtocol
    void changeDirToParent();                //throw SysError, SysErrorFtpProtocol
    std::string currentDir();                //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
    void rename(const std::string& pathFrom, const std::string& pathTo); //throw SysError, SysErrorFtpProtocol
    void makeDir   (const std::string& path); //throw SysError, SysErrorFtpProtocol
    void removeDir (const std::string& path); //throw SysError, SysErrorFtpProtocol
    void deleteFile(const std::string& path); //throw SysError, SysErrorFtpProtocol
    uint64_t fileSize(const std::string& path); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
    std::string system(); //throw SysError, SysErrorFtpProtocol
    void noop(); //throw SysError, SysErrorFtpProtocol

private:
    FtpClient           (const FtpClient&) = delete;
    FtpClient& operator=(const FtpClient&) = delete;

    friend class FtpDataResponse;

    duo::SocketType getControlSocket() const; //throw SysError

    FtpReply readReply(std::optional<int> expectedCode, const std::string& cmd); //throw SysError, SysErrorFtpProtocol

    int negotiatePassivePort(); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat
    std::string readAllLines(const std::string& cmd); //throw SysError, SysErrorFtpProtocol, SysErrorFtpFormat

    const int timeoutSec_;
    SessionLog& log_;

    std::unique_ptr<duo::Socket> controlSocket_;
    std::unique_ptr<LineReader> lineReader_;
    std::string resolvedHost_;
    std::map<std::string, std::string> features_; //filled once during connect
};
}

#endif //FTP_CLIENT_H_7730192846510293
