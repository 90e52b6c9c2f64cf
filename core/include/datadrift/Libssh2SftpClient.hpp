// SftpClient implementation using libssh2 for SSH/SFTP.
// Encapsulates the SSH session, SFTP channel, and TCP socket.
#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace datadrift {

class Libssh2SftpFile;

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    Libssh2SftpClient(const Libssh2SftpClient&) = delete;
    Libssh2SftpClient& operator=(const Libssh2SftpClient&) = delete;

    bool connect(const SessionOptions& opt, Error& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              Error& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              Error& err) override;

    bool lstat(const std::string& remote_path,
               FileInfo& info,
               Error& err) override;

    std::unique_ptr<RemoteFile> openRead(const std::string& remote_path,
                                         Error& err) override;

    std::unique_ptr<RemoteFile> openWrite(const std::string& remote_path,
                                          bool truncate,
                                          Error& err,
                                          unsigned int mode = 0644) override;

    bool removeFile(const std::string& remote_path,
                    Error& err) override;

    bool removeDir(const std::string& remote_dir,
                   Error& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                Error& err,
                bool overwrite = false) override;

private:
    friend class Libssh2SftpFile;

    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr; // <- uses internal libssh2 types
    _LIBSSH2_SFTP*    sftp_    = nullptr; // <- same

    // TCP connection + SSH handshake, host key check and authentication.
    bool tcpConnect(const std::string& host, uint16_t port, Error& err);
    bool sshHandshake(const SessionOptions& opt, Error& err);
    bool verifyHostKey(const SessionOptions& opt, Error& err);
    bool authenticate(const SessionOptions& opt, Error& err);
    bool tryAgent(const std::string& username);

    bool requireConnected(Error& err) const;
    // stat or lstat depending on statType (LIBSSH2_SFTP_STAT / LIBSSH2_SFTP_LSTAT).
    bool statEx(const std::string& remote_path, int statType, FileInfo& info, Error& err);
    // Translate the last libssh2/SFTP status into err; drops connected_ on socket-level failures.
    void fail(Error& err, const std::string& what, const std::string& path);
};

} // namespace datadrift
