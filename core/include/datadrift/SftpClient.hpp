// Abstract interface for SFTP operations. Concrete implementations (e.g., libssh2)
// must follow this API to keep the coordinator decoupled from the backend.
// Implementations are not thread-safe; TransportHandle serializes access.
#pragma once
#include "Error.hpp"
#include "SftpTypes.hpp"
#include <cstdint>
#include <memory>

namespace datadrift {

// An open remote file. Owned by the client connection that opened it and
// only valid while that connection is up.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Bytes read, 0 at EOF, -1 on error (err filled).
    virtual std::int64_t read(char* buf, std::size_t len, Error& err) = 0;

    // Bytes written (may be short), -1 on error (err filled).
    virtual std::int64_t write(const char* buf, std::size_t len, Error& err) = 0;

    virtual bool close(Error& err) = 0;
};

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, Error& err) = 0;
    virtual void disconnect() = 0;
    // False once the connection is closed or detected as lost.
    virtual bool isConnected() const = 0;

    // Remote directory listing ("." and ".." excluded)
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      Error& err) = 0;

    // Detailed metadata (stat, follows symlinks). A missing path fails with ErrorKind::NotFound.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      Error& err) = 0;

    // Like stat but describes a symlink itself instead of its target.
    virtual bool lstat(const std::string& remote_path,
                       FileInfo& info,
                       Error& err) = 0;

    // Open for streaming. Null on failure.
    virtual std::unique_ptr<RemoteFile> openRead(const std::string& remote_path,
                                                 Error& err) = 0;

    virtual std::unique_ptr<RemoteFile> openWrite(const std::string& remote_path,
                                                  bool truncate,
                                                  Error& err,
                                                  unsigned int mode = 0644) = 0;

    // Remote file/folder operations
    virtual bool removeFile(const std::string& remote_path,
                            Error& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           Error& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        Error& err,
                        bool overwrite = false) = 0;
};

} // namespace datadrift
