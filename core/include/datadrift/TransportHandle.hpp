// One live, authenticated backend connection shared by the cache and the transfer workers.
// Each call holds the connection mutex for exactly one protocol operation, so a long
// transfer only blocks other callers for the duration of a chunk.
#pragma once
#include "SftpClient.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace datadrift {

class TransportHandle {
public:
    // Opaque reference to a remote file opened through this handle.
    using FileId = std::uint64_t;
    // Invoked once, outside the connection mutex, when the backend reports the link lost.
    using LostCallback = std::function<void(const Error& cause)>;

    // Takes ownership of an already connected client.
    TransportHandle(std::unique_ptr<SftpClient> client, std::uint64_t sessionId);
    ~TransportHandle();

    TransportHandle(const TransportHandle&) = delete;
    TransportHandle& operator=(const TransportHandle&) = delete;

    void setLostCallback(LostCallback cb);
    std::uint64_t sessionId() const { return sessionId_; }
    // False once closed or once the connection was lost.
    bool usable() const;

    bool list(const std::string& path, std::vector<FileInfo>& out, Error& err);
    bool stat(const std::string& path, FileInfo& info, Error& err);
    // NotFound for a missing path; isDir is only meaningful on success.
    bool isDirectory(const std::string& path, bool& isDir, Error& err);

    bool openRead(const std::string& path, FileId& id, Error& err);
    bool openWrite(const std::string& path, bool truncate, FileId& id, Error& err);
    // Same contract as RemoteFile::read/write: bytes moved, 0 at EOF, -1 on error.
    std::int64_t read(FileId id, char* buf, std::size_t len, Error& err);
    std::int64_t write(FileId id, const char* buf, std::size_t len, Error& err);
    bool closeFile(FileId id, Error& err);

    // Removes a file or an empty directory.
    bool remove(const std::string& path, Error& err);
    bool rename(const std::string& from, const std::string& to, bool overwrite, Error& err);

    // Closes open files and disconnects. Later calls fail without firing the lost callback.
    void close();

private:
    bool checkUsableLocked(Error& err) const;
    // After a failed call: true when this failure is the one that detected the loss.
    bool noteFailureLocked(Error& err);
    void notifyLost(const Error& cause);
    RemoteFile* fileLocked(FileId id, Error& err);

    const std::uint64_t sessionId_;
    mutable std::mutex mutex_;
    std::unique_ptr<SftpClient> client_;
    std::map<FileId, std::unique_ptr<RemoteFile>> files_;
    FileId nextFileId_ = 1;
    bool closed_ = false;
    bool broken_ = false;

    std::mutex cbMutex_;
    LostCallback onLost_;
};

} // namespace datadrift
