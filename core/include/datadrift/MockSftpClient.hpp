// Simulated SFTP backend for tests and for running the UI without network.
// Every MockSftpClient connected to the same MockRemoteFs sees the same tree.
#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace datadrift {

class MockRemoteFs {
public:
    MockRemoteFs();

    // Tree seeded with a few folders and files (used by DATADRIFT_MOCK=1).
    static std::shared_ptr<MockRemoteFs> demo();

    // Tree manipulation (parents are created as needed).
    void addDir(const std::string& path, std::uint32_t perms = 0755);
    void addFile(const std::string& path, const std::string& content, std::uint32_t perms = 0644);
    // Symlink to target (absolute, or relative to the link's directory); target may be missing.
    void addSymlink(const std::string& path, const std::string& target);
    bool readFile(const std::string& path, std::string& out) const;
    bool exists(const std::string& path) const;
    bool isDir(const std::string& path) const;
    std::vector<std::string> names(const std::string& dir) const;

    // Accounts. With no accounts every username/password is accepted.
    void addUser(const std::string& user, const std::string& password);
    // Whether the server host key is already present in known_hosts.
    void setHostKeyKnown(bool known) { hostKeyKnown_ = known; }
    bool hostKeyKnown() const { return hostKeyKnown_; }
    void setUnreachable(bool v) { unreachable_ = v; }

    // Fault injection
    void setConnectDelayMs(int ms) { connectDelayMs_ = ms; }
    void setChunkDelayMs(int ms) { chunkDelayMs_ = ms; }
    // Delay applied to every directory listing, after it counts as started.
    void setListDelayMs(int ms) { listDelayMs_ = ms; }
    int listCalls() const { return listCalls_.load(); }
    // Drop every connection once this many more bytes moved through file handles (0 = never).
    void dropConnectionAfterBytes(std::uint64_t n);
    // Fail writes (without dropping the connection) once this many more bytes were written (0 = never).
    void failWritesAfterBytes(std::uint64_t n);
    // Emulate SFTPv3 servers that refuse to rename over an existing file.
    void setRejectOverwriteRename(bool v) { rejectOverwriteRename_ = v; }
    // Simulate a network loss for every live connection.
    void dropAllConnections();

    int liveConnections() const { return live_.load(); }
    int maxLiveConnections() const { return maxLive_.load(); }
    int connectCount() const { return connects_.load(); }

private:
    friend class MockSftpClient;
    friend class MockRemoteFile;

    struct Node {
        bool          dir = false;
        std::string   data;
        std::uint32_t mode = 0;
        std::uint64_t mtime = 0;
        std::string   link;   // symlink target, empty for files and directories
    };

    bool lookupLocked(const std::string& path, Node*& out);
    // Follows symlinks; resolved receives the final path. False when missing or dangling.
    bool resolveLocked(const std::string& path, Node*& out, std::string& resolved);
    void addDirLocked(const std::string& path, std::uint32_t perms);
    bool hasChildrenLocked(const std::string& path) const;
    // Accounts bytes moved; false when the connection must drop.
    bool consumeTransferBudget(std::size_t n);

    mutable std::mutex m_;
    std::map<std::string, Node> nodes_;
    std::map<std::string, std::string> users_;

    std::atomic<bool> hostKeyKnown_{true};
    std::atomic<bool> unreachable_{false};
    std::atomic<int> connectDelayMs_{0};
    std::atomic<int> chunkDelayMs_{0};
    std::atomic<int> listDelayMs_{0};
    std::atomic<int> listCalls_{0};
    std::atomic<bool> rejectOverwriteRename_{false};
    std::uint64_t dropBudget_ = 0;      // guarded by m_
    std::uint64_t writeFailBudget_ = 0; // guarded by m_

    std::atomic<std::uint64_t> epoch_{0}; // bumped on every simulated network loss
    std::atomic<int> live_{0};
    std::atomic<int> maxLive_{0};
    std::atomic<int> connects_{0};
};

class MockSftpClient : public SftpClient {
public:
    explicit MockSftpClient(std::shared_ptr<MockRemoteFs> fs);
    ~MockSftpClient() override;

    bool connect(const SessionOptions& opt, Error& err) override;
    void disconnect() override;
    bool isConnected() const override;

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
    friend class MockRemoteFile;

    bool requireConnected(Error& err) const;

    std::shared_ptr<MockRemoteFs> fs_;
    bool connected_ = false;
    std::uint64_t epoch_ = 0;
    SessionOptions lastOpt_{};
};

} // namespace datadrift
