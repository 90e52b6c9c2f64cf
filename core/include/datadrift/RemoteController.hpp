// Caller-facing command interface wiring the session, the directory cache and the
// transfer coordinator. The UI and the tests drive the core only through this class.
#pragma once
#include "DirectoryCache.hpp"
#include "SessionManager.hpp"
#include "TransferCoordinator.hpp"
#include <memory>
#include <optional>

namespace datadrift {

class RemoteController {
public:
    RemoteController(SessionManager::ClientFactory factory, TransferOptions opt = TransferOptions());
    ~RemoteController();

    RemoteController(const RemoteController&) = delete;
    RemoteController& operator=(const RemoteController&) = delete;

    // Connects and lists the starting directory.
    bool connect(const SessionOptions& opt, SessionInfo& out, Error& err);
    void disconnect();
    std::optional<SessionInfo> session() const;

    bool navigate(const std::string& path, DirectoryListing& out, Error& err);
    bool goUp(DirectoryListing& out, Error& err);
    bool refresh(DirectoryListing& out, Error& err);
    bool currentListing(DirectoryListing& out, Error& err) const;
    std::string currentPath() const;

    // Relative remote paths resolve against the current directory.
    JobPtr upload(const std::string& localFile, const std::string& remoteDir, Error& err);
    JobPtr download(const std::string& remoteFile, const std::string& localDir, Error& err);
    JobPtr open(const std::string& remoteFile, Error& err);
    JobPtr save(const std::string& remoteFile, const std::string& content, Error& err);
    JobPtr remove(const std::string& remotePath, Error& err);

    SessionManager& sessions() { return *sessions_; }
    DirectoryCache& cache() { return *cache_; }
    TransferCoordinator& transfers() { return *transfers_; }

private:
    bool requireConnected(Error& err) const;
    std::string resolve(const std::string& path) const;

    // Declaration order is destruction order in reverse: the session outlives its users.
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<DirectoryCache> cache_;
    std::unique_ptr<TransferCoordinator> transfers_;
};

} // namespace datadrift
