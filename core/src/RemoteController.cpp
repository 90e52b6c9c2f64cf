#include "datadrift/RemoteController.hpp"
#include "datadrift/Log.hpp"
#include "datadrift/RemotePath.hpp"

namespace datadrift {

RemoteController::RemoteController(SessionManager::ClientFactory factory, TransferOptions opt)
    : sessions_(new SessionManager(std::move(factory))),
      cache_(new DirectoryCache(*sessions_)),
      transfers_(new TransferCoordinator(*sessions_, opt)) {
    DirectoryCache* cache = cache_.get();
    transfers_->setInvalidateCallback([cache](const std::string& dir) { cache->invalidatePath(dir); });
}

RemoteController::~RemoteController() {
    // Jobs and listings must settle while the coordinator and cache still exist.
    sessions_->disconnect();
    transfers_.reset();
    cache_.reset();
}

bool RemoteController::connect(const SessionOptions& opt, SessionInfo& out, Error& err) {
    if (!sessions_->connect(opt, out, err)) return false;
    DirectoryListing listing;
    Error navErr;
    if (!cache_->navigate(out.start_path, listing, navErr)) {
        // The session is usable; the caller can still navigate elsewhere.
        LOGW("initial listing of %s failed: %s", out.start_path.c_str(), navErr.describe().c_str());
    }
    return true;
}

void RemoteController::disconnect() {
    sessions_->disconnect();
}

std::optional<SessionInfo> RemoteController::session() const {
    return sessions_->currentSession();
}

bool RemoteController::requireConnected(Error& err) const {
    return sessions_->transport(err) != nullptr;
}

std::string RemoteController::resolve(const std::string& path) const {
    return remotepath::resolve(cache_->currentPath(), path);
}

bool RemoteController::navigate(const std::string& path, DirectoryListing& out, Error& err) {
    return cache_->navigate(path, out, err);
}

bool RemoteController::goUp(DirectoryListing& out, Error& err) {
    return cache_->goUp(out, err);
}

bool RemoteController::refresh(DirectoryListing& out, Error& err) {
    return cache_->refresh(out, err);
}

bool RemoteController::currentListing(DirectoryListing& out, Error& err) const {
    if (!requireConnected(err)) return false;
    return cache_->currentListing(out, err);
}

std::string RemoteController::currentPath() const {
    return cache_->currentPath();
}

JobPtr RemoteController::upload(const std::string& localFile, const std::string& remoteDir, Error& err) {
    return transfers_->upload(localFile, resolve(remoteDir), err);
}

JobPtr RemoteController::download(const std::string& remoteFile, const std::string& localDir, Error& err) {
    return transfers_->download(resolve(remoteFile), localDir, err);
}

JobPtr RemoteController::open(const std::string& remoteFile, Error& err) {
    return transfers_->openForEdit(resolve(remoteFile), err);
}

JobPtr RemoteController::save(const std::string& remoteFile, const std::string& content, Error& err) {
    return transfers_->saveEdit(resolve(remoteFile), content, err);
}

JobPtr RemoteController::remove(const std::string& remotePath, Error& err) {
    return transfers_->remove(resolve(remotePath), err);
}

} // namespace datadrift
