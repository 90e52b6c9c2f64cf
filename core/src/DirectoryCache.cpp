#include "datadrift/DirectoryCache.hpp"
#include "datadrift/Log.hpp"
#include "datadrift/RemotePath.hpp"
#include <algorithm>

namespace datadrift {

EntryKind entryKindFromInfo(const FileInfo& fi) {
    switch (fi.mode & kModeTypeMask) {
        case kModeDir:     return EntryKind::Directory;
        case kModeRegular: return EntryKind::File;
        case kModeSymlink: return EntryKind::Symlink;
        case 0:            return fi.is_dir ? EntryKind::Directory : EntryKind::File;
        default:           return fi.is_dir ? EntryKind::Directory : EntryKind::Other;
    }
}

DirectoryCache::DirectoryCache(SessionManager& sessions) : sessions_(sessions) {
    hookToken_ = sessions_.addTeardownHook([this](std::uint64_t, TeardownReason reason, const Error&) {
        // Keep the last listings visible after a loss; a reconnect starts a new session anyway.
        if (reason == TeardownReason::Disconnect) clear();
    });
}

DirectoryCache::~DirectoryCache() {
    sessions_.removeTeardownHook(hookToken_);
}

void DirectoryCache::syncSessionLocked(std::uint64_t sessionId) {
    if (sessionId_ == sessionId) return;
    slots_.clear();
    invalidations_.clear();
    cwdVersion_ = 0;
    sessionId_ = sessionId;
    auto s = sessions_.currentSession();
    cwd_ = (s && s->id == sessionId) ? s->start_path : "/";
}

bool DirectoryCache::navigate(const std::string& path, DirectoryListing& out, Error& err) {
    auto t = sessions_.transport(err);
    if (!t) return false;

    std::string target;
    std::uint64_t version = 0;
    std::uint64_t seenInvalidations = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        syncSessionLocked(t->sessionId());
        target = remotepath::resolve(cwd_, path.empty() ? "." : path);
        version = nextVersion_++;
        auto inv = invalidations_.find(target);
        if (inv != invalidations_.end()) seenInvalidations = inv->second;
    }

    bool isDir = false;
    if (!t->isDirectory(target, isDir, err)) {
        err.withContext("navigate " + target);
        return false;
    }
    if (!isDir) {
        err.set(ErrorKind::NotADirectory, "navigate " + target + ": not a directory");
        return false;
    }

    std::vector<FileInfo> infos;
    if (!t->list(target, infos, err)) {
        err.withContext("navigate " + target);
        return false;
    }

    DirectoryListing listing;
    listing.path = target;
    listing.sessionId = t->sessionId();
    listing.version = version;
    listing.entries.reserve(infos.size());
    for (const auto& fi : infos) {
        if (fi.name.empty() || fi.name == "." || fi.name == "..") continue;
        RemoteEntry e;
        e.name = fi.name;
        e.kind = entryKindFromInfo(fi);
        e.size = fi.size;
        e.mode = fi.mode;
        e.mtime = fi.mtime;
        listing.entries.push_back(std::move(e));
    }
    std::sort(listing.entries.begin(), listing.entries.end(),
              [](const RemoteEntry& a, const RemoteEntry& b) {
                  const bool ad = a.kind == EntryKind::Directory;
                  const bool bd = b.kind == EntryKind::Directory;
                  if (ad != bd) return ad;
                  return a.name < b.name;
              });

    std::lock_guard<std::mutex> lk(mutex_);
    if (sessionId_ != listing.sessionId) {
        err.set(ErrorKind::Stale, "navigate " + target + ": session changed while listing");
        return false;
    }
    Slot& slot = slots_[target];
    if (slot.listing.version > version) {
        // A newer listing of this path landed first; keep it.
        LOGD("navigate %s: dropping listing v%llu, v%llu already installed", target.c_str(),
             (unsigned long long)version, (unsigned long long)slot.listing.version);
    } else {
        slot.listing = std::move(listing);
        auto inv = invalidations_.find(target);
        slot.stale = inv != invalidations_.end() && inv->second != seenInvalidations;
        if (slot.stale)
            LOGD("navigate %s: path invalidated while listing, v%llu installed stale", target.c_str(),
                 (unsigned long long)version);
    }
    if (version > cwdVersion_) {
        cwd_ = target;
        cwdVersion_ = version;
    }
    out = slot.listing;
    return true;
}

bool DirectoryCache::refresh(DirectoryListing& out, Error& err) {
    return navigate(currentPath(), out, err);
}

bool DirectoryCache::goUp(DirectoryListing& out, Error& err) {
    return navigate(remotepath::parent(currentPath()), out, err);
}

bool DirectoryCache::currentListing(DirectoryListing& out, Error& err) const {
    std::lock_guard<std::mutex> lk(mutex_);
    const std::string cwd = cwd_.empty() ? "/" : cwd_;
    auto it = slots_.find(cwd);
    if (it == slots_.end()) {
        err.set(ErrorKind::Stale, cwd + ": not listed yet");
        return false;
    }
    if (it->second.stale) {
        err.set(ErrorKind::Stale, cwd + ": listing invalidated, refresh required");
        return false;
    }
    out = it->second.listing;
    return true;
}

std::string DirectoryCache::currentPath() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return cwd_.empty() ? "/" : cwd_;
}

void DirectoryCache::invalidate() {
    std::lock_guard<std::mutex> lk(mutex_);
    invalidateLocked(cwd_.empty() ? "/" : cwd_);
}

void DirectoryCache::invalidatePath(const std::string& path) {
    const std::string p = remotepath::resolve("/", path);
    std::lock_guard<std::mutex> lk(mutex_);
    invalidateLocked(p);
}

void DirectoryCache::invalidateLocked(const std::string& path) {
    ++invalidations_[path];
    auto it = slots_.find(path);
    if (it != slots_.end()) it->second.stale = true;
}

void DirectoryCache::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    slots_.clear();
    invalidations_.clear();
    cwd_.clear();
    cwdVersion_ = 0;
    sessionId_ = 0;
}

} // namespace datadrift
