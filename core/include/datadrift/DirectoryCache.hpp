// Path-indexed cache of remote directory listings plus the current remote directory.
#pragma once
#include "SessionManager.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace datadrift {

enum class EntryKind { File, Directory, Symlink, Other };

struct RemoteEntry {
    std::string   name;
    EntryKind     kind = EntryKind::File;
    std::uint64_t size = 0;
    std::uint32_t mode = 0;
    std::uint64_t mtime = 0;
};

// Directories first, then by name. Never contains "." or "..".
struct DirectoryListing {
    std::string   path;
    std::uint64_t sessionId = 0;
    std::uint64_t version = 0;
    std::vector<RemoteEntry> entries;
};

EntryKind entryKindFromInfo(const FileInfo& fi);

class DirectoryCache {
public:
    // Registers a teardown hook that clears the cache when the session goes away.
    explicit DirectoryCache(SessionManager& sessions);
    ~DirectoryCache();

    DirectoryCache(const DirectoryCache&) = delete;
    DirectoryCache& operator=(const DirectoryCache&) = delete;

    // Resolves path against the current directory, stats and lists it.
    // On success the path becomes the current directory unless a navigation issued
    // later already moved it; on failure nothing changes. A listing that raced an
    // invalidation of its path is installed stale.
    bool navigate(const std::string& path, DirectoryListing& out, Error& err);
    bool refresh(DirectoryListing& out, Error& err);
    bool goUp(DirectoryListing& out, Error& err);

    // Never touches the transport. Stale when invalidated or nothing listed yet.
    bool currentListing(DirectoryListing& out, Error& err) const;
    std::string currentPath() const;

    void invalidate();
    void invalidatePath(const std::string& path);
    void clear();

private:
    struct Slot {
        DirectoryListing listing;
        bool stale = false;
    };

    // Resets the cache when the transport belongs to a different session. Caller holds mutex_.
    void syncSessionLocked(std::uint64_t sessionId);
    void invalidateLocked(const std::string& path);

    SessionManager& sessions_;
    int hookToken_ = 0;

    mutable std::mutex mutex_;
    std::map<std::string, Slot> slots_;
    // Bumped by every invalidation of a path, listed or not.
    std::map<std::string, std::uint64_t> invalidations_;
    std::string cwd_;
    std::uint64_t cwdVersion_ = 0; // version of the navigation that set cwd_
    std::uint64_t sessionId_ = 0;
    std::uint64_t nextVersion_ = 1;
};

} // namespace datadrift
