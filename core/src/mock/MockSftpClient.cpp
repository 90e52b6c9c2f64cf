// Mock implementation: an in-memory tree shared by every client of one MockRemoteFs.
#include "datadrift/MockSftpClient.hpp"
#include "datadrift/Log.hpp"
#include "datadrift/RemotePath.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <thread>

namespace datadrift {

namespace {

// Status codes mirroring the SFTP/libssh2 values the real backend reports.
constexpr int kFxNoSuchFile = 2;
constexpr int kFxFailure = 4;
constexpr int kSocketRecv = -43;

std::string absPath(const std::string& p) {
    return remotepath::resolve("/", p);
}

std::uint64_t nowEpoch() {
    return (std::uint64_t)std::time(nullptr);
}

void chunkDelay(int ms) {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace

// ---------------------------------------------------------------------------
// MockRemoteFs

MockRemoteFs::MockRemoteFs() {
    Node root;
    root.dir = true;
    root.mode = kModeDir | 0755;
    root.mtime = nowEpoch();
    nodes_["/"] = root;
}

std::shared_ptr<MockRemoteFs> MockRemoteFs::demo() {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/home/demo/projects");
    fs->addDir("/var/log");
    fs->addFile("/readme.txt", "DataDrift demo server.\nNothing here leaves this process.\n");
    fs->addFile("/home/demo/notes.md", "# Notes\n\n- edit me and save\n");
    fs->addFile("/home/demo/projects/todo.txt", "ship it\n");
    fs->addFile("/var/log/messages", "boot ok\n");
    return fs;
}

void MockRemoteFs::addDirLocked(const std::string& path, std::uint32_t perms) {
    const std::string p = absPath(path);
    if (p == "/") return;
    addDirLocked(remotepath::parent(p), 0755);
    auto it = nodes_.find(p);
    if (it != nodes_.end() && it->second.dir) return;
    Node n;
    n.dir = true;
    n.mode = kModeDir | perms;
    n.mtime = nowEpoch();
    nodes_[p] = n;
}

void MockRemoteFs::addDir(const std::string& path, std::uint32_t perms) {
    std::lock_guard<std::mutex> lk(m_);
    addDirLocked(path, perms);
}

void MockRemoteFs::addFile(const std::string& path, const std::string& content, std::uint32_t perms) {
    std::lock_guard<std::mutex> lk(m_);
    const std::string p = absPath(path);
    addDirLocked(remotepath::parent(p), 0755);
    Node n;
    n.dir = false;
    n.data = content;
    n.mode = kModeRegular | perms;
    n.mtime = nowEpoch();
    nodes_[p] = n;
}

void MockRemoteFs::addSymlink(const std::string& path, const std::string& target) {
    std::lock_guard<std::mutex> lk(m_);
    const std::string p = absPath(path);
    addDirLocked(remotepath::parent(p), 0755);
    Node n;
    n.link = target;
    n.mode = kModeSymlink | 0777;
    n.mtime = nowEpoch();
    nodes_[p] = n;
}

bool MockRemoteFs::readFile(const std::string& path, std::string& out) const {
    std::lock_guard<std::mutex> lk(m_);
    auto it = nodes_.find(absPath(path));
    if (it == nodes_.end() || it->second.dir) return false;
    out = it->second.data;
    return true;
}

bool MockRemoteFs::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lk(m_);
    return nodes_.count(absPath(path)) > 0;
}

bool MockRemoteFs::isDir(const std::string& path) const {
    std::lock_guard<std::mutex> lk(m_);
    auto it = nodes_.find(absPath(path));
    return it != nodes_.end() && it->second.dir;
}

std::vector<std::string> MockRemoteFs::names(const std::string& dir) const {
    std::lock_guard<std::mutex> lk(m_);
    const std::string p = absPath(dir);
    const std::string prefix = (p == "/") ? p : p + "/";
    std::vector<std::string> out;
    for (auto it = nodes_.lower_bound(prefix); it != nodes_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        const std::string rest = it->first.substr(prefix.size());
        if (rest.empty() || rest.find('/') != std::string::npos) continue;
        out.push_back(rest);
    }
    return out;
}

void MockRemoteFs::addUser(const std::string& user, const std::string& password) {
    std::lock_guard<std::mutex> lk(m_);
    users_[user] = password;
}

void MockRemoteFs::dropConnectionAfterBytes(std::uint64_t n) {
    std::lock_guard<std::mutex> lk(m_);
    dropBudget_ = n;
}

void MockRemoteFs::failWritesAfterBytes(std::uint64_t n) {
    std::lock_guard<std::mutex> lk(m_);
    writeFailBudget_ = n;
}

void MockRemoteFs::dropAllConnections() {
    epoch_.fetch_add(1);
}

bool MockRemoteFs::lookupLocked(const std::string& path, Node*& out) {
    auto it = nodes_.find(absPath(path));
    if (it == nodes_.end()) return false;
    out = &it->second;
    return true;
}

bool MockRemoteFs::resolveLocked(const std::string& path, Node*& out, std::string& resolved) {
    std::string p = absPath(path);
    for (int hops = 0; hops < 8; ++hops) {
        Node* n = nullptr;
        if (!lookupLocked(p, n)) return false;
        if (n->link.empty()) {
            out = n;
            resolved = p;
            return true;
        }
        p = remotepath::resolve(remotepath::parent(p), n->link);
    }
    return false; // too many levels of links
}

bool MockRemoteFs::hasChildrenLocked(const std::string& path) const {
    const std::string prefix = (path == "/") ? path : path + "/";
    auto it = nodes_.lower_bound(prefix);
    if (it != nodes_.end() && it->first == prefix) ++it;
    return it != nodes_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

bool MockRemoteFs::consumeTransferBudget(std::size_t n) {
    if (dropBudget_ == 0) return true;
    if (n >= dropBudget_) {
        dropBudget_ = 0;
        epoch_.fetch_add(1);
        return false;
    }
    dropBudget_ -= n;
    return true;
}

// ---------------------------------------------------------------------------
// MockRemoteFile

class MockRemoteFile : public RemoteFile {
public:
    MockRemoteFile(MockSftpClient* owner, std::string path)
        : owner_(owner), path_(std::move(path)) {}

    std::int64_t read(char* buf, std::size_t len, Error& err) override {
        if (!owner_->requireConnected(err)) return -1;
        MockRemoteFs& fs = *owner_->fs_;
        chunkDelay(fs.chunkDelayMs_.load());
        std::lock_guard<std::mutex> lk(fs.m_);
        MockRemoteFs::Node* n = nullptr;
        if (!fs.lookupLocked(path_, n) || n->dir) {
            err.set(ErrorKind::Transport, path_ + ": file vanished while reading", kFxFailure);
            return -1;
        }
        if (offset_ >= n->data.size()) return 0;
        const std::size_t cnt = std::min(len, n->data.size() - (std::size_t)offset_);
        if (!fs.consumeTransferBudget(cnt)) {
            err.set(ErrorKind::Transport, "connection lost while reading " + path_, kSocketRecv);
            return -1;
        }
        std::copy(n->data.data() + offset_, n->data.data() + offset_ + cnt, buf);
        offset_ += cnt;
        return (std::int64_t)cnt;
    }

    std::int64_t write(const char* buf, std::size_t len, Error& err) override {
        if (!owner_->requireConnected(err)) return -1;
        MockRemoteFs& fs = *owner_->fs_;
        chunkDelay(fs.chunkDelayMs_.load());
        std::lock_guard<std::mutex> lk(fs.m_);
        MockRemoteFs::Node* n = nullptr;
        if (!fs.lookupLocked(path_, n) || n->dir) {
            err.set(ErrorKind::Transport, path_ + ": file vanished while writing", kFxFailure);
            return -1;
        }
        std::size_t cnt = len;
        bool failAfter = false;
        if (fs.writeFailBudget_ > 0) {
            if (cnt >= fs.writeFailBudget_) {
                cnt = (std::size_t)fs.writeFailBudget_;
                fs.writeFailBudget_ = 0;
                failAfter = true;
            } else {
                fs.writeFailBudget_ -= cnt;
            }
        }
        if (!fs.consumeTransferBudget(cnt)) {
            err.set(ErrorKind::Transport, "connection lost while writing " + path_, kSocketRecv);
            return -1;
        }
        if (n->data.size() < offset_ + cnt) n->data.resize((std::size_t)(offset_ + cnt));
        std::copy(buf, buf + cnt, &n->data[(std::size_t)offset_]);
        offset_ += cnt;
        n->mtime = nowEpoch();
        if (failAfter) {
            err.set(ErrorKind::Transport, "write failed for " + path_ + " (no space left)", kFxFailure);
            return -1;
        }
        return (std::int64_t)cnt;
    }

    bool close(Error& err) override {
        return owner_->requireConnected(err);
    }

private:
    MockSftpClient* owner_;
    std::string path_;
    std::uint64_t offset_ = 0;
};

// ---------------------------------------------------------------------------
// MockSftpClient

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemoteFs> fs) : fs_(std::move(fs)) {}

MockSftpClient::~MockSftpClient() {
    disconnect();
}

bool MockSftpClient::connect(const SessionOptions& opt, Error& err) {
    if (connected_) {
        err.set(ErrorKind::Busy, "already connected");
        return false;
    }
    fs_->connects_.fetch_add(1);
    chunkDelay(fs_->connectDelayMs_.load());

    if (opt.host.empty() || fs_->unreachable_.load()) {
        err.set(ErrorKind::Network, "could not connect to " + (opt.host.empty() ? std::string("<empty host>") : opt.host));
        return false;
    }
    if (!fs_->hostKeyKnown_.load()) {
        const std::string fp = "SHA256:MO:CK:00";
        switch (opt.known_hosts_policy) {
            case KnownHostsPolicy::Strict:
                err.set(ErrorKind::HostKey, "host " + opt.host + " not found in known_hosts (strict policy)");
                return false;
            case KnownHostsPolicy::AcceptNew:
                LOGW("unknown host key for %s (%s)", opt.host.c_str(), fp.c_str());
                if (!opt.hostkey_confirm_cb || !opt.hostkey_confirm_cb(opt.host, opt.port, "ED25519", fp)) {
                    err.set(ErrorKind::HostKey, "unknown host key not confirmed: " + fp);
                    return false;
                }
                fs_->hostKeyKnown_ = true;
                break;
            case KnownHostsPolicy::Off:
                LOGW("host key verification disabled for %s", opt.host.c_str());
                break;
        }
    }
    {
        std::lock_guard<std::mutex> lk(fs_->m_);
        if (opt.username.empty()) {
            err.set(ErrorKind::Auth, "username is required");
            return false;
        }
        if (!fs_->users_.empty()) {
            auto it = fs_->users_.find(opt.username);
            if (it == fs_->users_.end() || !opt.password || *opt.password != it->second) {
                err.set(ErrorKind::Auth, "authentication failed for " + opt.username);
                return false;
            }
        }
    }

    connected_ = true;
    epoch_ = fs_->epoch_.load();
    lastOpt_ = opt;
    const int live = fs_->live_.fetch_add(1) + 1;
    int prev = fs_->maxLive_.load();
    while (live > prev && !fs_->maxLive_.compare_exchange_weak(prev, live)) {}
    return true;
}

void MockSftpClient::disconnect() {
    if (!connected_) return;
    connected_ = false;
    fs_->live_.fetch_sub(1);
}

bool MockSftpClient::isConnected() const {
    return connected_ && epoch_ == fs_->epoch_.load();
}

bool MockSftpClient::requireConnected(Error& err) const {
    if (!connected_) {
        err.set(ErrorKind::Transport, "not connected");
        return false;
    }
    if (epoch_ != fs_->epoch_.load()) {
        err.set(ErrorKind::Transport, "connection lost", kSocketRecv);
        return false;
    }
    return true;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          Error& err) {
    if (!requireConnected(err)) return false;
    const std::string path = absPath(remote_path.empty() ? "/" : remote_path);
    fs_->listCalls_.fetch_add(1);
    chunkDelay(fs_->listDelayMs_.load());
    std::lock_guard<std::mutex> lk(fs_->m_);
    MockRemoteFs::Node* dir = nullptr;
    if (!fs_->lookupLocked(path, dir)) {
        err.set(ErrorKind::NotFound, path + ": no such file or directory", kFxNoSuchFile);
        return false;
    }
    if (!dir->dir) {
        err.set(ErrorKind::Transport, "sftp opendir failed for " + path + " (not a directory)", kFxFailure);
        return false;
    }
    out.clear();
    const std::string prefix = (path == "/") ? path : path + "/";
    for (auto it = fs_->nodes_.lower_bound(prefix); it != fs_->nodes_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        const std::string rest = it->first.substr(prefix.size());
        if (rest.empty() || rest.find('/') != std::string::npos) continue;
        FileInfo fi;
        fi.name = rest;
        fi.is_dir = it->second.dir;
        fi.size = it->second.dir ? 0 : (it->second.link.empty() ? it->second.data.size()
                                                                 : it->second.link.size());
        fi.mtime = it->second.mtime;
        fi.mode = it->second.mode;
        out.push_back(std::move(fi));
    }
    return true;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          Error& err) {
    if (!requireConnected(err)) return false;
    const std::string path = absPath(remote_path);
    std::lock_guard<std::mutex> lk(fs_->m_);
    MockRemoteFs::Node* n = nullptr;
    std::string resolved;
    if (!fs_->resolveLocked(path, n, resolved)) {
        err.set(ErrorKind::NotFound, path + ": no such file or directory", kFxNoSuchFile);
        return false;
    }
    info.name = remotepath::baseName(path);
    info.is_dir = n->dir;
    info.size = n->dir ? 0 : n->data.size();
    info.mtime = n->mtime;
    info.mode = n->mode;
    return true;
}

bool MockSftpClient::lstat(const std::string& remote_path,
                           FileInfo& info,
                           Error& err) {
    if (!requireConnected(err)) return false;
    const std::string path = absPath(remote_path);
    std::lock_guard<std::mutex> lk(fs_->m_);
    MockRemoteFs::Node* n = nullptr;
    if (!fs_->lookupLocked(path, n)) {
        err.set(ErrorKind::NotFound, path + ": no such file or directory", kFxNoSuchFile);
        return false;
    }
    info.name = remotepath::baseName(path);
    info.is_dir = n->dir;
    info.size = n->dir ? 0 : (n->link.empty() ? n->data.size() : n->link.size());
    info.mtime = n->mtime;
    info.mode = n->mode;
    return true;
}

std::unique_ptr<RemoteFile> MockSftpClient::openRead(const std::string& remote_path,
                                                     Error& err) {
    if (!requireConnected(err)) return nullptr;
    const std::string path = absPath(remote_path);
    std::lock_guard<std::mutex> lk(fs_->m_);
    MockRemoteFs::Node* n = nullptr;
    std::string resolved;
    if (!fs_->resolveLocked(path, n, resolved)) {
        err.set(ErrorKind::NotFound, path + ": no such file or directory", kFxNoSuchFile);
        return nullptr;
    }
    if (n->dir) {
        err.set(ErrorKind::Transport, "sftp open (read) failed for " + path + " (is a directory)", kFxFailure);
        return nullptr;
    }
    return std::make_unique<MockRemoteFile>(this, resolved);
}

std::unique_ptr<RemoteFile> MockSftpClient::openWrite(const std::string& remote_path,
                                                      bool truncate,
                                                      Error& err,
                                                      unsigned int mode) {
    if (!requireConnected(err)) return nullptr;
    const std::string path = absPath(remote_path);
    std::lock_guard<std::mutex> lk(fs_->m_);
    MockRemoteFs::Node* parentNode = nullptr;
    if (!fs_->lookupLocked(remotepath::parent(path), parentNode) || !parentNode->dir) {
        err.set(ErrorKind::NotFound, remotepath::parent(path) + ": no such directory", kFxNoSuchFile);
        return nullptr;
    }
    MockRemoteFs::Node* n = nullptr;
    if (fs_->lookupLocked(path, n)) {
        if (n->dir) {
            err.set(ErrorKind::Transport, "sftp open (write) failed for " + path + " (is a directory)", kFxFailure);
            return nullptr;
        }
        if (truncate) n->data.clear();
    } else {
        MockRemoteFs::Node fresh;
        fresh.mode = kModeRegular | (mode & 07777);
        fresh.mtime = nowEpoch();
        fs_->nodes_[path] = fresh;
    }
    return std::make_unique<MockRemoteFile>(this, path);
}

bool MockSftpClient::removeFile(const std::string& remote_path,
                                Error& err) {
    if (!requireConnected(err)) return false;
    const std::string path = absPath(remote_path);
    std::lock_guard<std::mutex> lk(fs_->m_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, path + ": no such file or directory", kFxNoSuchFile);
        return false;
    }
    if (it->second.dir) {
        err.set(ErrorKind::Transport, "sftp unlink failed for " + path + " (is a directory)", kFxFailure);
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSftpClient::removeDir(const std::string& remote_dir,
                               Error& err) {
    if (!requireConnected(err)) return false;
    const std::string path = absPath(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->m_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, path + ": no such file or directory", kFxNoSuchFile);
        return false;
    }
    if (!it->second.dir || path == "/") {
        err.set(ErrorKind::Transport, "sftp rmdir failed for " + path, kFxFailure);
        return false;
    }
    if (fs_->hasChildrenLocked(path)) {
        err.set(ErrorKind::Transport, "sftp rmdir failed for " + path + " (directory not empty)", kFxFailure);
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSftpClient::rename(const std::string& from,
                            const std::string& to,
                            Error& err,
                            bool overwrite) {
    if (!requireConnected(err)) return false;
    const std::string src = absPath(from);
    const std::string dst = absPath(to);
    std::lock_guard<std::mutex> lk(fs_->m_);
    auto it = fs_->nodes_.find(src);
    if (it == fs_->nodes_.end()) {
        err.set(ErrorKind::NotFound, src + ": no such file or directory", kFxNoSuchFile);
        return false;
    }
    MockRemoteFs::Node* parentNode = nullptr;
    if (!fs_->lookupLocked(remotepath::parent(dst), parentNode) || !parentNode->dir) {
        err.set(ErrorKind::NotFound, remotepath::parent(dst) + ": no such directory", kFxNoSuchFile);
        return false;
    }
    if (src == dst) return true;
    auto target = fs_->nodes_.find(dst);
    if (target != fs_->nodes_.end()) {
        if (!overwrite || fs_->rejectOverwriteRename_.load() || target->second.dir) {
            err.set(ErrorKind::Transport, "sftp rename failed for " + src + " (target exists)", kFxFailure);
            return false;
        }
        fs_->nodes_.erase(target);
    }

    // Move the node and, for directories, its whole subtree.
    std::vector<std::pair<std::string, MockRemoteFs::Node>> moved;
    const std::string prefix = src + "/";
    for (auto jt = fs_->nodes_.lower_bound(src); jt != fs_->nodes_.end();) {
        if (jt->first == src) {
            moved.emplace_back(dst, jt->second);
        } else if (jt->first.compare(0, prefix.size(), prefix) == 0) {
            moved.emplace_back(dst + jt->first.substr(src.size()), jt->second);
        } else if (jt->first.compare(0, src.size(), src) != 0) {
            break;
        } else {
            ++jt;
            continue;
        }
        jt = fs_->nodes_.erase(jt);
    }
    for (auto& kv : moved) fs_->nodes_[kv.first] = std::move(kv.second);
    return true;
}

} // namespace datadrift
