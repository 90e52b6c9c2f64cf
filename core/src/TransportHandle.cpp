// Serialized access to a single SftpClient plus ownership of its open files.
#include "datadrift/TransportHandle.hpp"
#include "datadrift/Log.hpp"

namespace datadrift {

TransportHandle::TransportHandle(std::unique_ptr<SftpClient> client, std::uint64_t sessionId)
    : sessionId_(sessionId), client_(std::move(client)) {}

TransportHandle::~TransportHandle() {
    close();
}

void TransportHandle::setLostCallback(LostCallback cb) {
    std::lock_guard<std::mutex> lk(cbMutex_);
    onLost_ = std::move(cb);
}

bool TransportHandle::usable() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return !closed_ && !broken_ && client_ && client_->isConnected();
}

bool TransportHandle::checkUsableLocked(Error& err) const {
    if (closed_ || !client_) {
        err.set(ErrorKind::Transport, "transport closed");
        return false;
    }
    if (broken_) {
        err.set(ErrorKind::Transport, "connection lost");
        return false;
    }
    return true;
}

bool TransportHandle::noteFailureLocked(Error& err) {
    if (closed_ || broken_ || client_->isConnected()) return false;
    broken_ = true;
    if (err.kind != ErrorKind::Transport) err.kind = ErrorKind::Transport;
    LOGW("session %llu: connection lost (%s)", (unsigned long long)sessionId_, err.message.c_str());
    return true;
}

void TransportHandle::notifyLost(const Error& cause) {
    LostCallback cb;
    {
        std::lock_guard<std::mutex> lk(cbMutex_);
        cb = onLost_;
    }
    if (cb) cb(cause);
}

RemoteFile* TransportHandle::fileLocked(FileId id, Error& err) {
    auto it = files_.find(id);
    if (it == files_.end()) {
        err.set(ErrorKind::Transport, "unknown file handle " + std::to_string(id));
        return nullptr;
    }
    return it->second.get();
}

bool TransportHandle::list(const std::string& path, std::vector<FileInfo>& out, Error& err) {
    bool lost = false;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!checkUsableLocked(err)) return false;
        ok = client_->list(path, out, err);
        if (!ok) lost = noteFailureLocked(err);
    }
    if (lost) notifyLost(err);
    return ok;
}

bool TransportHandle::stat(const std::string& path, FileInfo& info, Error& err) {
    bool lost = false;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!checkUsableLocked(err)) return false;
        ok = client_->stat(path, info, err);
        if (!ok) lost = noteFailureLocked(err);
    }
    if (lost) notifyLost(err);
    return ok;
}

bool TransportHandle::isDirectory(const std::string& path, bool& isDir, Error& err) {
    FileInfo info;
    if (!stat(path, info, err)) return false;
    isDir = info.is_dir;
    return true;
}

bool TransportHandle::openRead(const std::string& path, FileId& id, Error& err) {
    bool lost = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!checkUsableLocked(err)) return false;
        std::unique_ptr<RemoteFile> f = client_->openRead(path, err);
        if (f) {
            id = nextFileId_++;
            files_[id] = std::move(f);
            return true;
        }
        lost = noteFailureLocked(err);
    }
    if (lost) notifyLost(err);
    return false;
}

bool TransportHandle::openWrite(const std::string& path, bool truncate, FileId& id, Error& err) {
    bool lost = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!checkUsableLocked(err)) return false;
        std::unique_ptr<RemoteFile> f = client_->openWrite(path, truncate, err);
        if (f) {
            id = nextFileId_++;
            files_[id] = std::move(f);
            return true;
        }
        lost = noteFailureLocked(err);
    }
    if (lost) notifyLost(err);
    return false;
}

std::int64_t TransportHandle::read(FileId id, char* buf, std::size_t len, Error& err) {
    bool lost = false;
    std::int64_t n = -1;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!checkUsableLocked(err)) return -1;
        RemoteFile* f = fileLocked(id, err);
        if (!f) return -1;
        n = f->read(buf, len, err);
        if (n < 0) lost = noteFailureLocked(err);
    }
    if (lost) notifyLost(err);
    return n;
}

std::int64_t TransportHandle::write(FileId id, const char* buf, std::size_t len, Error& err) {
    bool lost = false;
    std::int64_t n = -1;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!checkUsableLocked(err)) return -1;
        RemoteFile* f = fileLocked(id, err);
        if (!f) return -1;
        n = f->write(buf, len, err);
        if (n < 0) lost = noteFailureLocked(err);
    }
    if (lost) notifyLost(err);
    return n;
}

bool TransportHandle::closeFile(FileId id, Error& err) {
    bool lost = false;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = files_.find(id);
        if (it == files_.end()) {
            err.set(ErrorKind::Transport, "unknown file handle " + std::to_string(id));
            return false;
        }
        std::unique_ptr<RemoteFile> f = std::move(it->second);
        files_.erase(it);
        if (!checkUsableLocked(err)) return false;
        ok = f->close(err);
        if (!ok) lost = noteFailureLocked(err);
    }
    if (lost) notifyLost(err);
    return ok;
}

bool TransportHandle::remove(const std::string& path, Error& err) {
    bool lost = false;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!checkUsableLocked(err)) return false;
        // lstat: a symlink is unlinked itself, whether its target is a directory or missing.
        FileInfo info;
        ok = client_->lstat(path, info, err);
        if (ok) ok = info.is_dir ? client_->removeDir(path, err) : client_->removeFile(path, err);
        if (!ok) lost = noteFailureLocked(err);
    }
    if (lost) notifyLost(err);
    return ok;
}

bool TransportHandle::rename(const std::string& from, const std::string& to, bool overwrite, Error& err) {
    bool lost = false;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!checkUsableLocked(err)) return false;
        ok = client_->rename(from, to, err, overwrite);
        if (!ok) lost = noteFailureLocked(err);
    }
    if (lost) notifyLost(err);
    return ok;
}

void TransportHandle::close() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (closed_) return;
    closed_ = true;
    if (!client_) return;
    const bool alive = !broken_ && client_->isConnected();
    for (auto& kv : files_) {
        if (!alive) continue;
        Error e;
        if (!kv.second->close(e))
            LOGD("session %llu: closing file %llu: %s", (unsigned long long)sessionId_,
                 (unsigned long long)kv.first, e.message.c_str());
    }
    files_.clear();
    client_->disconnect();
    LOGI("session %llu: transport closed", (unsigned long long)sessionId_);
}

} // namespace datadrift
