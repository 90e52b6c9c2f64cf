// Worker pool and job bodies: streamed chunk by chunk, temp file then rename.
#include "datadrift/TransferCoordinator.hpp"
#include "datadrift/Log.hpp"
#include "datadrift/RemotePath.hpp"
#include "datadrift/Utf8.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>

namespace datadrift {

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

std::string sysError(int e) {
    return std::strerror(e);
}

std::string localBaseName(std::string p) {
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    const auto pos = p.rfind('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string localDirName(std::string p) {
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    const auto pos = p.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return p.substr(0, pos);
}

std::string localJoin(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    return dir.back() == '/' ? dir + name : dir + "/" + name;
}

std::string tempName(const std::string& name, std::uint64_t jobId) {
    return "." + name + ".datadrift-" + std::to_string(jobId) + ".part";
}

bool isMutating(JobKind k) {
    return k == JobKind::Upload || k == JobKind::Save || k == JobKind::Delete;
}

// Remote path a mutating job holds exclusively.
const std::string& guardPath(const TransferJob& job) {
    return job.kind() == JobKind::Upload ? job.destination() : job.source();
}

// Global bandwidth limit applied at chunk boundaries: sleep when ahead of the budget.
class Throttle {
public:
    explicit Throttle(const std::atomic<int>& limitKBps)
        : limit_(limitKBps), lastTick_(clock::now()) {}

    void account(std::uint64_t done) {
        static constexpr double KIB = 1024.0;
        const int kbps = limit_.load();
        if (kbps > 0 && done > lastDone_) {
            const auto now = clock::now();
            const double deltaBytes = double(done - lastDone_);
            const double expectedSec = deltaBytes / (kbps * KIB);
            const double elapsedSec = std::chrono::duration_cast<std::chrono::duration<double>>(now - lastTick_).count();
            if (elapsedSec < expectedSec) {
                const double sleepSec = expectedSec - elapsedSec;
                if (sleepSec > 0.0005) // avoid ultra-short sleeps
                    std::this_thread::sleep_for(std::chrono::duration<double>(sleepSec));
            }
        }
        lastTick_ = clock::now();
        lastDone_ = done;
    }

private:
    using clock = std::chrono::steady_clock;
    const std::atomic<int>& limit_;
    clock::time_point lastTick_;
    std::uint64_t lastDone_ = 0;
};

TransferOptions sanitize(TransferOptions o) {
    if (o.workers < 1) o.workers = 1;
    if (o.chunk_bytes == 0) o.chunk_bytes = 64 * 1024;
    if (o.max_attempts < 1) o.max_attempts = 1;
    if (o.speed_limit_kbps < 0) o.speed_limit_kbps = 0;
    return o;
}

} // namespace

TransferCoordinator::TransferCoordinator(SessionManager& sessions, TransferOptions opt)
    : sessions_(sessions), opt_(sanitize(opt)), speedLimitKBps_(opt_.speed_limit_kbps) {
    hookToken_ = sessions_.addTeardownHook(
        [this](std::uint64_t sessionId, TeardownReason reason, const Error& cause) {
            cancelSession(sessionId, cause);
            // On connection loss this runs on a worker thread; waiting here would deadlock.
            if (reason == TeardownReason::Disconnect) waitSessionIdle(sessionId);
        });
    for (int i = 0; i < opt_.workers; ++i)
        workers_.emplace_back([this] { workerLoop(); });
}

TransferCoordinator::~TransferCoordinator() {
    sessions_.removeTeardownHook(hookToken_);
    cancelAll();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
    }
    queueCv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

void TransferCoordinator::setJobListener(JobListener l) {
    std::lock_guard<std::mutex> lk(cbMutex_);
    listener_ = std::move(l);
}

void TransferCoordinator::setInvalidateCallback(InvalidateFn fn) {
    std::lock_guard<std::mutex> lk(cbMutex_);
    invalidate_ = std::move(fn);
}

void TransferCoordinator::notify(const TransferJob& job) {
    JobListener l;
    {
        std::lock_guard<std::mutex> lk(cbMutex_);
        l = listener_;
    }
    if (l) l(job.snapshot());
}

void TransferCoordinator::invalidate(const std::string& remoteDir) {
    InvalidateFn fn;
    {
        std::lock_guard<std::mutex> lk(cbMutex_);
        fn = invalidate_;
    }
    if (fn) fn(remoteDir);
}

// ---------------------------------------------------------------------------
// Submission

JobPtr TransferCoordinator::submit(JobKind kind, std::string source, std::string destination,
                                   std::string content, int attempt, Error& err) {
    auto t = sessions_.transport(err);
    if (!t) {
        err.withContext(std::string(jobKindName(kind)) + " " + source);
        return nullptr;
    }
    JobPtr job;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopping_) {
            err.set(ErrorKind::Busy, "transfer coordinator is shutting down");
            return nullptr;
        }
        pruneLocked();
        const std::string& guard = kind == JobKind::Upload ? destination : source;
        if (isMutating(kind) && busyPaths_.count(guard)) {
            err.set(ErrorKind::Conflict, std::string(jobKindName(kind)) + " " + guard +
                    ": another upload, save or delete of this path is in progress");
            return nullptr;
        }
        job.reset(new TransferJob(nextId_++, kind, t->sessionId(), std::move(source),
                                  std::move(destination), attempt));
        job->content_ = std::move(content);
        if (isMutating(kind)) busyPaths_.insert(guardPath(*job));
        registry_[job->id()] = job;
        ++unsettled_[job->sessionId()];
        queue_.push_back(job);
    }
    queueCv_.notify_one();
    LOGD("job %llu: queued %s %s -> %s (attempt %d)", (unsigned long long)job->id(),
         jobKindName(kind), job->source().c_str(), job->destination().c_str(), attempt);
    notify(*job);
    return job;
}

JobPtr TransferCoordinator::submitUpload(const std::string& localFile, const std::string& remoteDir,
                                         int attempt, Error& err) {
    struct stat st{};
    if (::stat(localFile.c_str(), &st) != 0) {
        const int e = errno;
        err.set(e == ENOENT ? ErrorKind::NotFound : ErrorKind::LocalIo,
                "upload " + localFile + ": " + sysError(e), e);
        return nullptr;
    }
    if (S_ISDIR(st.st_mode)) {
        err.set(ErrorKind::IsADirectory, "upload " + localFile + ": is a directory");
        return nullptr;
    }
    if (!S_ISREG(st.st_mode)) {
        err.set(ErrorKind::LocalIo, "upload " + localFile + ": not a regular file");
        return nullptr;
    }
    const std::string dir = remotepath::resolve("/", remoteDir);
    return submit(JobKind::Upload, localFile, remotepath::join(dir, localBaseName(localFile)),
                  std::string(), attempt, err);
}

JobPtr TransferCoordinator::submitDownload(const std::string& remoteFile, const std::string& localDir,
                                           int attempt, Error& err) {
    struct stat st{};
    if (::stat(localDir.c_str(), &st) != 0) {
        const int e = errno;
        err.set(e == ENOENT ? ErrorKind::NotFound : ErrorKind::LocalIo,
                "download to " + localDir + ": " + sysError(e), e);
        return nullptr;
    }
    if (!S_ISDIR(st.st_mode)) {
        err.set(ErrorKind::NotADirectory, "download to " + localDir + ": not a directory");
        return nullptr;
    }
    const std::string remote = remotepath::resolve("/", remoteFile);
    const std::string name = remotepath::baseName(remote);
    if (name.empty()) {
        err.set(ErrorKind::IsADirectory, "download " + remote + ": is a directory");
        return nullptr;
    }
    return submit(JobKind::Download, remote, localJoin(localDir, name), std::string(), attempt, err);
}

JobPtr TransferCoordinator::submitOpen(const std::string& remoteFile, int attempt, Error& err) {
    const std::string remote = remotepath::resolve("/", remoteFile);
    return submit(JobKind::Open, remote, remote, std::string(), attempt, err);
}

JobPtr TransferCoordinator::submitSave(const std::string& remoteFile, const std::string& content,
                                       int attempt, Error& err) {
    const std::string remote = remotepath::resolve("/", remoteFile);
    if (remote == "/") {
        err.set(ErrorKind::IsADirectory, "save /: is a directory");
        return nullptr;
    }
    return submit(JobKind::Save, remote, remote, content, attempt, err);
}

JobPtr TransferCoordinator::submitRemove(const std::string& remotePath, int attempt, Error& err) {
    const std::string remote = remotepath::resolve("/", remotePath);
    return submit(JobKind::Delete, remote, remote, std::string(), attempt, err);
}

JobPtr TransferCoordinator::upload(const std::string& localFile, const std::string& remoteDir, Error& err) {
    return submitUpload(localFile, remoteDir, 1, err);
}

JobPtr TransferCoordinator::download(const std::string& remoteFile, const std::string& localDir, Error& err) {
    return submitDownload(remoteFile, localDir, 1, err);
}

JobPtr TransferCoordinator::openForEdit(const std::string& remoteFile, Error& err) {
    return submitOpen(remoteFile, 1, err);
}

JobPtr TransferCoordinator::saveEdit(const std::string& remoteFile, const std::string& content, Error& err) {
    return submitSave(remoteFile, content, 1, err);
}

JobPtr TransferCoordinator::remove(const std::string& remotePath, Error& err) {
    return submitRemove(remotePath, 1, err);
}

JobPtr TransferCoordinator::retry(std::uint64_t jobId, Error& err) {
    JobPtr old = job(jobId);
    if (!old) {
        err.set(ErrorKind::NotFound, "job " + std::to_string(jobId) + " not found");
        return nullptr;
    }
    const JobState st = old->state();
    if (st != JobState::Failed && st != JobState::Cancelled) {
        err.set(ErrorKind::Busy, "job " + std::to_string(jobId) + " is " + jobStateName(st) +
                "; only failed or cancelled jobs can be retried");
        return nullptr;
    }
    if (old->attempt() >= opt_.max_attempts) {
        err.set(ErrorKind::Busy, "job " + std::to_string(jobId) + ": retry limit reached (" +
                std::to_string(opt_.max_attempts) + " attempts)");
        return nullptr;
    }
    const int next = old->attempt() + 1;
    switch (old->kind()) {
        case JobKind::Upload:
            return submitUpload(old->source(), remotepath::parent(old->destination()), next, err);
        case JobKind::Download:
            return submitDownload(old->source(), localDirName(old->destination()), next, err);
        case JobKind::Open:
            return submitOpen(old->source(), next, err);
        case JobKind::Save:
            return submitSave(old->source(), old->content_, next, err);
        case JobKind::Delete:
            return submitRemove(old->source(), next, err);
    }
    err.set(ErrorKind::Transport, "unknown job kind");
    return nullptr;
}

// ---------------------------------------------------------------------------
// Cancellation and registry

void TransferCoordinator::cancelAll() {
    const Error cause = makeError(ErrorKind::Cancelled, "cancelled by user");
    std::vector<JobPtr> dropped;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& kv : registry_) kv.second->requestCancel(cause);
        dropped.assign(queue_.begin(), queue_.end());
        queue_.clear();
    }
    for (auto& j : dropped) settle(j, false, cause);
}

void TransferCoordinator::cancelSession(std::uint64_t sessionId, const Error& cause) {
    std::vector<JobPtr> dropped;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& kv : registry_) {
            if (kv.second->sessionId() == sessionId && !kv.second->settled())
                kv.second->requestCancel(cause);
        }
        for (auto it = queue_.begin(); it != queue_.end();) {
            if ((*it)->sessionId() == sessionId) {
                dropped.push_back(*it);
                it = queue_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& j : dropped) settle(j, false, cause);
}

void TransferCoordinator::waitSessionIdle(std::uint64_t sessionId) {
    std::unique_lock<std::mutex> lk(mtx_);
    idleCv_.wait(lk, [this, sessionId] { return unsettled_.count(sessionId) == 0; });
}

JobPtr TransferCoordinator::job(std::uint64_t jobId) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = registry_.find(jobId);
    return it == registry_.end() ? nullptr : it->second;
}

std::vector<JobSnapshot> TransferCoordinator::jobs() {
    std::vector<JobPtr> js;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        pruneLocked();
        for (auto& kv : registry_) js.push_back(kv.second);
    }
    std::vector<JobSnapshot> out;
    out.reserve(js.size());
    for (auto& j : js) out.push_back(j->snapshot());
    return out;
}

bool TransferCoordinator::forget(std::uint64_t jobId) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = registry_.find(jobId);
    if (it == registry_.end() || !it->second->settled()) return false;
    registry_.erase(it);
    return true;
}

void TransferCoordinator::clearCompleted() {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto it = registry_.begin(); it != registry_.end();) {
        if (it->second->settled()) it = registry_.erase(it);
        else ++it;
    }
}

void TransferCoordinator::pruneLocked() {
    if (opt_.retention_sec <= 0) return;
    const auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(opt_.retention_sec);
    for (auto it = registry_.begin(); it != registry_.end();) {
        if (it->second->finishedBefore(cutoff)) it = registry_.erase(it);
        else ++it;
    }
}

// ---------------------------------------------------------------------------
// Workers

void TransferCoordinator::workerLoop() {
    for (;;) {
        JobPtr job;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            queueCv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            job = queue_.front();
            queue_.pop_front();
        }
        run(job);
    }
}

void TransferCoordinator::run(const JobPtr& job) {
    Error err;
    if (job->cancelRequested()) {
        settle(job, false, job->cancelCause());
        return;
    }
    job->setRunning();
    notify(*job);

    auto t = sessions_.transport(err);
    if (t && t->sessionId() != job->sessionId()) {
        t.reset();
        err.set(ErrorKind::NotConnected, "session " + std::to_string(job->sessionId()) +
                " is no longer active");
    }
    bool ok = false;
    std::string text;
    if (t) {
        switch (job->kind()) {
            case JobKind::Upload:   ok = runUpload(*job, *t, err); break;
            case JobKind::Download: ok = runDownload(*job, *t, err); break;
            case JobKind::Open:     ok = runOpen(*job, *t, text, err); break;
            case JobKind::Save:     ok = runSave(*job, *t, err); break;
            case JobKind::Delete:   ok = runDelete(*job, *t, err); break;
        }
    }
    settle(job, ok, err, std::move(text));
}

void TransferCoordinator::settle(const JobPtr& job, bool ok, Error err, std::string text) {
    const std::string ctx = "job " + std::to_string(job->id()) + " " + jobKindName(job->kind()) +
                            " " + job->source();
    JobState st = JobState::Succeeded;
    Error final;
    if (!ok) {
        if (job->cancelRequested() || err.kind == ErrorKind::Cancelled) {
            st = JobState::Cancelled;
            final = job->cancelRequested() ? job->cancelCause() : err;
            if (!err.ok() && err.kind != final.kind) final.message += "; " + err.message;
        } else {
            st = JobState::Failed;
            final = err;
        }
        final.withContext(ctx);
    }
    job->finish(st, final, std::move(text));

    if (st == JobState::Succeeded)
        LOGI("%s: done (%llu bytes)", ctx.c_str(), (unsigned long long)job->bytesDone());
    else if (st == JobState::Cancelled)
        LOGI("%s", final.describe().c_str());
    else
        LOGE("%s", final.describe().c_str());

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (isMutating(job->kind())) busyPaths_.erase(guardPath(*job));
        auto it = unsettled_.find(job->sessionId());
        if (it != unsettled_.end() && --it->second <= 0) unsettled_.erase(it);
    }
    idleCv_.notify_all();
    notify(*job);
}

bool TransferCoordinator::checkpoint(const TransferJob& job, Error& err) const {
    if (!job.cancelRequested()) return true;
    err = job.cancelCause();
    return false;
}

bool TransferCoordinator::writeAll(TransportHandle& t, TransportHandle::FileId fid,
                                   const char* buf, std::size_t len, Error& err) {
    std::size_t off = 0;
    while (off < len) {
        const std::int64_t n = t.write(fid, buf + off, len - off, err);
        if (n < 0) return false;
        if (n == 0) {
            err.set(ErrorKind::Transport, "remote write made no progress");
            return false;
        }
        off += (std::size_t)n;
    }
    return true;
}

bool TransferCoordinator::replaceRemote(TransportHandle& t, const std::string& tmp,
                                        const std::string& dst, bool& targetRemoved, Error& err) {
    targetRemoved = false;
    if (t.rename(tmp, dst, true, err)) return true;
    if (!t.usable()) return false;

    FileInfo fi;
    Error se;
    if (!t.stat(dst, fi, se)) return false; // target absent: the rename failure stands
    if (fi.is_dir) {
        err.set(ErrorKind::IsADirectory, dst + ": is a directory");
        return false;
    }
    // Best effort: SFTPv3 servers may refuse to rename over an existing file.
    LOGW("rename over %s refused (%s); removing the target first", dst.c_str(), err.message.c_str());
    Error re;
    if (!t.remove(dst, re)) {
        err = re;
        return false;
    }
    targetRemoved = true;
    err.clear();
    return t.rename(tmp, dst, false, err);
}

void TransferCoordinator::removeRemoteTemp(TransportHandle& t, const std::string& tmp) {
    Error e;
    if (!t.remove(tmp, e) && e.kind != ErrorKind::NotFound)
        LOGW("could not remove temporary file %s: %s", tmp.c_str(), e.message.c_str());
}

// ---------------------------------------------------------------------------
// Job bodies

bool TransferCoordinator::runUpload(TransferJob& job, TransportHandle& t, Error& err) {
    const std::string& local = job.source();
    const std::string& dst = job.destination();
    const std::string dir = remotepath::parent(dst);

    bool isDir = false;
    if (!t.isDirectory(dir, isDir, err)) return false;
    if (!isDir) {
        err.set(ErrorKind::NotADirectory, dir + ": not a directory");
        return false;
    }

    FilePtr in(std::fopen(local.c_str(), "rb"));
    if (!in) {
        const int e = errno;
        err.set(ErrorKind::LocalIo, "open " + local + ": " + sysError(e), e);
        return false;
    }
    struct stat st{};
    if (::fstat(fileno(in.get()), &st) == 0) job.setTotal((std::uint64_t)st.st_size);

    const std::string tmp = remotepath::join(dir, tempName(remotepath::baseName(dst), job.id()));
    TransportHandle::FileId fid = 0;
    if (!t.openWrite(tmp, true, fid, err)) return false;

    std::vector<char> buf(opt_.chunk_bytes);
    Throttle throttle(speedLimitKBps_);
    std::uint64_t done = 0;
    bool ok = true;
    for (;;) {
        if (!checkpoint(job, err)) { ok = false; break; }
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), in.get());
        if (n == 0) {
            if (std::ferror(in.get())) {
                err.set(ErrorKind::LocalIo, "read " + local + " failed");
                ok = false;
            }
            break;
        }
        if (!writeAll(t, fid, buf.data(), n, err)) { ok = false; break; }
        done += n;
        job.advance(n);
        notify(job);
        throttle.account(done);
    }
    Error closeErr;
    if (!t.closeFile(fid, closeErr) && ok) {
        err = closeErr;
        ok = false;
    }

    bool targetRemoved = false;
    if (ok) ok = replaceRemote(t, tmp, dst, targetRemoved, err);
    invalidate(dir);
    if (ok) return true;

    if (job.cancelRequested() && t.usable()) {
        removeRemoteTemp(t, tmp);
        return false;
    }
    err.message += " (partial upload left at " + tmp + ")";
    return false;
}

bool TransferCoordinator::runDownload(TransferJob& job, TransportHandle& t, Error& err) {
    const std::string& remote = job.source();
    const std::string& dest = job.destination();

    FileInfo fi;
    if (!t.stat(remote, fi, err)) return false;
    if (fi.is_dir) {
        err.set(ErrorKind::IsADirectory, remote + ": is a directory");
        return false;
    }
    job.setTotal(fi.size);

    TransportHandle::FileId fid = 0;
    if (!t.openRead(remote, fid, err)) return false;

    const std::string tmp = localJoin(localDirName(dest), tempName(localBaseName(dest), job.id()));
    FilePtr out(std::fopen(tmp.c_str(), "wb"));
    if (!out) {
        const int e = errno;
        err.set(ErrorKind::LocalIo, "create " + tmp + ": " + sysError(e), e);
        Error closeErr;
        if (!t.closeFile(fid, closeErr)) LOGD("close %s: %s", remote.c_str(), closeErr.message.c_str());
        return false;
    }

    std::vector<char> buf(opt_.chunk_bytes);
    Throttle throttle(speedLimitKBps_);
    std::uint64_t done = 0;
    bool ok = true;
    for (;;) {
        if (!checkpoint(job, err)) { ok = false; break; }
        const std::int64_t n = t.read(fid, buf.data(), buf.size(), err);
        if (n < 0) { ok = false; break; }
        if (n == 0) break;
        if (std::fwrite(buf.data(), 1, (std::size_t)n, out.get()) != (std::size_t)n) {
            const int e = errno;
            err.set(ErrorKind::LocalIo, "write " + tmp + ": " + sysError(e), e);
            ok = false;
            break;
        }
        done += (std::uint64_t)n;
        job.advance((std::uint64_t)n);
        notify(job);
        throttle.account(done);
    }
    Error closeErr;
    if (!t.closeFile(fid, closeErr)) {
        if (ok) {
            err = closeErr;
            ok = false;
        } else {
            LOGD("close %s: %s", remote.c_str(), closeErr.message.c_str());
        }
    }
    if (ok && std::fclose(out.release()) != 0) {
        const int e = errno;
        err.set(ErrorKind::LocalIo, "close " + tmp + ": " + sysError(e), e);
        ok = false;
    }
    out.reset();
    if (ok && std::rename(tmp.c_str(), dest.c_str()) != 0) {
        const int e = errno;
        err.set(ErrorKind::LocalIo, "rename " + tmp + " -> " + dest + ": " + sysError(e), e);
        ok = false;
    }
    if (!ok && std::remove(tmp.c_str()) != 0 && errno != ENOENT)
        LOGW("could not remove temporary file %s: %s", tmp.c_str(), sysError(errno).c_str());
    return ok;
}

bool TransferCoordinator::runOpen(TransferJob& job, TransportHandle& t, std::string& text, Error& err) {
    const std::string& remote = job.source();
    FileInfo fi;
    if (!t.stat(remote, fi, err)) return false;
    if (fi.is_dir) {
        err.set(ErrorKind::IsADirectory, remote + ": is a directory");
        return false;
    }
    if (fi.size > opt_.max_edit_bytes) {
        err.set(ErrorKind::TooLarge, remote + ": " + std::to_string(fi.size) + " bytes exceeds the " +
                std::to_string(opt_.max_edit_bytes) + " byte edit limit");
        return false;
    }
    job.setTotal(fi.size);

    TransportHandle::FileId fid = 0;
    if (!t.openRead(remote, fid, err)) return false;

    std::string content;
    content.reserve((std::size_t)fi.size);
    std::vector<char> buf(opt_.chunk_bytes);
    bool ok = true;
    for (;;) {
        if (!checkpoint(job, err)) { ok = false; break; }
        const std::int64_t n = t.read(fid, buf.data(), buf.size(), err);
        if (n < 0) { ok = false; break; }
        if (n == 0) break;
        if (content.size() + (std::size_t)n > opt_.max_edit_bytes) {
            err.set(ErrorKind::TooLarge, remote + ": grew past the " +
                    std::to_string(opt_.max_edit_bytes) + " byte edit limit while reading");
            ok = false;
            break;
        }
        content.append(buf.data(), (std::size_t)n);
        job.advance((std::uint64_t)n);
        notify(job);
    }
    Error closeErr;
    if (!t.closeFile(fid, closeErr)) {
        if (ok) {
            err = closeErr;
            ok = false;
        } else {
            LOGD("close %s: %s", remote.c_str(), closeErr.message.c_str());
        }
    }
    if (!ok) return false;
    if (!isValidUtf8(content)) {
        err.set(ErrorKind::NotUtf8, remote + ": content is not valid UTF-8 text");
        return false;
    }
    text = std::move(content);
    return true;
}

bool TransferCoordinator::runSave(TransferJob& job, TransportHandle& t, Error& err) {
    const std::string& remote = job.source();
    const std::string dir = remotepath::parent(remote);
    const std::string& content = job.content_;

    bool isDir = false;
    if (!t.isDirectory(dir, isDir, err)) return false;
    if (!isDir) {
        err.set(ErrorKind::NotADirectory, dir + ": not a directory");
        return false;
    }
    FileInfo fi;
    Error se;
    if (t.stat(remote, fi, se)) {
        if (fi.is_dir) {
            err.set(ErrorKind::IsADirectory, remote + ": is a directory");
            return false;
        }
    } else if (se.kind != ErrorKind::NotFound) {
        err = se;
        return false;
    }
    job.setTotal(content.size());

    const std::string tmp = remotepath::join(dir, tempName(remotepath::baseName(remote), job.id()));
    TransportHandle::FileId fid = 0;
    if (!t.openWrite(tmp, true, fid, err)) return false;

    Throttle throttle(speedLimitKBps_);
    std::size_t off = 0;
    bool ok = true;
    while (off < content.size()) {
        if (!checkpoint(job, err)) { ok = false; break; }
        const std::size_t n = std::min(opt_.chunk_bytes, content.size() - off);
        if (!writeAll(t, fid, content.data() + off, n, err)) { ok = false; break; }
        off += n;
        job.advance(n);
        notify(job);
        throttle.account(off);
    }
    // A cancel that lands after the last chunk still leaves the target untouched.
    if (ok && !checkpoint(job, err)) ok = false;
    Error closeErr;
    if (!t.closeFile(fid, closeErr) && ok) {
        err = closeErr;
        ok = false;
    }

    bool targetRemoved = false;
    if (ok) ok = replaceRemote(t, tmp, remote, targetRemoved, err);
    invalidate(dir);
    if (ok) return true;

    if (targetRemoved) {
        err.message += " (new content kept at " + tmp + ")";
    } else if (t.usable()) {
        removeRemoteTemp(t, tmp);
    }
    return false;
}

bool TransferCoordinator::runDelete(TransferJob& job, TransportHandle& t, Error& err) {
    const std::string& remote = job.source();
    if (!t.remove(remote, err)) return false;
    invalidate(remotepath::parent(remote));
    invalidate(remote);
    return true;
}

} // namespace datadrift
