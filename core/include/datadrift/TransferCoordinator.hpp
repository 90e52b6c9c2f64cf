// Runs transfer jobs on a fixed worker pool against the session's single transport.
// At most one mutating job (upload, save, delete) per remote path is pending or running.
#pragma once
#include "SessionManager.hpp"
#include "TransferJob.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace datadrift {

struct TransferOptions {
    int workers = 2;
    std::size_t chunk_bytes = 64 * 1024;
    std::uint64_t max_edit_bytes = 4ull * 1024 * 1024;
    int speed_limit_kbps = 0;   // global, 0 = unlimited
    int retention_sec = 600;    // settled jobs dropped after this long (0 = keep until forgotten)
    int max_attempts = 3;
};

class TransferCoordinator {
public:
    using JobListener = std::function<void(const JobSnapshot& job)>;
    // Called with a remote directory whose cached listing is out of date.
    using InvalidateFn = std::function<void(const std::string& remoteDir)>;

    TransferCoordinator(SessionManager& sessions, TransferOptions opt = TransferOptions());
    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    // Invoked from worker threads on every state or progress change.
    void setJobListener(JobListener l);
    void setInvalidateCallback(InvalidateFn fn);
    void setSpeedLimitKBps(int kbps) { speedLimitKBps_.store(kbps < 0 ? 0 : kbps); }
    int speedLimitKBps() const { return speedLimitKBps_.load(); }
    const TransferOptions& options() const { return opt_; }

    // Each returns null and fills err when the request is refused up front.
    JobPtr upload(const std::string& localFile, const std::string& remoteDir, Error& err);
    JobPtr download(const std::string& remoteFile, const std::string& localDir, Error& err);
    JobPtr openForEdit(const std::string& remoteFile, Error& err);
    JobPtr saveEdit(const std::string& remoteFile, const std::string& content, Error& err);
    JobPtr remove(const std::string& remotePath, Error& err);

    // Resubmits a failed or cancelled job as attempt + 1.
    JobPtr retry(std::uint64_t jobId, Error& err);

    void cancelAll();
    // Cancels the session's pending and running jobs with the given cause.
    void cancelSession(std::uint64_t sessionId, const Error& cause);
    // Blocks until no job of the session is pending or running.
    void waitSessionIdle(std::uint64_t sessionId);

    JobPtr job(std::uint64_t jobId) const;
    // Registry snapshot in submission order (drops jobs past the retention window).
    std::vector<JobSnapshot> jobs();
    bool forget(std::uint64_t jobId);
    void clearCompleted();

private:
    JobPtr submit(JobKind kind, std::string source, std::string destination,
                  std::string content, int attempt, Error& err);
    JobPtr submitUpload(const std::string& localFile, const std::string& remoteDir, int attempt, Error& err);
    JobPtr submitDownload(const std::string& remoteFile, const std::string& localDir, int attempt, Error& err);
    JobPtr submitOpen(const std::string& remoteFile, int attempt, Error& err);
    JobPtr submitSave(const std::string& remoteFile, const std::string& content, int attempt, Error& err);
    JobPtr submitRemove(const std::string& remotePath, int attempt, Error& err);

    void workerLoop();
    void run(const JobPtr& job);
    void settle(const JobPtr& job, bool ok, Error err, std::string text = std::string());

    bool runUpload(TransferJob& job, TransportHandle& t, Error& err);
    bool runDownload(TransferJob& job, TransportHandle& t, Error& err);
    bool runOpen(TransferJob& job, TransportHandle& t, std::string& text, Error& err);
    bool runSave(TransferJob& job, TransportHandle& t, Error& err);
    bool runDelete(TransferJob& job, TransportHandle& t, Error& err);

    // Writes all of buf, looping over short writes.
    bool writeAll(TransportHandle& t, TransportHandle::FileId fid, const char* buf,
                  std::size_t len, Error& err);
    // Rename over dst, falling back to remove + rename on servers that refuse to overwrite.
    // targetRemoved reports that dst is gone while tmp still holds the new content.
    bool replaceRemote(TransportHandle& t, const std::string& tmp, const std::string& dst,
                       bool& targetRemoved, Error& err);
    void removeRemoteTemp(TransportHandle& t, const std::string& tmp);
    bool checkpoint(const TransferJob& job, Error& err) const;
    void notify(const TransferJob& job);
    void invalidate(const std::string& remoteDir);
    void pruneLocked();

    SessionManager& sessions_;
    const TransferOptions opt_;
    std::atomic<int> speedLimitKBps_;
    int hookToken_ = 0;

    mutable std::mutex mtx_;   // protects everything below
    std::condition_variable queueCv_;
    std::condition_variable idleCv_;
    std::deque<JobPtr> queue_;
    std::map<std::uint64_t, JobPtr> registry_;
    std::set<std::string> busyPaths_;
    std::map<std::uint64_t, int> unsettled_;   // per session
    std::vector<std::thread> workers_;
    bool stopping_ = false;
    std::uint64_t nextId_ = 1;

    std::mutex cbMutex_;
    JobListener listener_;
    InvalidateFn invalidate_;
};

} // namespace datadrift
