// Asynchronous upload/download/open/save/delete job as seen by callers.
#pragma once
#include "Error.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace datadrift {

enum class JobKind { Upload, Download, Open, Save, Delete };
enum class JobState { Pending, Running, Succeeded, Failed, Cancelled };

const char* jobKindName(JobKind k);
const char* jobStateName(JobState s);

// Copyable view of a job for queue displays and listeners.
struct JobSnapshot {
    std::uint64_t id = 0;
    JobKind       kind = JobKind::Upload;
    std::uint64_t sessionId = 0;
    std::string   source;
    std::string   destination;
    JobState      state = JobState::Pending;
    std::uint64_t bytesDone = 0;
    std::uint64_t bytesTotal = 0;   // 0 when unknown
    int           attempt = 1;
    Error         error;
};

class TransferJob {
public:
    std::uint64_t id() const { return id_; }
    JobKind kind() const { return kind_; }
    std::uint64_t sessionId() const { return sessionId_; }
    // Upload: local file / remote file. Download: remote file / local file.
    // Open, save and delete: the remote path in both.
    const std::string& source() const { return source_; }
    const std::string& destination() const { return destination_; }
    int attempt() const { return attempt_; }

    JobState state() const;
    bool settled() const;
    std::uint64_t bytesDone() const { return done_.load(); }
    std::uint64_t bytesTotal() const { return total_.load(); }
    Error error() const;
    // Decoded text of a succeeded open job.
    std::string text() const;
    JobSnapshot snapshot() const;

    // Honoured before start or at the next chunk boundary.
    void cancel();
    bool cancelRequested() const { return cancel_.load(); }

    void wait() const;
    // False on timeout.
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    friend class TransferCoordinator;

    TransferJob(std::uint64_t id, JobKind kind, std::uint64_t sessionId,
                std::string source, std::string destination, int attempt);

    void requestCancel(const Error& cause);
    Error cancelCause() const;
    void setRunning();
    void setTotal(std::uint64_t total) { total_.store(total); }
    void advance(std::uint64_t n) { done_.fetch_add(n); }
    void finish(JobState state, const Error& err, std::string text = std::string());
    bool finishedBefore(std::chrono::steady_clock::time_point cutoff) const;

    const std::uint64_t id_;
    const JobKind kind_;
    const std::uint64_t sessionId_;
    const std::string source_;
    const std::string destination_;
    const int attempt_;
    std::string content_;   // save payload, kept for retry

    std::atomic<std::uint64_t> done_{0};
    std::atomic<std::uint64_t> total_{0};
    std::atomic<bool> cancel_{false};

    mutable std::mutex m_;
    mutable std::condition_variable cv_;
    JobState state_ = JobState::Pending;
    Error error_;
    Error cancelCause_;
    std::string text_;
    std::chrono::steady_clock::time_point finishedAt_{};
};

using JobPtr = std::shared_ptr<TransferJob>;

} // namespace datadrift
