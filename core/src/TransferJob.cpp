#include "datadrift/TransferJob.hpp"

namespace datadrift {

const char* jobKindName(JobKind k) {
    switch (k) {
        case JobKind::Upload:   return "upload";
        case JobKind::Download: return "download";
        case JobKind::Open:     return "open";
        case JobKind::Save:     return "save";
        case JobKind::Delete:   return "delete";
    }
    return "?";
}

const char* jobStateName(JobState s) {
    switch (s) {
        case JobState::Pending:   return "Pending";
        case JobState::Running:   return "Running";
        case JobState::Succeeded: return "Succeeded";
        case JobState::Failed:    return "Failed";
        case JobState::Cancelled: return "Cancelled";
    }
    return "?";
}

TransferJob::TransferJob(std::uint64_t id, JobKind kind, std::uint64_t sessionId,
                         std::string source, std::string destination, int attempt)
    : id_(id), kind_(kind), sessionId_(sessionId),
      source_(std::move(source)), destination_(std::move(destination)), attempt_(attempt) {}

JobState TransferJob::state() const {
    std::lock_guard<std::mutex> lk(m_);
    return state_;
}

bool TransferJob::settled() const {
    const JobState s = state();
    return s == JobState::Succeeded || s == JobState::Failed || s == JobState::Cancelled;
}

Error TransferJob::error() const {
    std::lock_guard<std::mutex> lk(m_);
    return error_;
}

std::string TransferJob::text() const {
    std::lock_guard<std::mutex> lk(m_);
    return text_;
}

JobSnapshot TransferJob::snapshot() const {
    JobSnapshot s;
    s.id = id_;
    s.kind = kind_;
    s.sessionId = sessionId_;
    s.source = source_;
    s.destination = destination_;
    s.attempt = attempt_;
    s.bytesDone = done_.load();
    s.bytesTotal = total_.load();
    std::lock_guard<std::mutex> lk(m_);
    s.state = state_;
    s.error = error_;
    return s;
}

void TransferJob::cancel() {
    requestCancel(makeError(ErrorKind::Cancelled, "cancelled by user"));
}

void TransferJob::requestCancel(const Error& cause) {
    std::lock_guard<std::mutex> lk(m_);
    if (cancel_.load()) return;
    cancelCause_ = cause;
    cancel_.store(true);
}

Error TransferJob::cancelCause() const {
    std::lock_guard<std::mutex> lk(m_);
    return cancelCause_;
}

void TransferJob::setRunning() {
    std::lock_guard<std::mutex> lk(m_);
    if (state_ == JobState::Pending) state_ = JobState::Running;
}

void TransferJob::finish(JobState state, const Error& err, std::string text) {
    {
        std::lock_guard<std::mutex> lk(m_);
        state_ = state;
        error_ = err;
        text_ = std::move(text);
        finishedAt_ = std::chrono::steady_clock::now();
    }
    cv_.notify_all();
}

bool TransferJob::finishedBefore(std::chrono::steady_clock::time_point cutoff) const {
    std::lock_guard<std::mutex> lk(m_);
    const bool done = state_ == JobState::Succeeded || state_ == JobState::Failed ||
                      state_ == JobState::Cancelled;
    return done && finishedAt_ < cutoff;
}

void TransferJob::wait() const {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait(lk, [this] {
        return state_ == JobState::Succeeded || state_ == JobState::Failed ||
               state_ == JobState::Cancelled;
    });
}

bool TransferJob::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(m_);
    return cv_.wait_for(lk, timeout, [this] {
        return state_ == JobState::Succeeded || state_ == JobState::Failed ||
               state_ == JobState::Cancelled;
    });
}

} // namespace datadrift
