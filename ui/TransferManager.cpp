// Listener events arrive on worker threads and are replayed on the GUI thread.
#include "TransferManager.hpp"
#include <QMetaObject>

using datadrift::JobSnapshot;
using datadrift::JobState;

static bool isSettled(JobState s) {
    return s == JobState::Succeeded || s == JobState::Failed || s == JobState::Cancelled;
}

TransferManager::TransferManager(datadrift::TransferCoordinator& coord, QObject* parent)
    : QObject(parent), coord_(coord) {
    coord_.setJobListener([this](const JobSnapshot& job) {
        // Coalesce progress bursts into one refresh per event loop turn
        if (!refreshQueued_.exchange(true))
            QMetaObject::invokeMethod(this, "refresh", Qt::QueuedConnection);
        if (isSettled(job.state)) {
            const quint64 id = job.id;
            QMetaObject::invokeMethod(this, [this, id] { emit taskSettled(id); }, Qt::QueuedConnection);
        }
    });
    refresh();
}

TransferManager::~TransferManager() {
    coord_.setJobListener(nullptr);
}

void TransferManager::refresh() {
    refreshQueued_.store(false);
    const auto jobs = coord_.jobs();
    tasks_.clear();
    tasks_.reserve((int)jobs.size());
    for (const auto& j : jobs) tasks_.push_back(j);
    emit tasksChanged();
}

void TransferManager::cancelTask(quint64 id) {
    if (auto j = coord_.job(id)) j->cancel();
}

void TransferManager::cancelAll() {
    coord_.cancelAll();
}

bool TransferManager::retryTask(quint64 id, datadrift::Error& err) {
    const bool ok = coord_.retry(id, err) != nullptr;
    refresh();
    return ok;
}

void TransferManager::retryFailed() {
    for (const auto& t : tasks_) {
        if (t.state != JobState::Failed && t.state != JobState::Cancelled) continue;
        datadrift::Error err;
        // Jobs past their attempt limit stay in the list as they are
        if (coord_.retry(t.id, err)) coord_.forget(t.id);
    }
    refresh();
}

void TransferManager::clearCompleted() {
    coord_.clearCompleted();
    refresh();
}
