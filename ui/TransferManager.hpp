// Qt bridge over the core TransferCoordinator: keeps a GUI-thread snapshot of the queue.
#pragma once
#include <QObject>
#include <QVector>
#include <atomic>
#include "datadrift/TransferCoordinator.hpp"

class TransferManager : public QObject {
    Q_OBJECT
public:
    explicit TransferManager(datadrift::TransferCoordinator& coord, QObject* parent = nullptr);
    ~TransferManager();

    // Global speed limit (KB/s). 0 = unlimited
    void setGlobalSpeedLimitKBps(int kbps) { coord_.setSpeedLimitKBps(kbps); }
    int globalSpeedLimitKBps() const { return coord_.speedLimitKBps(); }

    void cancelTask(quint64 id);
    void cancelAll();
    // Resubmits a failed/canceled job. False (with err) when refused.
    bool retryTask(quint64 id, datadrift::Error& err);
    void retryFailed();
    void clearCompleted();

    // Snapshot as of the last tasksChanged().
    const QVector<datadrift::JobSnapshot>& tasks() const { return tasks_; }

signals:
    // Emitted when the task list/state changes (to refresh the UI)
    void tasksChanged();
    // A job reached Succeeded, Failed or Cancelled.
    void taskSettled(quint64 id);

public slots:
    void refresh();

private:
    datadrift::TransferCoordinator& coord_;
    QVector<datadrift::JobSnapshot> tasks_;
    std::atomic<bool> refreshQueued_{false};
};
