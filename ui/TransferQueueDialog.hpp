// Dialog to visualize and manage the transfer queue.
#pragma once
#include <QDialog>
#include <QTableWidget>
#include "TransferManager.hpp"

class QLabel;
class QPushButton;
class QSpinBox;

// Dialog to monitor and control the transfer queue.
// Allows canceling, retrying and limiting the global speed.
class TransferQueueDialog : public QDialog {
    Q_OBJECT
public:
    explicit TransferQueueDialog(TransferManager* mgr, QWidget* parent = nullptr);

private slots:
    void refresh();           // refresh table from manager
    void onRetrySelected();   // retry selected failed/canceled
    void onRetryAll();        // retry every failed/canceled
    void onClearDone();       // clear settled
    void onApplyGlobalSpeed();// apply global limit
    void onStopSelected();    // cancel selected tasks
    void onStopAll();         // cancel everything pending or running
    void showContextMenu(const QPoint& pos); // context menu on the table

private:
    void updateSummary();
    QVector<quint64> selectedIds() const;

    TransferManager* mgr_;             // source of truth for the queue
    QTableWidget* table_;              // table of tasks
    QLabel* summaryLabel_ = nullptr;   // summary at the bottom
    QPushButton* retrySelBtn_ = nullptr;
    QPushButton* retryBtn_ = nullptr;
    QPushButton* clearBtn_ = nullptr;
    QPushButton* closeBtn_ = nullptr;
    QPushButton* stopSelBtn_ = nullptr;
    QPushButton* stopAllBtn_ = nullptr;
    QSpinBox* speedSpin_ = nullptr;        // global limit value
    QPushButton* applySpeedBtn_ = nullptr; // apply global limit
};
