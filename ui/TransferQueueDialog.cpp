// Table with per-job state and actions (cancel/retry/clear).
#include "TransferQueueDialog.hpp"
#include <QAbstractItemView>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLocale>
#include <QMenu>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QTableWidgetItem>
#include <QVBoxLayout>

using datadrift::JobKind;
using datadrift::JobState;

TransferQueueDialog::TransferQueueDialog(TransferManager* mgr, QWidget* parent)
  : QDialog(parent), mgr_(mgr) {
  setWindowTitle(tr("Transfer queue"));
  resize(820, 380);
  setSizeGripEnabled(true);

  auto* lay = new QVBoxLayout(this);

  table_ = new QTableWidget(this);
  table_->setColumnCount(7);
  table_->setHorizontalHeaderLabels({ tr("Type"), tr("Source"), tr("Destination"), tr("State"), tr("Progress"), tr("Attempt"), tr("Error") });
  table_->horizontalHeader()->setStretchLastSection(true);
  table_->verticalHeader()->setVisible(false);
  table_->setSelectionBehavior(QAbstractItemView::SelectRows);
  table_->setSelectionMode(QAbstractItemView::ExtendedSelection);
  table_->setEditTriggers(QAbstractItemView::NoEditTriggers);
  table_->setAlternatingRowColors(true);
  table_->setContextMenuPolicy(Qt::CustomContextMenu);
  lay->addWidget(table_);

  // Row 1: controls
  auto* controls = new QWidget(this);
  auto* hb = new QHBoxLayout(controls);
  hb->setContentsMargins(0,0,0,0);
  stopAllBtn_  = new QPushButton(tr("Cancel all"), controls);
  stopSelBtn_  = new QPushButton(tr("Cancel sel."), controls);
  retrySelBtn_ = new QPushButton(tr("Retry sel."), controls);
  retryBtn_    = new QPushButton(tr("Retry all"), controls);
  clearBtn_    = new QPushButton(tr("Clear finished"), controls);
  closeBtn_    = new QPushButton(tr("Close"), controls);
  hb->addWidget(stopAllBtn_);
  hb->addWidget(stopSelBtn_);
  hb->addWidget(retrySelBtn_);
  hb->addWidget(retryBtn_);
  hb->addWidget(clearBtn_);
  hb->addWidget(closeBtn_);
  hb->addStretch();
  lay->addWidget(controls);

  // Row 2: global speed
  auto* speedRow = new QWidget(this);
  auto* hs2 = new QHBoxLayout(speedRow);
  hs2->setContentsMargins(0,0,0,0);
  speedSpin_ = new QSpinBox(speedRow);
  speedSpin_->setRange(0, 1'000'000);
  speedSpin_->setValue(mgr_->globalSpeedLimitKBps());
  speedSpin_->setSuffix(" KB/s");
  speedSpin_->setSpecialValueText(tr("Unlimited"));
  applySpeedBtn_ = new QPushButton(tr("Apply speed"), speedRow);
  hs2->addWidget(new QLabel(tr("Speed:"), speedRow));
  hs2->addWidget(speedSpin_);
  hs2->addWidget(applySpeedBtn_);
  hs2->addStretch();
  lay->addWidget(speedRow);

  summaryLabel_ = new QLabel(this);
  summaryLabel_->setWordWrap(true);
  lay->addWidget(summaryLabel_);

  connect(applySpeedBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onApplyGlobalSpeed);
  connect(stopSelBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onStopSelected);
  connect(stopAllBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onStopAll);
  connect(retrySelBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onRetrySelected);
  connect(retryBtn_,  &QPushButton::clicked, this, &TransferQueueDialog::onRetryAll);
  connect(clearBtn_,  &QPushButton::clicked, this, &TransferQueueDialog::onClearDone);
  connect(closeBtn_,  &QPushButton::clicked, this, &QDialog::reject);

  connect(mgr_, &TransferManager::tasksChanged, this, &TransferQueueDialog::refresh);
  connect(table_->selectionModel(), &QItemSelectionModel::selectionChanged, this, &TransferQueueDialog::updateSummary);
  connect(table_, &QTableWidget::customContextMenuRequested, this, &TransferQueueDialog::showContextMenu);
  refresh();
}

static QString kindText(JobKind k) {
  switch (k) {
    case JobKind::Upload: return TransferQueueDialog::tr("Upload");
    case JobKind::Download: return TransferQueueDialog::tr("Download");
    case JobKind::Open: return TransferQueueDialog::tr("Open");
    case JobKind::Save: return TransferQueueDialog::tr("Save");
    case JobKind::Delete: return TransferQueueDialog::tr("Delete");
  }
  return {};
}

static QString statusText(JobState s) {
  switch (s) {
    case JobState::Pending: return TransferQueueDialog::tr("Queued");
    case JobState::Running: return TransferQueueDialog::tr("In progress");
    case JobState::Succeeded: return TransferQueueDialog::tr("Completed");
    case JobState::Failed: return TransferQueueDialog::tr("Error");
    case JobState::Cancelled: return TransferQueueDialog::tr("Canceled");
  }
  return {};
}

void TransferQueueDialog::refresh() {
  const auto& tasks = mgr_->tasks();
  table_->setRowCount(tasks.size());
  for (int i = 0; i < tasks.size(); ++i) {
    const auto& t = tasks[i];
    auto* kindItem = new QTableWidgetItem(kindText(t.kind));
    kindItem->setData(Qt::UserRole, QVariant::fromValue<qulonglong>(t.id));
    table_->setItem(i, 0, kindItem);
    table_->setItem(i, 1, new QTableWidgetItem(QString::fromStdString(t.source)));
    table_->setItem(i, 2, new QTableWidgetItem(QString::fromStdString(t.destination)));
    table_->setItem(i, 3, new QTableWidgetItem(statusText(t.state)));
    QString progress;
    if (t.bytesTotal > 0)
      progress = QString::number((int)(t.bytesDone * 100 / t.bytesTotal)) + "%";
    else if (t.bytesDone > 0)
      progress = QLocale().formattedDataSize((qint64)t.bytesDone, 1, QLocale::DataSizeIecFormat);
    table_->setItem(i, 4, new QTableWidgetItem(progress));
    table_->setItem(i, 5, new QTableWidgetItem(QString::number(t.attempt)));
    table_->setItem(i, 6, new QTableWidgetItem(t.error.ok() ? QString() : QString::fromStdString(t.error.describe())));
  }
  updateSummary();
}

QVector<quint64> TransferQueueDialog::selectedIds() const {
  QVector<quint64> ids;
  auto sel = table_->selectionModel();
  if (!sel || !sel->hasSelection()) return ids;
  for (const QModelIndex& r : sel->selectedRows()) {
    if (auto* it = table_->item(r.row(), 0)) ids.push_back(it->data(Qt::UserRole).toULongLong());
  }
  return ids;
}

void TransferQueueDialog::onRetrySelected() {
  QStringList refused;
  for (quint64 id : selectedIds()) {
    datadrift::Error err;
    if (!mgr_->retryTask(id, err)) refused << QString::fromStdString(err.describe());
  }
  if (!refused.isEmpty())
    QMessageBox::information(this, tr("Retry"), refused.join('\n'));
}

void TransferQueueDialog::onRetryAll() { mgr_->retryFailed(); }
void TransferQueueDialog::onClearDone() { mgr_->clearCompleted(); }

void TransferQueueDialog::onApplyGlobalSpeed() {
  mgr_->setGlobalSpeedLimitKBps(speedSpin_->value());
  updateSummary();
}

void TransferQueueDialog::onStopSelected() {
  for (quint64 id : selectedIds()) mgr_->cancelTask(id);
}

void TransferQueueDialog::onStopAll() {
  mgr_->cancelAll();
}

void TransferQueueDialog::updateSummary() {
  const auto& tasks = mgr_->tasks();
  int queued = 0, running = 0, done = 0, error = 0, canceled = 0;
  for (const auto& t : tasks) {
    switch (t.state) {
      case JobState::Pending: queued++; break;
      case JobState::Running: running++; break;
      case JobState::Succeeded: done++; break;
      case JobState::Failed: error++; break;
      case JobState::Cancelled: canceled++; break;
    }
  }
  QString summary = tr("Total: %1  |  Queued: %2  |  In progress: %3  |  Error: %4  |  Canceled: %5  |  Completed: %6")
                    .arg(tasks.size())
                    .arg(queued)
                    .arg(running)
                    .arg(error)
                    .arg(canceled)
                    .arg(done);
  const int gkb = mgr_->globalSpeedLimitKBps();
  if (gkb > 0) summary += tr("  |  Global limit: %1 KB/s").arg(gkb);
  summaryLabel_->setText(summary);

  const bool hasSel = table_->selectionModel() && table_->selectionModel()->hasSelection();
  retryBtn_->setEnabled((error + canceled) > 0);
  clearBtn_->setEnabled((done + error + canceled) > 0);
  stopAllBtn_->setEnabled((queued + running) > 0);
  retrySelBtn_->setEnabled(hasSel);
  stopSelBtn_->setEnabled(hasSel);
}

void TransferQueueDialog::showContextMenu(const QPoint& pos) {
  QModelIndex idx = table_->indexAt(pos);
  if (!idx.isValid()) return;
  // If the clicked row is not selected, select only that row
  if (!table_->selectionModel()->isSelected(idx)) {
    table_->clearSelection();
    table_->selectRow(idx.row());
  }

  QMenu menu(this);
  QAction* actRetrySel  = menu.addAction(tr("Retry sel."));
  QAction* actCancelSel = menu.addAction(tr("Cancel sel."));
  QAction* chosen = menu.exec(table_->viewport()->mapToGlobal(pos));
  if (!chosen) return;
  if (chosen == actRetrySel) onRetrySelected();
  else if (chosen == actCancelSel) onStopSelected();
}
