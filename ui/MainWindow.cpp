// DataDrift main window: local tree, remote table and a plain-text editor pane.
// Every remote action goes through the RemoteController; long operations run as
// transfer jobs and report back through TransferManager.
#include "MainWindow.hpp"
#include "ConnectionDialog.hpp"
#include "RemoteModel.hpp"
#include "TransferManager.hpp"
#include "TransferQueueDialog.hpp"
#include "datadrift/RemotePath.hpp"
#include <QApplication>
#include <QDir>
#include <QFileInfo>
#include <QHeaderView>
#include <QInputDialog>
#include <QKeySequence>
#include <QLabel>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QProgressDialog>
#include <QPushButton>
#include <QSettings>
#include <QSplitter>
#include <QStatusBar>
#include <QTextDocument>
#include <QToolBar>
#include <QVBoxLayout>
#include <atomic>
#include <chrono>
#include <thread>

using datadrift::Error;
using datadrift::JobKind;
using datadrift::JobState;
using datadrift::SessionState;

static constexpr int NAME_COL = 0;

static QString errText(const Error& e) {
    return QString::fromStdString(e.describe());
}

MainWindow::MainWindow(datadrift::SessionManager::ClientFactory factory,
                       const datadrift::TransferOptions& opt,
                       QWidget* parent)
    : QMainWindow(parent),
      ctl_(std::make_unique<datadrift::RemoteController>(std::move(factory), opt)) {
    QSettings s("DataDrift", "DataDrift");
    prefShowHidden_ = s.value("UI/showHidden", false).toBool();

    // Local model
    leftModel_ = new QFileSystemModel(this);
    QDir::Filters f = QDir::AllEntries | QDir::NoDotAndDotDot | QDir::AllDirs;
    if (prefShowHidden_) f = f | QDir::Hidden | QDir::System;
    leftModel_->setFilter(f);
    const QString home = QDir::homePath();
    leftModel_->setRootPath(home);

    remoteModel_ = new RemoteModel(this);
    remoteModel_->setShowHidden(prefShowHidden_);

    // Views
    leftView_  = new QTreeView(this);
    rightView_ = new QTreeView(this);
    leftView_->setModel(leftModel_);
    rightView_->setModel(remoteModel_);
    // Avoid expanding subtrees on double-click; navigate by changing root
    leftView_->setExpandsOnDoubleClick(false);
    leftView_->setRootIndex(leftModel_->index(home));
    rightView_->setRootIsDecorated(false);

    auto tuneView = [](QTreeView* v) {
        v->setSelectionMode(QAbstractItemView::ExtendedSelection);
        v->setSortingEnabled(true);
        v->sortByColumn(0, Qt::AscendingOrder);
        v->header()->setStretchLastSection(true);
        v->setColumnWidth(0, 280);
    };
    tuneView(leftView_);
    tuneView(rightView_);

    leftPath_  = new QLineEdit(home, this);
    rightPath_ = new QLineEdit(this);
    rightPath_->setPlaceholderText(tr("Not connected"));
    connect(leftPath_,  &QLineEdit::returnPressed, this, &MainWindow::leftPathEntered);
    connect(rightPath_, &QLineEdit::returnPressed, this, &MainWindow::rightPathEntered);

    // Editor pane
    editor_ = new QPlainTextEdit(this);
    editor_->setLineWrapMode(QPlainTextEdit::NoWrap);
    editor_->setReadOnly(true);
    editorLabel_ = new QLabel(tr("No file open"), this);

    // Main toolbar
    auto* tb = addToolBar(tr("Main"));
    tb->setToolButtonStyle(Qt::ToolButtonTextOnly);
    actConnect_    = tb->addAction(tr("Connect"), this, &MainWindow::connectSftp);
    actDisconnect_ = tb->addAction(tr("Disconnect"), this, &MainWindow::disconnectSftp);
    tb->addSeparator();
    actUpLeft_     = tb->addAction(tr("Local up"), this, &MainWindow::goUpLeft);
    actUpRight_    = tb->addAction(tr("Remote up"), this, &MainWindow::goUpRight);
    actRefresh_    = tb->addAction(tr("Refresh"), this, &MainWindow::refreshRight);
    tb->addSeparator();
    actUpload_     = tb->addAction(tr("Upload"), this, &MainWindow::uploadSelected);
    actDownload_   = tb->addAction(tr("Download"), this, &MainWindow::downloadSelected);
    actOpen_       = tb->addAction(tr("Open"), this, &MainWindow::openSelected);
    actSave_       = tb->addAction(tr("Save"), this, &MainWindow::saveEditor);
    actDelete_     = tb->addAction(tr("Delete"), this, &MainWindow::deleteRightSelected);
    tb->addSeparator();
    actShowQueue_  = tb->addAction(tr("Transfers"), this, &MainWindow::showQueue);
    actShowHidden_ = tb->addAction(tr("Hidden files"));
    actShowHidden_->setCheckable(true);
    actShowHidden_->setChecked(prefShowHidden_);
    connect(actShowHidden_, &QAction::toggled, this, &MainWindow::toggleShowHidden);

    actRefresh_->setShortcut(QKeySequence(Qt::Key_F5));
    actSave_->setShortcut(QKeySequence::Save);
    actDelete_->setShortcut(QKeySequence(Qt::Key_Delete));
    actDelete_->setShortcutContext(Qt::WidgetWithChildrenShortcut);
    rightView_->addAction(actDelete_);

    // Layout: local | (remote over editor)
    auto* leftPane = new QWidget(this);
    auto* leftLayout = new QVBoxLayout(leftPane);
    leftLayout->setContentsMargins(0, 0, 0, 0);
    leftLayout->addWidget(leftPath_);
    leftLayout->addWidget(leftView_);

    auto* remotePane = new QWidget(this);
    auto* remoteLayout = new QVBoxLayout(remotePane);
    remoteLayout->setContentsMargins(0, 0, 0, 0);
    remoteLayout->addWidget(rightPath_);
    remoteLayout->addWidget(rightView_);

    auto* editorPane = new QWidget(this);
    auto* editorLayout = new QVBoxLayout(editorPane);
    editorLayout->setContentsMargins(0, 0, 0, 0);
    editorLayout->addWidget(editorLabel_);
    editorLayout->addWidget(editor_);

    auto* rightSplit = new QSplitter(Qt::Vertical, this);
    rightSplit->addWidget(remotePane);
    rightSplit->addWidget(editorPane);

    auto* splitter = new QSplitter(this);
    splitter->addWidget(leftPane);
    splitter->addWidget(rightSplit);
    splitter->setStretchFactor(1, 1);
    setCentralWidget(splitter);

    connect(leftView_, &QTreeView::doubleClicked, this, &MainWindow::leftItemActivated);
    connect(rightView_, &QTreeView::doubleClicked, this, &MainWindow::rightItemActivated);
    connect(rightView_->selectionModel(), &QItemSelectionModel::selectionChanged, this, [this] { updateActions(); });
    connect(leftView_->selectionModel(), &QItemSelectionModel::selectionChanged, this, [this] { updateActions(); });
    connect(editor_, &QPlainTextEdit::modificationChanged, this, [this] { updateActions(); });

    // Transfer queue bridge
    transferMgr_ = new TransferManager(ctl_->transfers(), this);
    connect(transferMgr_, &TransferManager::taskSettled, this, &MainWindow::onTaskSettled);

    // Session state arrives from whichever thread changed it
    ctl_->sessions().addStateListener([this](SessionState st, std::uint64_t) {
        QMetaObject::invokeMethod(this, [this, st] { onSessionState(static_cast<int>(st)); }, Qt::QueuedConnection);
    });

    resize(1200, 760);
    setWindowTitle(tr("DataDrift"));
    updateActions();
    statusBar()->showMessage(tr("Ready"));
}

MainWindow::~MainWindow() {
    // Jobs must settle before the bridge that listens to them goes away
    ctl_->disconnect();
    delete transferDlg_.data();
    delete transferMgr_;
    transferMgr_ = nullptr;
}

void MainWindow::setLeftRoot(const QString& path) {
    QFileInfo fi(path);
    if (!fi.isDir()) {
        QMessageBox::warning(this, tr("Local folder"), tr("Not a folder: %1").arg(path));
        leftPath_->setText(leftModel_->rootPath());
        return;
    }
    const QString abs = fi.absoluteFilePath();
    leftModel_->setRootPath(abs);
    leftView_->setRootIndex(leftModel_->index(abs));
    leftPath_->setText(abs);
}

void MainWindow::leftPathEntered() {
    setLeftRoot(leftPath_->text().trimmed());
}

void MainWindow::goUpLeft() {
    QDir d(leftModel_->rootPath());
    if (d.cdUp()) setLeftRoot(d.absolutePath());
}

void MainWindow::leftItemActivated(const QModelIndex& idx) {
    const QFileInfo fi = leftModel_->fileInfo(idx);
    if (fi.isDir()) setLeftRoot(fi.absoluteFilePath());
}

void MainWindow::remoteError(const QString& title, const Error& err) {
    statusBar()->showMessage(errText(err), 6000);
    QMessageBox::warning(this, title, errText(err));
}

void MainWindow::showListing(const datadrift::DirectoryListing& listing) {
    remoteModel_->setListing(listing);
    rightPath_->setText(QString::fromStdString(listing.path));
    updateActions();
}

void MainWindow::rightPathEntered() {
    if (!connected_) return;
    datadrift::DirectoryListing l;
    Error err;
    if (!ctl_->navigate(rightPath_->text().trimmed().toStdString(), l, err)) {
        rightPath_->setText(QString::fromStdString(ctl_->currentPath()));
        remoteError(tr("Remote folder"), err);
        return;
    }
    showListing(l);
}

void MainWindow::goUpRight() {
    datadrift::DirectoryListing l;
    Error err;
    if (!ctl_->goUp(l, err)) {
        remoteError(tr("Remote folder"), err);
        return;
    }
    showListing(l);
}

void MainWindow::refreshRight() {
    datadrift::DirectoryListing l;
    Error err;
    if (!ctl_->refresh(l, err)) {
        remoteError(tr("Refresh"), err);
        return;
    }
    showListing(l);
}

void MainWindow::rightItemActivated(const QModelIndex& idx) {
    if (!idx.isValid()) return;
    const QString path = remoteModel_->pathAt(idx);
    if (remoteModel_->isDir(idx)) {
        datadrift::DirectoryListing l;
        Error err;
        if (!ctl_->navigate(path.toStdString(), l, err)) {
            remoteError(tr("Remote folder"), err);
            return;
        }
        showListing(l);
        return;
    }
    openRemote(path);
}

void MainWindow::connectSftp() {
    ConnectionDialog dlg(&profiles_, &secrets_, this);
    if (dlg.exec() != QDialog::Accepted) return;
    dlg.storeProfile();
    Error err;
    if (!establishSftpAsync(dlg.options(), err)) {
        QMessageBox::critical(this, tr("Connection error"), errText(err));
        return;
    }
    if (auto info = ctl_->session()) applyRemoteConnectedUI(*info);
}

void MainWindow::disconnectSftp() {
    if (editor_->document()->isModified()) {
        if (QMessageBox::question(this, tr("Disconnect"),
                                  tr("The editor has unsaved changes. Disconnect anyway?")) != QMessageBox::Yes)
            return;
    }
    // Waits for running jobs to observe the cancellation
    ctl_->disconnect();
    applyRemoteDisconnectedUI();
    statusBar()->showMessage(tr("Disconnected"), 3000);
}

bool MainWindow::confirmHostKeyUI(const QString& host, quint16 port, const QString& algorithm, const QString& fingerprint) {
    QMessageBox box(this);
    box.setIcon(QMessageBox::Question);
    box.setWindowTitle(tr("Confirm SSH fingerprint"));
    box.setText(tr("Connect to %1:%2\nAlgorithm: %3\nFingerprint: %4\n\nTrust and save to known_hosts?")
                    .arg(host)
                    .arg(port)
                    .arg(algorithm, fingerprint));
    QPushButton* btYes = box.addButton(tr("Trust"), QMessageBox::AcceptRole);
    box.addButton(tr("Cancel"), QMessageBox::RejectRole);
    box.exec();
    return box.clickedButton() == btYes;
}

bool MainWindow::establishSftpAsync(datadrift::SessionOptions opt, Error& err) {
    // Host key confirmation (TOFU) runs on the GUI thread
    opt.hostkey_confirm_cb = [this](const std::string& h, std::uint16_t p, const std::string& alg, const std::string& fp) {
        bool accepted = false;
        QMetaObject::invokeMethod(this, [&, h, p, alg, fp] {
            accepted = confirmHostKeyUI(QString::fromStdString(h), (quint16)p, QString::fromStdString(alg), QString::fromStdString(fp));
        }, Qt::BlockingQueuedConnection);
        return accepted;
    };

    // Keyboard-interactive: auto-fill user/password, ask for anything else (OTP codes).
    const std::string savedUser = opt.username;
    const std::string savedPass = opt.password ? *opt.password : std::string();
    opt.keyboard_interactive_cb = [this, savedUser, savedPass](const std::string&,
                                                               const std::string& instruction,
                                                               const std::vector<std::string>& prompts,
                                                               std::vector<std::string>& responses) -> bool {
        responses.clear();
        for (const std::string& p : prompts) {
            const QString qprompt = QString::fromStdString(p);
            const QString lower = qprompt.toLower();
            if (lower.contains("user") || lower.contains("name:")) {
                responses.emplace_back(savedUser);
                continue;
            }
            const bool secret = lower.contains("password") || lower.contains("passcode") ||
                                lower.contains("code") || lower.contains("token") || lower.contains("otp");
            if (lower.contains("password") && !savedPass.empty()) {
                responses.emplace_back(savedPass);
                continue;
            }
            QString title = tr("Information required");
            if (!instruction.empty()) title += " - " + QString::fromStdString(instruction);
            QString ans;
            bool ok = false;
            QMetaObject::invokeMethod(this, [&] {
                ans = QInputDialog::getText(this, title, qprompt, secret ? QLineEdit::Password : QLineEdit::Normal,
                                            QString(), &ok);
            }, Qt::BlockingQueuedConnection);
            if (!ok) return false;
            responses.emplace_back(ans.toUtf8().toStdString());
        }
        return responses.size() == prompts.size();
    };

    QProgressDialog progress(tr("Connecting…"), QString(), 0, 0, this);
    progress.setWindowModality(Qt::ApplicationModal);
    progress.setCancelButton(nullptr);
    progress.show();

    std::atomic<bool> done{false};
    bool okConn = false;
    datadrift::SessionInfo info;
    std::thread th([&] {
        okConn = ctl_->connect(opt, info, err);
        done = true;
    });
    while (!done) {
        qApp->processEvents(QEventLoop::AllEvents, 50);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    th.join();
    progress.close();
    return okConn;
}

void MainWindow::applyRemoteConnectedUI(const datadrift::SessionInfo& info) {
    connected_ = true;
    datadrift::DirectoryListing l;
    Error err;
    if (ctl_->currentListing(l, err)) {
        showListing(l);
    } else {
        remoteModel_->clear();
        rightPath_->setText(QString::fromStdString(ctl_->currentPath()));
        statusBar()->showMessage(tr("Could not list %1").arg(QString::fromStdString(info.start_path)), 6000);
    }
    setWindowTitle(tr("DataDrift - %1@%2").arg(QString::fromStdString(info.username),
                                               QString::fromStdString(info.host)));
    statusBar()->showMessage(tr("Connected (SFTP) to %1").arg(QString::fromStdString(info.host)), 4000);
    updateActions();
}

void MainWindow::applyRemoteDisconnectedUI() {
    connected_ = false;
    remoteModel_->clear();
    rightPath_->clear();
    editor_->setReadOnly(true);
    setWindowTitle(tr("DataDrift"));
    updateActions();
}

void MainWindow::onSessionState(int state) {
    const auto st = static_cast<SessionState>(state);
    if (st == SessionState::Failed && connected_) {
        // Connection lost under a live session; jobs are already cancelled
        const Error e = ctl_->sessions().lastError();
        connected_ = false;
        updateActions();
        statusBar()->showMessage(tr("Connection lost: %1").arg(errText(e)));
        QMessageBox::warning(this, tr("Connection lost"),
                             tr("%1\n\nReconnect to continue; canceled transfers can be retried.").arg(errText(e)));
    } else if (st == SessionState::Disconnected && connected_) {
        applyRemoteDisconnectedUI();
    }
}

QStringList MainWindow::selectedRemotePaths(bool filesOnly) const {
    QStringList out;
    auto* sel = rightView_->selectionModel();
    if (!sel) return out;
    for (const QModelIndex& idx : sel->selectedRows(NAME_COL)) {
        if (filesOnly && remoteModel_->isDir(idx)) continue;
        out << remoteModel_->pathAt(idx);
    }
    return out;
}

QStringList MainWindow::selectedLocalFiles() const {
    QStringList out;
    auto* sel = leftView_->selectionModel();
    if (!sel) return out;
    for (const QModelIndex& idx : sel->selectedRows(NAME_COL)) {
        const QFileInfo fi = leftModel_->fileInfo(idx);
        if (fi.isFile()) out << fi.absoluteFilePath();
    }
    return out;
}

void MainWindow::uploadSelected() {
    const QStringList files = selectedLocalFiles();
    if (files.isEmpty()) {
        statusBar()->showMessage(tr("Select local files to upload"), 3000);
        return;
    }
    const std::string remoteDir = ctl_->currentPath();
    int queued = 0;
    for (const QString& f : files) {
        Error err;
        if (!ctl_->upload(f.toStdString(), remoteDir, err)) {
            remoteError(tr("Upload"), err);
            continue;
        }
        ++queued;
    }
    if (queued > 0) statusBar()->showMessage(tr("Queued: %1 uploads").arg(queued), 3000);
}

void MainWindow::downloadSelected() {
    const QStringList paths = selectedRemotePaths(true);
    if (paths.isEmpty()) {
        statusBar()->showMessage(tr("Select remote files to download"), 3000);
        return;
    }
    const std::string localDir = leftModel_->rootPath().toStdString();
    int queued = 0;
    for (const QString& p : paths) {
        Error err;
        if (!ctl_->download(p.toStdString(), localDir, err)) {
            remoteError(tr("Download"), err);
            continue;
        }
        ++queued;
    }
    if (queued > 0) statusBar()->showMessage(tr("Queued: %1 downloads").arg(queued), 3000);
}

void MainWindow::openSelected() {
    const QStringList paths = selectedRemotePaths(true);
    if (paths.size() != 1) {
        statusBar()->showMessage(tr("Select one remote file to open"), 3000);
        return;
    }
    openRemote(paths.first());
}

void MainWindow::openRemote(const QString& remotePath) {
    if (editor_->document()->isModified() && editorPath_ != remotePath) {
        if (QMessageBox::question(this, tr("Open"),
                                  tr("Discard unsaved changes to %1?").arg(editorPath_)) != QMessageBox::Yes)
            return;
    }
    Error err;
    auto job = ctl_->open(remotePath.toStdString(), err);
    if (!job) {
        remoteError(tr("Open"), err);
        return;
    }
    openJobId_ = job->id();
    editorLabel_->setText(tr("Opening %1…").arg(remotePath));
}

void MainWindow::saveEditor() {
    if (editorPath_.isEmpty() || editor_->isReadOnly()) return;
    Error err;
    auto job = ctl_->save(editorPath_.toStdString(), editor_->toPlainText().toStdString(), err);
    if (!job) {
        remoteError(tr("Save"), err);
        return;
    }
    saveJobId_ = job->id();
    editorLabel_->setText(tr("Saving %1…").arg(editorPath_));
}

void MainWindow::deleteRightSelected() {
    const QStringList paths = selectedRemotePaths(false);
    if (paths.isEmpty()) return;
    const QString msg = paths.size() == 1 ? tr("Delete %1?").arg(paths.first())
                                          : tr("Delete %1 items?").arg(paths.size());
    if (QMessageBox::question(this, tr("Delete"), msg) != QMessageBox::Yes) return;
    for (const QString& p : paths) {
        Error err;
        if (!ctl_->remove(p.toStdString(), err)) remoteError(tr("Delete"), err);
    }
}

void MainWindow::showQueue() {
    if (!transferDlg_) transferDlg_ = new TransferQueueDialog(transferMgr_, this);
    transferDlg_->show();
    transferDlg_->raise();
    transferDlg_->activateWindow();
}

void MainWindow::toggleShowHidden(bool on) {
    prefShowHidden_ = on;
    QSettings s("DataDrift", "DataDrift");
    s.setValue("UI/showHidden", on);
    QDir::Filters f = QDir::AllEntries | QDir::NoDotAndDotDot | QDir::AllDirs;
    if (on) f = f | QDir::Hidden | QDir::System;
    leftModel_->setFilter(f);
    remoteModel_->setShowHidden(on);
}

void MainWindow::onTaskSettled(quint64 id) {
    auto job = ctl_->transfers().job(id);
    if (!job) return;
    const JobState st = job->state();
    const QString dest = QString::fromStdString(job->destination());

    if (job->kind() == JobKind::Open) {
        if (id != openJobId_) return; // superseded by a newer open
        if (st == JobState::Succeeded) {
            editor_->setPlainText(QString::fromStdString(job->text()));
            editor_->setReadOnly(false);
            editor_->document()->setModified(false);
            editorPath_ = dest;
            editorLabel_->setText(editorPath_);
        } else {
            editorLabel_->setText(editorPath_.isEmpty() ? tr("No file open") : editorPath_);
            if (st == JobState::Failed) remoteError(tr("Open"), job->error());
        }
        updateActions();
        return;
    }

    if (st == JobState::Succeeded) {
        switch (job->kind()) {
            case JobKind::Upload: statusBar()->showMessage(tr("Uploaded: %1").arg(dest), 4000); break;
            case JobKind::Download: statusBar()->showMessage(tr("Downloaded: %1").arg(dest), 4000); break;
            case JobKind::Save:
                statusBar()->showMessage(tr("Saved: %1").arg(dest), 4000);
                if (id == saveJobId_ && dest == editorPath_) {
                    editor_->document()->setModified(false);
                    editorLabel_->setText(editorPath_);
                }
                break;
            case JobKind::Delete: statusBar()->showMessage(tr("Deleted: %1").arg(dest), 4000); break;
            case JobKind::Open: break;
        }
        // The coordinator already invalidated the parent listing
        const bool mutating = job->kind() != JobKind::Download;
        if (mutating && connected_ &&
            datadrift::remotepath::parent(job->destination()) == ctl_->currentPath())
            refreshRight();
    } else if (st == JobState::Failed) {
        if (job->kind() == JobKind::Save && id == saveJobId_) editorLabel_->setText(editorPath_ + tr(" (not saved)"));
        statusBar()->showMessage(tr("%1 failed: %2").arg(QString::fromLatin1(datadrift::jobKindName(job->kind())),
                                                         errText(job->error())), 8000);
    } else if (st == JobState::Cancelled) {
        if (job->kind() == JobKind::Save && id == saveJobId_) editorLabel_->setText(editorPath_ + tr(" (not saved)"));
        statusBar()->showMessage(tr("%1 canceled: %2").arg(QString::fromLatin1(datadrift::jobKindName(job->kind())),
                                                           errText(job->error())), 5000);
    }
}

void MainWindow::updateActions() {
    auto hasSel = [](QTreeView* v) {
        return v->selectionModel() && !v->selectionModel()->selectedRows(NAME_COL).isEmpty();
    };
    const bool rightSel = hasSel(rightView_);
    actConnect_->setEnabled(true);
    actDisconnect_->setEnabled(connected_ || ctl_->session().has_value());
    actUpRight_->setEnabled(connected_);
    actRefresh_->setEnabled(connected_);
    actUpload_->setEnabled(connected_ && hasSel(leftView_));
    actDownload_->setEnabled(connected_ && rightSel);
    actOpen_->setEnabled(connected_ && rightSel);
    actDelete_->setEnabled(connected_ && rightSel);
    actSave_->setEnabled(connected_ && !editorPath_.isEmpty() && !editor_->isReadOnly() &&
                         editor_->document()->isModified());
}
