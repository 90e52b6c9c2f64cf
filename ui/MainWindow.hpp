// Declaration of the main window and its state/actions.
#pragma once
#include <QMainWindow>
#include <QFileSystemModel>
#include <QTreeView>
#include <QLineEdit>
#include <QAction>
#include <QPointer>
#include <memory>
#include "datadrift/RemoteController.hpp"
#include "ProfileStore.hpp"
#include "SecretStore.hpp"

class RemoteModel;              // fwd
class QModelIndex;              // fwd for slot signatures
class QToolBar;                 // fwd
class QPlainTextEdit;           // fwd
class QLabel;                   // fwd

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    MainWindow(datadrift::SessionManager::ClientFactory factory,
               const datadrift::TransferOptions& opt,
               QWidget* parent = nullptr);
    ~MainWindow();

private slots:
    void leftPathEntered();
    void rightPathEntered();
    void goUpLeft();
    void goUpRight();
    void refreshRight();

    void connectSftp();
    void disconnectSftp();
    void rightItemActivated(const QModelIndex& idx); // double click on remote
    void leftItemActivated(const QModelIndex& idx);  // double click on local (left)
    void uploadSelected();      // local -> remote
    void downloadSelected();    // remote -> local
    void openSelected();        // remote -> editor
    void saveEditor();          // editor -> remote
    void deleteRightSelected();
    void showQueue();
    void toggleShowHidden(bool on);

    void onTaskSettled(quint64 id);
    void onSessionState(int state);

private:
    // Connect on a helper thread while the UI keeps pumping events (host key prompts).
    bool establishSftpAsync(datadrift::SessionOptions opt, datadrift::Error& err);
    bool confirmHostKeyUI(const QString& host, quint16 port, const QString& algorithm, const QString& fingerprint);
    void applyRemoteConnectedUI(const datadrift::SessionInfo& info);
    void applyRemoteDisconnectedUI();
    void setLeftRoot(const QString& path);
    void showListing(const datadrift::DirectoryListing& listing);
    void openRemote(const QString& remotePath);
    void remoteError(const QString& title, const datadrift::Error& err);
    void updateActions();
    QStringList selectedRemotePaths(bool filesOnly) const;
    QStringList selectedLocalFiles() const;

    std::unique_ptr<datadrift::RemoteController> ctl_;
    ProfileStore profiles_;
    SecretStore secrets_;

    // Models
    QFileSystemModel* leftModel_   = nullptr;
    RemoteModel*      remoteModel_ = nullptr;

    // Views and path inputs
    QTreeView* leftView_  = nullptr;
    QTreeView* rightView_ = nullptr;
    QLineEdit* leftPath_  = nullptr;
    QLineEdit* rightPath_ = nullptr;

    // Editor pane
    QPlainTextEdit* editor_ = nullptr;
    QLabel* editorLabel_ = nullptr;
    QString editorPath_;        // remote file shown in the editor
    quint64 openJobId_ = 0;     // latest open request; older results are dropped
    quint64 saveJobId_ = 0;

    // Actions
    QAction* actConnect_    = nullptr;
    QAction* actDisconnect_ = nullptr;
    QAction* actUpLeft_     = nullptr;
    QAction* actUpRight_    = nullptr;
    QAction* actRefresh_    = nullptr;
    QAction* actUpload_     = nullptr;
    QAction* actDownload_   = nullptr;
    QAction* actOpen_       = nullptr;
    QAction* actSave_       = nullptr;
    QAction* actDelete_     = nullptr;
    QAction* actShowQueue_  = nullptr;
    QAction* actShowHidden_ = nullptr;

    // Transfer queue
    class TransferManager* transferMgr_ = nullptr;
    QPointer<class TransferQueueDialog> transferDlg_;

    bool connected_ = false;
    bool prefShowHidden_ = false;
};
