// Dialog to capture SFTP connection options (profile/host/port/user/key/known_hosts).
#pragma once
#include <QDialog>
#include "datadrift/SftpTypes.hpp"

class QLineEdit;
class QSpinBox;
class QComboBox;
class QPushButton;
class QCheckBox;
class ProfileStore;
class SecretStore;

class ConnectionDialog : public QDialog {
    Q_OBJECT
public:
    ConnectionDialog(ProfileStore* profiles, SecretStore* secrets, QWidget* parent = nullptr);
    datadrift::SessionOptions options() const;
    void setOptions(const datadrift::SessionOptions& opt);

    // Selects a saved profile and fills the form from it.
    void selectProfile(const QString& name);
    // Name to save the options under; empty when "Save as profile" is unchecked.
    QString profileName() const;
    bool rememberSecrets() const;

    // Persists the profile (never its secrets) and caches secrets when requested.
    void storeProfile() const;

private slots:
    void onProfileChosen(int index);
    void onDeleteProfile();

private:
    void reloadProfiles();

    ProfileStore* profiles_ = nullptr;  // not owned
    SecretStore* secrets_ = nullptr;    // not owned

    QComboBox* profile_ = nullptr;
    QPushButton* delProfile_ = nullptr;
    QLineEdit* host_ = nullptr;
    QSpinBox* port_ = nullptr;
    QLineEdit* user_ = nullptr;
    QLineEdit* pass_ = nullptr;
    QLineEdit* keyPath_ = nullptr;   // path to ~/.ssh/id_ed25519 or similar
    QLineEdit* keyPass_ = nullptr;   // key passphrase (if any)
    QLineEdit* startPath_ = nullptr;

    // known_hosts
    QLineEdit* khPath_ = nullptr;
    QPushButton* khBrowse_ = nullptr;
    QComboBox* khPolicy_ = nullptr;

    QCheckBox* saveProfile_ = nullptr;
    QLineEdit* saveName_ = nullptr;
    QCheckBox* remember_ = nullptr;
};
