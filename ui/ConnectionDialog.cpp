// Builds the connection form and exposes SessionOptions getters/setters.
#include "ConnectionDialog.hpp"
#include "ProfileStore.hpp"
#include "SecretStore.hpp"
#include <QCheckBox>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QDir>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSpinBox>

ConnectionDialog::ConnectionDialog(ProfileStore* profiles, SecretStore* secrets, QWidget* parent)
    : QDialog(parent), profiles_(profiles), secrets_(secrets) {
    setWindowTitle(tr("Connect (SFTP)"));
    auto* lay = new QFormLayout(this);

    // Saved profiles
    auto* profRow = new QWidget(this);
    auto* profLay = new QHBoxLayout(profRow);
    profLay->setContentsMargins(0, 0, 0, 0);
    profile_ = new QComboBox(profRow);
    delProfile_ = new QPushButton(tr("Delete"), profRow);
    profLay->addWidget(profile_, 1);
    profLay->addWidget(delProfile_);
    lay->addRow(tr("Profile:"), profRow);

    host_ = new QLineEdit(this);
    port_ = new QSpinBox(this);
    user_ = new QLineEdit(this);
    pass_ = new QLineEdit(this);
    keyPath_ = new QLineEdit(this);
    keyPass_ = new QLineEdit(this);
    startPath_ = new QLineEdit(this);

    // Useful defaults
    host_->setText("localhost");
    port_->setRange(1, 65535);
    port_->setValue(22);
    user_->setText(QString::fromLocal8Bit(qgetenv("USER")));
    startPath_->setText("/");

    pass_->setEchoMode(QLineEdit::Password);
    keyPass_->setEchoMode(QLineEdit::Password);

    lay->addRow(tr("Host:"), host_);
    lay->addRow(tr("Port:"), port_);
    lay->addRow(tr("User:"), user_);
    lay->addRow(tr("Password:"), pass_);
    lay->addRow(tr("Private key:"), keyPath_);
    lay->addRow(tr("Key passphrase:"), keyPass_);
    lay->addRow(tr("Start directory:"), startPath_);

    auto* browseBtn = new QPushButton(tr("Choose key…"), this);
    lay->addRow("", browseBtn);
    connect(browseBtn, &QPushButton::clicked, this, [this] {
        const QString f = QFileDialog::getOpenFileName(this, tr("Select private key"), QDir::homePath() + "/.ssh");
        if (!f.isEmpty()) keyPath_->setText(f);
    });

    // known_hosts
    khPath_ = new QLineEdit(this);
    khPolicy_ = new QComboBox(this);
    khPolicy_->addItem(tr("Strict"), static_cast<int>(datadrift::KnownHostsPolicy::Strict));
    khPolicy_->addItem(tr("Accept new (TOFU)"), static_cast<int>(datadrift::KnownHostsPolicy::AcceptNew));
    khPolicy_->addItem(tr("No verification (not recommended)"), static_cast<int>(datadrift::KnownHostsPolicy::Off));
    lay->addRow(tr("known_hosts:"), khPath_);
    lay->addRow(tr("Policy:"), khPolicy_);

    khBrowse_ = new QPushButton(tr("Choose known_hosts…"), this);
    lay->addRow("", khBrowse_);
    connect(khBrowse_, &QPushButton::clicked, this, [this] {
        const QString f = QFileDialog::getOpenFileName(this, tr("Select known_hosts"), QDir::homePath() + "/.ssh");
        if (!f.isEmpty()) khPath_->setText(f);
    });

    // Saving
    saveProfile_ = new QCheckBox(tr("Save as profile"), this);
    saveName_ = new QLineEdit(this);
    saveName_->setEnabled(false);
    remember_ = new QCheckBox(SecretStore::persistent() ? tr("Remember password in Keychain")
                                                        : tr("Remember password for this session"), this);
    lay->addRow(saveProfile_, saveName_);
    lay->addRow("", remember_);
    connect(saveProfile_, &QCheckBox::toggled, saveName_, &QLineEdit::setEnabled);

    auto* bb = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    lay->addRow(bb);
    connect(bb, &QDialogButtonBox::accepted, this, [this] {
        if (host_->text().trimmed().isEmpty() || user_->text().trimmed().isEmpty()) {
            QMessageBox::warning(this, tr("Connect"), tr("Host and user are required."));
            return;
        }
        if (saveProfile_->isChecked() && saveName_->text().trimmed().isEmpty()) {
            QMessageBox::warning(this, tr("Connect"), tr("Enter a name for the profile."));
            return;
        }
        accept();
    });
    connect(bb, &QDialogButtonBox::rejected, this, &QDialog::reject);

    reloadProfiles();
    connect(profile_, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &ConnectionDialog::onProfileChosen);
    connect(delProfile_, &QPushButton::clicked, this, &ConnectionDialog::onDeleteProfile);
}

void ConnectionDialog::reloadProfiles() {
    QSignalBlocker block(profile_);
    profile_->clear();
    profile_->addItem(tr("(new connection)"), QString());
    if (profiles_) {
        for (const auto& p : profiles_->load()) profile_->addItem(p.name, p.name);
    }
    profile_->setCurrentIndex(0);
    delProfile_->setEnabled(false);
}

void ConnectionDialog::onProfileChosen(int index) {
    const QString name = profile_->itemData(index).toString();
    delProfile_->setEnabled(!name.isEmpty());
    if (name.isEmpty() || !profiles_) return;
    ConnectionProfile p;
    if (!profiles_->find(name, p)) return;

    pass_->clear();
    keyPass_->clear();
    keyPath_->clear();
    khPath_->clear();
    if (secrets_) {
        if (auto pw = secrets_->getSecret(ProfileStore::passwordKey(name)))
            p.opt.password = pw->toStdString();
        if (auto kp = secrets_->getSecret(ProfileStore::passphraseKey(name)))
            p.opt.private_key_passphrase = kp->toStdString();
    }
    setOptions(p.opt);
    saveProfile_->setChecked(true);
    saveName_->setText(name);
    remember_->setChecked(p.opt.password.has_value() || p.opt.private_key_passphrase.has_value());
}

void ConnectionDialog::onDeleteProfile() {
    const QString name = profile_->currentData().toString();
    if (name.isEmpty() || !profiles_) return;
    if (QMessageBox::question(this, tr("Delete profile"), tr("Delete profile \"%1\"?").arg(name)) != QMessageBox::Yes)
        return;
    profiles_->remove(name);
    if (secrets_) {
        secrets_->removeSecret(ProfileStore::passwordKey(name));
        secrets_->removeSecret(ProfileStore::passphraseKey(name));
    }
    reloadProfiles();
}

void ConnectionDialog::selectProfile(const QString& name) {
    const int idx = profile_->findData(name);
    if (idx >= 0) profile_->setCurrentIndex(idx);
}

QString ConnectionDialog::profileName() const {
    return saveProfile_->isChecked() ? saveName_->text().trimmed() : QString();
}

bool ConnectionDialog::rememberSecrets() const {
    return remember_->isChecked();
}

void ConnectionDialog::storeProfile() const {
    const QString name = profileName();
    if (name.isEmpty() || !profiles_) return;
    ConnectionProfile p;
    p.name = name;
    p.opt = options();
    p.opt.password.reset();
    p.opt.private_key_passphrase.reset();
    profiles_->upsert(p);

    if (!secrets_) return;
    const QString pwKey = ProfileStore::passwordKey(name);
    const QString kpKey = ProfileStore::passphraseKey(name);
    if (rememberSecrets()) {
        if (!pass_->text().isEmpty()) secrets_->setSecret(pwKey, pass_->text());
        else secrets_->removeSecret(pwKey);
        if (!keyPass_->text().isEmpty()) secrets_->setSecret(kpKey, keyPass_->text());
        else secrets_->removeSecret(kpKey);
    } else {
        secrets_->removeSecret(pwKey);
        secrets_->removeSecret(kpKey);
    }
}

datadrift::SessionOptions ConnectionDialog::options() const {
    datadrift::SessionOptions o;
    o.host     = host_->text().trimmed().toStdString();
    o.port     = static_cast<std::uint16_t>(port_->value());
    o.username = user_->text().trimmed().toStdString();

    if (!pass_->text().isEmpty())
        o.password = pass_->text().toUtf8().toStdString();
    if (!keyPath_->text().isEmpty())
        o.private_key_path = keyPath_->text().toStdString();
    if (!keyPass_->text().isEmpty())
        o.private_key_passphrase = keyPass_->text().toUtf8().toStdString();
    if (!startPath_->text().trimmed().isEmpty())
        o.start_path = startPath_->text().trimmed().toStdString();

    if (!khPath_->text().isEmpty())
        o.known_hosts_path = khPath_->text().toStdString();
    o.known_hosts_policy = static_cast<datadrift::KnownHostsPolicy>(khPolicy_->currentData().toInt());

    return o;
}

void ConnectionDialog::setOptions(const datadrift::SessionOptions& o) {
    if (!o.host.empty()) host_->setText(QString::fromStdString(o.host));
    if (o.port) port_->setValue((int)o.port);
    if (!o.username.empty()) user_->setText(QString::fromStdString(o.username));
    if (o.password && !o.password->empty()) pass_->setText(QString::fromStdString(*o.password));
    if (o.private_key_path && !o.private_key_path->empty()) keyPath_->setText(QString::fromStdString(*o.private_key_path));
    if (o.private_key_passphrase && !o.private_key_passphrase->empty()) keyPass_->setText(QString::fromStdString(*o.private_key_passphrase));
    if (!o.start_path.empty()) startPath_->setText(QString::fromStdString(o.start_path));
    if (o.known_hosts_path && !o.known_hosts_path->empty()) khPath_->setText(QString::fromStdString(*o.known_hosts_path));
    int idx = khPolicy_->findData(static_cast<int>(o.known_hosts_policy));
    if (idx >= 0) khPolicy_->setCurrentIndex(idx);
}
