// Persisted connection profiles (QSettings array "profiles"). Secrets never go here.
#pragma once
#include <QString>
#include <QVector>
#include <memory>
#include "datadrift/SftpTypes.hpp"

class QSettings;

struct ConnectionProfile {
    QString name;
    datadrift::SessionOptions opt;   // password/passphrase are ignored on save
};

class ProfileStore {
public:
    // Application scope (DataDrift/DataDrift).
    ProfileStore();
    // INI file at iniPath; used by the tests.
    explicit ProfileStore(const QString& iniPath);
    ~ProfileStore();

    QVector<ConnectionProfile> load() const;
    void save(const QVector<ConnectionProfile>& profiles);

    bool find(const QString& name, ConnectionProfile& out) const;
    // Adds or replaces by name.
    void upsert(const ConnectionProfile& p);
    bool remove(const QString& name);

    // SecretStore keys for a profile's credentials.
    static QString passwordKey(const QString& name);
    static QString passphraseKey(const QString& name);

private:
    std::unique_ptr<QSettings> s_;
};
