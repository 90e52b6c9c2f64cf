// Secret storage for profile credentials.
// On macOS uses Keychain; elsewhere secrets live only in this process.
#pragma once
#include <QString>
#include <optional>

class SecretStore {
public:
    // Store a secret under a logical key (e.g. "profile:Name:password").
    void setSecret(const QString& key, const QString& value);

    // Retrieve a secret if present.
    std::optional<QString> getSecret(const QString& key) const;

    void removeSecret(const QString& key);

    // Whether secrets survive a restart (Keychain available).
    static bool persistent();
};
