// Profile persistence over QSettings arrays.
#include "ProfileStore.hpp"
#include <QSettings>
#include <algorithm>

ProfileStore::ProfileStore() : s_(std::make_unique<QSettings>("DataDrift", "DataDrift")) {}

ProfileStore::ProfileStore(const QString& iniPath)
    : s_(std::make_unique<QSettings>(iniPath, QSettings::IniFormat)) {}

ProfileStore::~ProfileStore() = default;

static int policyToInt(datadrift::KnownHostsPolicy p) {
    switch (p) {
        case datadrift::KnownHostsPolicy::Strict: return 0;
        case datadrift::KnownHostsPolicy::AcceptNew: return 1;
        case datadrift::KnownHostsPolicy::Off: return 2;
    }
    return 0;
}

static datadrift::KnownHostsPolicy policyFromInt(int v) {
    switch (v) {
        case 1: return datadrift::KnownHostsPolicy::AcceptNew;
        case 2: return datadrift::KnownHostsPolicy::Off;
        default: return datadrift::KnownHostsPolicy::Strict;
    }
}

QVector<ConnectionProfile> ProfileStore::load() const {
    QVector<ConnectionProfile> out;
    int n = s_->beginReadArray("profiles");
    for (int i = 0; i < n; ++i) {
        s_->setArrayIndex(i);
        ConnectionProfile p;
        p.name = s_->value("name").toString();
        if (p.name.isEmpty()) continue;
        p.opt.host = s_->value("host").toString().toStdString();
        p.opt.port = (std::uint16_t)s_->value("port", 22).toUInt();
        p.opt.username = s_->value("user").toString().toStdString();
        const QString startPath = s_->value("startPath").toString();
        if (!startPath.isEmpty()) p.opt.start_path = startPath.toStdString();
        const QString kp = s_->value("keyPath").toString();
        if (!kp.isEmpty()) p.opt.private_key_path = kp.toStdString();
        const QString kh = s_->value("knownHosts").toString();
        if (!kh.isEmpty()) p.opt.known_hosts_path = kh.toStdString();
        p.opt.known_hosts_policy = policyFromInt(s_->value("khPolicy", 0).toInt());
        out.push_back(p);
    }
    s_->endArray();
    return out;
}

void ProfileStore::save(const QVector<ConnectionProfile>& profiles) {
    s_->remove("profiles");
    s_->beginWriteArray("profiles");
    for (int i = 0; i < profiles.size(); ++i) {
        s_->setArrayIndex(i);
        const auto& p = profiles[i];
        s_->setValue("name", p.name);
        s_->setValue("host", QString::fromStdString(p.opt.host));
        s_->setValue("port", (int)p.opt.port);
        s_->setValue("user", QString::fromStdString(p.opt.username));
        s_->setValue("startPath", QString::fromStdString(p.opt.start_path));
        s_->setValue("keyPath", p.opt.private_key_path ? QString::fromStdString(*p.opt.private_key_path) : QString());
        s_->setValue("knownHosts", p.opt.known_hosts_path ? QString::fromStdString(*p.opt.known_hosts_path) : QString());
        s_->setValue("khPolicy", policyToInt(p.opt.known_hosts_policy));
    }
    s_->endArray();
    s_->sync();
}

bool ProfileStore::find(const QString& name, ConnectionProfile& out) const {
    for (const auto& p : load()) {
        if (p.name == name) {
            out = p;
            return true;
        }
    }
    return false;
}

void ProfileStore::upsert(const ConnectionProfile& p) {
    auto all = load();
    bool replaced = false;
    for (auto& e : all) {
        if (e.name == p.name) {
            e = p;
            replaced = true;
            break;
        }
    }
    if (!replaced) all.push_back(p);
    save(all);
}

bool ProfileStore::remove(const QString& name) {
    auto all = load();
    const int before = all.size();
    all.erase(std::remove_if(all.begin(), all.end(),
                             [&](const ConnectionProfile& p) { return p.name == name; }),
              all.end());
    if (all.size() == before) return false;
    save(all);
    return true;
}

QString ProfileStore::passwordKey(const QString& name) {
    return QString("profile:%1:password").arg(name);
}

QString ProfileStore::passphraseKey(const QString& name) {
    return QString("profile:%1:keypass").arg(name);
}
