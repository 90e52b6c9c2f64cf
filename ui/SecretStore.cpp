// SecretStore implementation: Keychain (macOS) or an in-process map.
#include "SecretStore.hpp"
#include "datadrift/Log.hpp"
#include <QByteArray>
#include <QHash>
#include <mutex>

#ifdef __APPLE__
#include <Security/Security.h>
#include <CoreFoundation/CoreFoundation.h>

namespace {

// Releases a CoreFoundation object on scope exit.
template <typename T>
struct CFHolder {
    T ref = nullptr;
    explicit CFHolder(T r) : ref(r) {}
    ~CFHolder() { if (ref) CFRelease(ref); }
    CFHolder(const CFHolder&) = delete;
    CFHolder& operator=(const CFHolder&) = delete;
};

// Generic-password query for one account under the DataDrift service.
CFMutableDictionaryRef itemQuery(CFStringRef account) {
    CFMutableDictionaryRef q = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);
    CFDictionarySetValue(q, kSecClass, kSecClassGenericPassword);
    CFDictionarySetValue(q, kSecAttrService, CFSTR("DataDrift"));
    CFDictionarySetValue(q, kSecAttrAccount, account);
    return q;
}

CFStringRef cfAccount(const QString& key) {
    return CFStringCreateWithCharacters(
        kCFAllocatorDefault, reinterpret_cast<const UniChar*>(key.utf16()), key.size());
}

} // namespace

void SecretStore::setSecret(const QString& key, const QString& value) {
    const QByteArray bytes = value.toUtf8();
    CFHolder<CFStringRef> account(cfAccount(key));
    CFHolder<CFDataRef> data(CFDataCreate(
        kCFAllocatorDefault, reinterpret_cast<const UInt8*>(bytes.constData()), bytes.size()));
    CFHolder<CFMutableDictionaryRef> query(itemQuery(account.ref));
    CFHolder<CFMutableDictionaryRef> attrs(CFDictionaryCreateMutable(
        kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks));
    CFDictionarySetValue(attrs.ref, kSecValueData, data.ref);

    OSStatus st = SecItemUpdate(query.ref, attrs.ref);
    if (st == errSecItemNotFound) {
        CFDictionarySetValue(query.ref, kSecValueData, data.ref);
        CFDictionarySetValue(query.ref, kSecAttrAccessible, kSecAttrAccessibleAfterFirstUnlock);
        st = SecItemAdd(query.ref, nullptr);
    }
    if (st != errSecSuccess)
        LOGW("Keychain store failed for %s (OSStatus %d)", key.toUtf8().constData(), (int)st);
}

std::optional<QString> SecretStore::getSecret(const QString& key) const {
    CFHolder<CFStringRef> account(cfAccount(key));
    CFHolder<CFMutableDictionaryRef> query(itemQuery(account.ref));
    CFDictionarySetValue(query.ref, kSecReturnData, kCFBooleanTrue);
    CFDictionarySetValue(query.ref, kSecMatchLimit, kSecMatchLimitOne);

    CFTypeRef raw = nullptr;
    const OSStatus st = SecItemCopyMatching(query.ref, &raw);
    CFHolder<CFTypeRef> result(raw);
    if (st != errSecSuccess || !result.ref || CFGetTypeID(result.ref) != CFDataGetTypeID())
        return std::nullopt;

    auto data = static_cast<CFDataRef>(result.ref);
    const QString out = QString::fromUtf8(reinterpret_cast<const char*>(CFDataGetBytePtr(data)),
                                          (int)CFDataGetLength(data));
    if (out.isEmpty()) return std::nullopt;
    return out;
}

void SecretStore::removeSecret(const QString& key) {
    CFHolder<CFStringRef> account(cfAccount(key));
    CFHolder<CFMutableDictionaryRef> query(itemQuery(account.ref));
    const OSStatus st = SecItemDelete(query.ref);
    if (st != errSecSuccess && st != errSecItemNotFound)
        LOGW("Keychain delete failed for %s (OSStatus %d)", key.toUtf8().constData(), (int)st);
}

bool SecretStore::persistent() {
    return true;
}

#else // non-Apple: in-process only, nothing touches disk

namespace {
std::mutex g_secretsMutex;
QHash<QString, QString>& secrets() {
    static QHash<QString, QString> s;
    return s;
}
} // namespace

void SecretStore::setSecret(const QString& key, const QString& value) {
    std::lock_guard<std::mutex> lk(g_secretsMutex);
    secrets().insert(key, value);
}

std::optional<QString> SecretStore::getSecret(const QString& key) const {
    std::lock_guard<std::mutex> lk(g_secretsMutex);
    auto it = secrets().constFind(key);
    if (it == secrets().constEnd() || it.value().isEmpty()) return std::nullopt;
    return it.value();
}

void SecretStore::removeSecret(const QString& key) {
    std::lock_guard<std::mutex> lk(g_secretsMutex);
    secrets().remove(key);
}

bool SecretStore::persistent() {
    return false;
}

#endif
