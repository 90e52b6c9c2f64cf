// libssh2 backend: manages TCP socket, SSH session, and SFTP channel.
// Includes keepalive, known_hosts validation, and streaming file handles.
#include "datadrift/Libssh2SftpClient.hpp"
#include "datadrift/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstring>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <mutex>
#include <cstdlib>
#include <cstdio>
#include <sstream>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace datadrift {

namespace {

// Global libssh2 initialization (once per process)
std::once_flag g_libssh2_once;

// Context for keyboard-interactive: respond with username/password based on the prompt
struct KbdIntCtx {
    const std::string* user;
    const std::string* pass;
    const KbdIntPromptsCB* cb; // optional: UI callback for prompts
};

// libssh2 frees responses with its own allocator (malloc by default).
void setResponse(LIBSSH2_USERAUTH_KBDINT_RESPONSE& r, const std::string& a) {
    r.text = nullptr;
    r.length = 0;
    if (a.empty()) return;
    char* buf = static_cast<char*>(std::malloc(a.size() + 1));
    if (!buf) return;
    std::memcpy(buf, a.data(), a.size());
    buf[a.size()] = '\0';
    r.text = buf;
    r.length = (unsigned int)a.size();
}

bool promptWantsUser(const char* prompt) {
    std::string lower(prompt ? prompt : "");
    for (char& c : lower) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return lower.find("user") != std::string::npos || lower.find("name") != std::string::npos;
}

// Keyboard-interactive callback: let the UI answer, otherwise fall back to username/password
void kbintCallback(const char* name, int name_len,
                   const char* instruction, int instruction_len,
                   int num_prompts,
                   const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                   LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                   void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> texts;
        texts.reserve((size_t)num_prompts);
        for (int i = 0; i < num_prompts; ++i) {
            const char* pt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
            texts.emplace_back(pt);
        }
        std::vector<std::string> answers;
        const std::string nm = (name && name_len > 0) ? std::string(name, (size_t)name_len) : std::string();
        const std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, (size_t)instruction_len) : std::string();
        if ((*(ctx->cb))(nm, ins, texts, answers) && (int)answers.size() >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i) setResponse(responses[i], answers[(size_t)i]);
            return;
        }
    }
    for (int i = 0; i < num_prompts; ++i) {
        const char* prompt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        const std::string* ans = promptWantsUser(prompt) ? ctx->user : ctx->pass;
        setResponse(responses[i], ans ? *ans : std::string());
    }
}

bool isSocketLevelError(int rc) {
    switch (rc) {
        case LIBSSH2_ERROR_SOCKET_NONE:
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        case LIBSSH2_ERROR_TIMEOUT:
        case LIBSSH2_ERROR_CHANNEL_CLOSED:
            return true;
        default:
            return false;
    }
}

std::string hostKeyAlgName(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
        case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
        default: return "UNKNOWN";
    }
}

int knownHostKeyBits(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_384
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_521
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default: return 0;
    }
}

// "SHA256:AA:BB:..." (or SHA1 on old libssh2)
std::string hostKeyFingerprint(LIBSSH2_SESSION* session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int type = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int len = 32;
    const char* label = "SHA256:";
#else
    const int type = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int len = 20;
    const char* label = "SHA1:";
#endif
    const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session, type);
    if (!h) return std::string();
    std::ostringstream oss;
    oss << label;
    for (int i = 0; i < len; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
        oss << b;
    }
    return oss.str();
}

std::string lastSessionError(LIBSSH2_SESSION* session) {
    if (!session) return std::string();
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (size_t)len) : std::string();
}

} // namespace

// Streaming handle over LIBSSH2_SFTP_HANDLE. Closed explicitly or on destruction.
class Libssh2SftpFile : public RemoteFile {
public:
    Libssh2SftpFile(Libssh2SftpClient* owner, LIBSSH2_SFTP_HANDLE* h, std::string path)
        : owner_(owner), h_(h), path_(std::move(path)) {}

    ~Libssh2SftpFile() override {
        if (h_ && owner_->isConnected()) libssh2_sftp_close(h_);
    }

    std::int64_t read(char* buf, std::size_t len, Error& err) override {
        if (!h_ || !owner_->requireConnected(err)) return -1;
        ssize_t n = libssh2_sftp_read(h_, buf, len);
        if (n < 0) {
            owner_->fail(err, "sftp read", path_);
            return -1;
        }
        return (std::int64_t)n;
    }

    std::int64_t write(const char* buf, std::size_t len, Error& err) override {
        if (!h_ || !owner_->requireConnected(err)) return -1;
        ssize_t n = libssh2_sftp_write(h_, buf, len);
        if (n < 0) {
            owner_->fail(err, "sftp write", path_);
            return -1;
        }
        return (std::int64_t)n;
    }

    bool close(Error& err) override {
        if (!h_) return true;
        LIBSSH2_SFTP_HANDLE* h = h_;
        h_ = nullptr;
        if (!owner_->requireConnected(err)) return false;
        if (libssh2_sftp_close(h) != 0) {
            // A failed close on a written handle means the data may not be durable.
            owner_->fail(err, "sftp close", path_);
            return false;
        }
        return true;
    }

private:
    Libssh2SftpClient* owner_;
    LIBSSH2_SFTP_HANDLE* h_;
    std::string path_;
};

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] {
        int rc = libssh2_init(0);
        if (rc != 0) LOGE("libssh2_init failed (rc=%d)", rc);
    });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::requireConnected(Error& err) const {
    if (!connected_ || !sftp_) {
        err.set(ErrorKind::Transport, "not connected");
        return false;
    }
    return true;
}

void Libssh2SftpClient::fail(Error& err, const std::string& what, const std::string& path) {
    const int rc = session_ ? libssh2_session_last_errno(session_) : 0;
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        const unsigned long st = libssh2_sftp_last_error(sftp_);
        if (st == LIBSSH2_FX_NO_SUCH_FILE || st == LIBSSH2_FX_NO_SUCH_PATH) {
            err.set(ErrorKind::NotFound, path + ": no such file or directory", (int)st);
            return;
        }
        err.set(ErrorKind::Transport, what + " failed for " + path + " (sftp status " + std::to_string(st) + ")", (int)st);
        return;
    }
    const std::string detail = lastSessionError(session_);
    if (isSocketLevelError(rc)) {
        LOGE("connection lost during %s (rc=%d %s)", what.c_str(), rc, detail.c_str());
        connected_ = false;
    }
    err.set(ErrorKind::Transport,
            what + " failed for " + path + (detail.empty() ? std::string() : (": " + detail)),
            rc);
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, Error& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::Network, std::string("getaddrinfo: ") + gai_strerror(gai), gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // No SO_RCVTIMEO/SO_SNDTIMEO here: it interferes with userauth on some servers.
        // libssh2_session_set_timeout bounds blocking calls instead.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err.set(ErrorKind::Network, "could not connect to " + host + ":" + portStr);
    return false;
}

bool Libssh2SftpClient::sshHandshake(const SessionOptions& opt, Error& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorKind::Transport, "libssh2_session_init failed");
        return false;
    }

    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, opt.timeout_ms);
#else
    (void)opt;
#endif

    int rc = libssh2_session_handshake(session_, sock_);
    if (rc != 0) {
        err.set(ErrorKind::Network, "SSH handshake failed: " + lastSessionError(session_), rc);
        return false;
    }

    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);
    return true;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, Error& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) {
        LOGW("host key verification disabled for %s:%u", opt.host.c_str(), (unsigned)opt.port);
        return true;
    }

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::HostKey, "could not initialize known_hosts");
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::HostKey, "known_hosts missing or unreadable (strict policy): " + khPath);
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::HostKey, "server did not provide a host key");
        return false;
    }

    const int alg = knownHostKeyBits(keytype);
    const int maskPlain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int maskHash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen, maskPlain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey, keylen, maskHash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::HostKey, "host key for " + opt.host + " does not match known_hosts");
        return false;
    }

    if (opt.known_hosts_policy != KnownHostsPolicy::AcceptNew) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::HostKey, "host " + opt.host + " not found in known_hosts (strict policy)");
        return false;
    }

    // TOFU: ask for confirmation, then persist
    const std::string algName = hostKeyAlgName(keytype);
    const std::string fp = hostKeyFingerprint(session_);
    LOGW("unknown host key for %s:%u (%s %s)", opt.host.c_str(), (unsigned)opt.port, algName.c_str(), fp.c_str());
    const bool confirmed = opt.hostkey_confirm_cb && opt.hostkey_confirm_cb(opt.host, opt.port, algName, fp);
    if (!confirmed) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::HostKey, "unknown host key not confirmed: " + fp);
        return false;
    }
    if (khPath.empty()) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::HostKey, "known_hosts path is not defined");
        return false;
    }
    const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                             hostkey, keylen,
                                             nullptr, 0, maskPlain, nullptr);
    const int wrc = (addrc == 0) ? libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) : addrc;
    libssh2_knownhost_free(nh);
    if (wrc != 0) {
        err.set(ErrorKind::HostKey, "could not record host key in " + khPath, wrc);
        return false;
    }
    LOGI("added %s to %s", opt.host.c_str(), khPath.c_str());
    return true;
}

// Try at most a few agent identities; the server counts every attempt.
bool Libssh2SftpClient::tryAgent(const std::string& username) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) return false;
    bool authed = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        const int kMaxAgentTries = 3;
        int tries = 0;
        while (!authed && tries < kMaxAgentTries && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            int arc;
            while ((arc = libssh2_agent_userauth(agent, username.c_str(), identity)) == LIBSSH2_ERROR_EAGAIN) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            authed = (arc == 0);
        }
    }
    libssh2_agent_disconnect(agent);
    libssh2_agent_free(agent);
    return authed;
}

// Prefer the method explicitly provided by the user:
// key file, then password (+ keyboard-interactive), then ssh-agent.
bool Libssh2SftpClient::authenticate(const SessionOptions& opt, Error& err) {
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_, opt.username.c_str(), nullptr,
                                                     opt.private_key_path->c_str(), passphrase);
        if (rc != 0) {
            err.set(ErrorKind::Auth, "public key authentication failed: " + lastSessionError(session_), rc);
            return false;
        }
        return true;
    }

    std::string authlist;
    auto queryMethods = [&] {
        if (!authlist.empty()) return;
        char* methods = libssh2_userauth_list(session_, opt.username.c_str(), (unsigned)opt.username.size());
        authlist = methods ? std::string(methods) : std::string();
    };
    auto hasMethod = [&](const char* m) { return authlist.find(m) != std::string::npos; };

    if (opt.password.has_value()) {
        // Password first, before 'none' or agent attempts use up the server's retry budget.
        int rcPw;
        while ((rcPw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str())) == LIBSSH2_ERROR_EAGAIN) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (rcPw == 0) return true;
        if (isSocketLevelError(rcPw)) {
            err.set(ErrorKind::Network, "server closed the connection after the password attempt", rcPw);
            return false;
        }

        queryMethods();
        int rcKbd = -1;
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{&opt.username, &*opt.password, &opt.keyboard_interactive_cb};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            while ((rcKbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbintCallback)) == LIBSSH2_ERROR_EAGAIN) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs) *abs = nullptr;
            if (rcKbd == 0) return true;
        }
        if (hasMethod("publickey") && tryAgent(opt.username)) return true;

        err.set(ErrorKind::Auth,
                "password/keyboard-interactive authentication failed" +
                    (authlist.empty() ? std::string() : (" (methods: " + authlist + ")")) +
                    " [rc_pw=" + std::to_string(rcPw) + ", rc_kbd=" + std::to_string(rcKbd) + "]",
                rcPw);
        return false;
    }

    queryMethods();
    if (hasMethod("publickey") && tryAgent(opt.username)) return true;
    err.set(ErrorKind::Auth, "no usable credentials (key, agent or password)");
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, Error& err) {
    if (connected_) {
        err.set(ErrorKind::Busy, "already connected");
        return false;
    }
    bool ok = tcpConnect(opt.host, opt.port, err)
           && sshHandshake(opt, err)
           && verifyHostKey(opt, err)
           && authenticate(opt, err);
    if (ok) {
        sftp_ = libssh2_sftp_init(session_);
        if (!sftp_) {
            err.set(ErrorKind::Transport, "could not start the SFTP subsystem: " + lastSessionError(session_),
                    libssh2_session_last_errno(session_));
            ok = false;
        }
    }
    if (!ok) {
        disconnect();
        return false;
    }
    connected_ = true;
    LOGI("connected to %s@%s:%u", opt.username.c_str(), opt.host.c_str(), (unsigned)opt.port);
    return true;
}

void Libssh2SftpClient::disconnect() {
    connected_ = false;
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             Error& err) {
    if (!requireConnected(err)) return false;

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        fail(err, "sftp opendir", path);
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename, rc);
            if (fi.name == "." || fi.name == "..") continue;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
                fi.mode = attrs.permissions;
                fi.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
            }
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
                fi.uid = attrs.uid;
                fi.gid = attrs.gid;
            }
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            fail(err, "sftp readdir", path);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             Error& err) {
    return statEx(remote_path, LIBSSH2_SFTP_STAT, info, err);
}

bool Libssh2SftpClient::lstat(const std::string& remote_path,
                              FileInfo& info,
                              Error& err) {
    return statEx(remote_path, LIBSSH2_SFTP_LSTAT, info, err);
}

bool Libssh2SftpClient::statEx(const std::string& remote_path, int statType,
                               FileInfo& info, Error& err) {
    if (!requireConnected(err)) return false;

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                  statType, &st);
    if (rc != 0) {
        fail(err, statType == LIBSSH2_SFTP_LSTAT ? "sftp lstat" : "sftp stat", remote_path);
        return false;
    }
    const auto slash = remote_path.find_last_of('/');
    info.name = (slash == std::string::npos) ? remote_path : remote_path.substr(slash + 1);
    info.mode = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? st.permissions : 0;
    info.is_dir = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                      ? ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                      : false;
    info.size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)st.filesize : 0;
    info.mtime = (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? (std::uint64_t)st.mtime : 0;
    if (st.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        info.uid = st.uid;
        info.gid = st.gid;
    }
    return true;
}

std::unique_ptr<RemoteFile> Libssh2SftpClient::openRead(const std::string& remote_path,
                                                        Error& err) {
    if (!requireConnected(err)) return nullptr;
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                                  LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        fail(err, "sftp open (read)", remote_path);
        return nullptr;
    }
    return std::make_unique<Libssh2SftpFile>(this, h, remote_path);
}

std::unique_ptr<RemoteFile> Libssh2SftpClient::openWrite(const std::string& remote_path,
                                                         bool truncate,
                                                         Error& err,
                                                         unsigned int mode) {
    if (!requireConnected(err)) return nullptr;
    const unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | (truncate ? LIBSSH2_FXF_TRUNC : 0);
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                                  flags, (long)mode, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        fail(err, "sftp open (write)", remote_path);
        return nullptr;
    }
    return std::make_unique<Libssh2SftpFile>(this, h, remote_path);
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   Error& err) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        fail(err, "sftp unlink", remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string& remote_dir,
                                  Error& err) {
    if (!requireConnected(err)) return false;
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        fail(err, "sftp rmdir (directory not empty?)", remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string& from,
                               const std::string& to,
                               Error& err,
                               bool overwrite) {
    if (!requireConnected(err)) return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    int rc = libssh2_sftp_rename_ex(sftp_,
                                    from.c_str(), (unsigned)from.size(),
                                    to.c_str(), (unsigned)to.size(),
                                    flags);
    if (rc != 0) {
        fail(err, "sftp rename to " + to, from);
        return false;
    }
    return true;
}

} // namespace datadrift
