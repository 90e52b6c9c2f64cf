// Error taxonomy shared by every core component.
// Operations return bool (or a null handle) and fill an Error out-parameter.
#pragma once
#include <string>
#include <utility>

namespace datadrift {

enum class ErrorKind {
    None,
    Auth,           // credentials rejected
    Network,        // TCP/SSH handshake could not be established
    HostKey,        // host key rejected by the known_hosts policy
    Busy,           // a lifecycle transition is already in progress
    NotConnected,   // no usable session
    NotFound,       // path does not exist (remote or local)
    NotADirectory,  // path exists but is not a directory
    IsADirectory,   // a file operation targeted a directory
    Stale,          // cached listing invalidated and not refreshed yet
    Conflict,       // another mutating job holds the same remote path
    NotUtf8,        // content is not valid UTF-8 text
    TooLarge,       // content exceeds the configured ceiling
    LocalIo,        // local filesystem failure
    Cancelled,      // cancelled by the caller
    Transport       // protocol/connection failure reported by the backend
};

const char* errorKindName(ErrorKind kind);

struct Error {
    ErrorKind   kind = ErrorKind::None;
    int         code = 0;   // backend code (libssh2 / SFTP status) when known
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
    void clear() { kind = ErrorKind::None; code = 0; message.clear(); }
    void set(ErrorKind k, std::string msg, int c = 0) {
        kind = k;
        code = c;
        message = std::move(msg);
    }

    // Prefix the message with caller context ("job 7 upload /a/b: ...").
    Error& withContext(const std::string& ctx);

    // "NotFound: /etc/missing" style text for logs and dialogs.
    std::string describe() const;
};

inline Error makeError(ErrorKind k, std::string msg, int code = 0) {
    Error e;
    e.set(k, std::move(msg), code);
    return e;
}

} // namespace datadrift
