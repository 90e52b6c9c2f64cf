// Error kind names and context helpers.
#include "datadrift/Error.hpp"
#include "datadrift/SftpTypes.hpp"

namespace datadrift {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "None";
        case ErrorKind::Auth:          return "AuthError";
        case ErrorKind::Network:       return "NetworkError";
        case ErrorKind::HostKey:       return "HostKeyError";
        case ErrorKind::Busy:          return "BusyError";
        case ErrorKind::NotConnected:  return "NotConnectedError";
        case ErrorKind::NotFound:      return "NotFoundError";
        case ErrorKind::NotADirectory: return "NotADirectoryError";
        case ErrorKind::IsADirectory:  return "IsADirectoryError";
        case ErrorKind::Stale:         return "StaleError";
        case ErrorKind::Conflict:      return "ConflictError";
        case ErrorKind::NotUtf8:       return "NotUtf8Error";
        case ErrorKind::TooLarge:      return "TooLargeError";
        case ErrorKind::LocalIo:       return "LocalIoError";
        case ErrorKind::Cancelled:     return "Cancelled";
        case ErrorKind::Transport:     return "TransportError";
    }
    return "UnknownError";
}

const char* knownHostsPolicyName(KnownHostsPolicy p) {
    switch (p) {
        case KnownHostsPolicy::Strict:    return "strict";
        case KnownHostsPolicy::AcceptNew: return "accept-new";
        case KnownHostsPolicy::Off:       return "off";
    }
    return "strict";
}

Error& Error::withContext(const std::string& ctx) {
    if (ctx.empty()) return *this;
    message = message.empty() ? ctx : (ctx + ": " + message);
    return *this;
}

std::string Error::describe() const {
    std::string s = errorKindName(kind);
    if (kind == ErrorKind::Transport && code != 0) s += "{" + std::to_string(code) + "}";
    if (!message.empty()) s += ": " + message;
    return s;
}

} // namespace datadrift
