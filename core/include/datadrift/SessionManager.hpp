// Connect/disconnect lifecycle for the single remote session of the process.
// Owns at most one TransportHandle; never holds its mutex across network I/O.
#pragma once
#include "SftpClient.hpp"
#include "TransportHandle.hpp"
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace datadrift {

enum class SessionState { Disconnected, Connecting, Connected, Failed };

const char* sessionStateName(SessionState s);

// Read-only view of the current session.
struct SessionInfo {
    std::uint64_t id = 0;
    std::string   host;
    std::uint16_t port = 22;
    std::string   username;
    std::string   start_path = "/";
    SessionState  state = SessionState::Disconnected;
};

enum class TeardownReason {
    Disconnect,     // caller-initiated; hooks may block until their work settles
    ConnectionLost  // detected on a worker thread; hooks must not block
};

class SessionManager {
public:
    using ClientFactory = std::function<std::unique_ptr<SftpClient>()>;
    using StateListener = std::function<void(SessionState state, std::uint64_t sessionId)>;
    using TeardownHook = std::function<void(std::uint64_t sessionId, TeardownReason reason, const Error& cause)>;

    explicit SessionManager(ClientFactory factory);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Tears down any previous session first. Busy while another connect or a teardown runs.
    bool connect(const SessionOptions& opt, SessionInfo& out, Error& err);
    // Idempotent. Cancels and awaits the session's jobs, then closes the transport.
    void disconnect();

    std::optional<SessionInfo> currentSession() const;
    SessionState state() const;
    Error lastError() const;

    // Transport of the Connected session; null with NotConnected otherwise.
    std::shared_ptr<TransportHandle> transport(Error& err) const;

    void addStateListener(StateListener l);
    // Returns a token for removeTeardownHook.
    int addTeardownHook(TeardownHook h);
    void removeTeardownHook(int token);

private:
    struct Session {
        SessionInfo info;
        std::shared_ptr<TransportHandle> transport;
    };

    void onConnectionLost(std::uint64_t sessionId, const Error& cause);
    void runHooks(std::uint64_t sessionId, TeardownReason reason, const Error& cause);
    void teardown(Session& s);
    void publish(SessionState state, std::uint64_t sessionId);

    ClientFactory factory_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Session> session_;
    SessionState state_ = SessionState::Disconnected;
    Error lastError_;
    bool transitioning_ = false;
    std::uint64_t nextId_ = 1;

    std::mutex hooksMutex_;
    std::vector<StateListener> listeners_;
    std::vector<std::pair<int, TeardownHook>> hooks_;
    int nextHook_ = 1;
};

} // namespace datadrift
