// Session lifecycle: one transport at a time, transitions serialized, I/O outside the lock.
#include "datadrift/SessionManager.hpp"
#include "datadrift/Log.hpp"
#include "datadrift/RemotePath.hpp"

namespace datadrift {

const char* sessionStateName(SessionState s) {
    switch (s) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting:   return "Connecting";
        case SessionState::Connected:    return "Connected";
        case SessionState::Failed:       return "Failed";
    }
    return "?";
}

SessionManager::SessionManager(ClientFactory factory) : factory_(std::move(factory)) {}

SessionManager::~SessionManager() {
    disconnect();
}

void SessionManager::addStateListener(StateListener l) {
    std::lock_guard<std::mutex> lk(hooksMutex_);
    listeners_.push_back(std::move(l));
}

int SessionManager::addTeardownHook(TeardownHook h) {
    std::lock_guard<std::mutex> lk(hooksMutex_);
    const int token = nextHook_++;
    hooks_.emplace_back(token, std::move(h));
    return token;
}

void SessionManager::removeTeardownHook(int token) {
    std::lock_guard<std::mutex> lk(hooksMutex_);
    for (auto it = hooks_.begin(); it != hooks_.end(); ++it) {
        if (it->first == token) {
            hooks_.erase(it);
            return;
        }
    }
}

void SessionManager::publish(SessionState state, std::uint64_t sessionId) {
    std::vector<StateListener> ls;
    {
        std::lock_guard<std::mutex> lk(hooksMutex_);
        ls = listeners_;
    }
    for (auto& l : ls) l(state, sessionId);
}

void SessionManager::runHooks(std::uint64_t sessionId, TeardownReason reason, const Error& cause) {
    std::vector<TeardownHook> hs;
    {
        std::lock_guard<std::mutex> lk(hooksMutex_);
        for (auto& kv : hooks_) hs.push_back(kv.second);
    }
    for (auto& h : hs) h(sessionId, reason, cause);
}

void SessionManager::teardown(Session& s) {
    LOGI("session %llu: tearing down (%s@%s)", (unsigned long long)s.info.id,
         s.info.username.c_str(), s.info.host.c_str());
    runHooks(s.info.id, TeardownReason::Disconnect,
             makeError(ErrorKind::Cancelled, "session " + std::to_string(s.info.id) + " closed"));
    if (s.transport) s.transport->close();
}

bool SessionManager::connect(const SessionOptions& opt, SessionInfo& out, Error& err) {
    std::optional<Session> prior;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (transitioning_) {
            err.set(ErrorKind::Busy, std::string("session is ") +
                    (state_ == SessionState::Connecting ? "connecting" : "closing"));
            return false;
        }
        transitioning_ = true;
        prior = std::move(session_);
        session_.reset();
    }

    if (prior) {
        teardown(*prior);
        {
            std::lock_guard<std::mutex> lk(mutex_);
            state_ = SessionState::Disconnected;
        }
        publish(SessionState::Disconnected, prior->info.id);
    }

    SessionInfo info;
    info.host = opt.host;
    info.port = opt.port;
    info.username = opt.username;
    info.start_path = remotepath::resolve("/", opt.start_path.empty() ? "/" : opt.start_path);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        info.id = nextId_++;
        info.state = SessionState::Connecting;
        state_ = SessionState::Connecting;
    }
    publish(SessionState::Connecting, info.id);
    LOGI("session %llu: connecting to %s@%s:%u (host key policy %s)", (unsigned long long)info.id,
         opt.username.c_str(), opt.host.c_str(), (unsigned)opt.port,
         knownHostsPolicyName(opt.known_hosts_policy));

    std::unique_ptr<SftpClient> client = factory_ ? factory_() : nullptr;
    bool ok = false;
    if (!client) {
        err.set(ErrorKind::Transport, "no SFTP backend available");
    } else {
        ok = client->connect(opt, err);
    }

    if (!ok) {
        err.withContext("connect " + opt.username + "@" + opt.host);
        LOGE("session %llu: %s", (unsigned long long)info.id, err.describe().c_str());
        {
            std::lock_guard<std::mutex> lk(mutex_);
            state_ = SessionState::Failed;
            lastError_ = err;
        }
        publish(SessionState::Failed, info.id);
        {
            std::lock_guard<std::mutex> lk(mutex_);
            state_ = SessionState::Disconnected;
            transitioning_ = false;
        }
        cv_.notify_all();
        publish(SessionState::Disconnected, info.id);
        return false;
    }

    auto transport = std::make_shared<TransportHandle>(std::move(client), info.id);
    const std::uint64_t id = info.id;
    transport->setLostCallback([this, id](const Error& cause) { onConnectionLost(id, cause); });

    info.state = SessionState::Connected;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        session_ = Session{info, transport};
        state_ = SessionState::Connected;
        lastError_.clear();
        transitioning_ = false;
    }
    cv_.notify_all();
    LOGI("session %llu: connected", (unsigned long long)id);
    publish(SessionState::Connected, id);
    out = info;
    return true;
}

void SessionManager::disconnect() {
    std::optional<Session> s;
    {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait(lk, [this] { return !transitioning_; });
        if (!session_) {
            state_ = SessionState::Disconnected;
            return;
        }
        transitioning_ = true;
        s = std::move(session_);
        session_.reset();
    }

    teardown(*s);

    {
        std::lock_guard<std::mutex> lk(mutex_);
        state_ = SessionState::Disconnected;
        transitioning_ = false;
    }
    cv_.notify_all();
    publish(SessionState::Disconnected, s->info.id);
}

void SessionManager::onConnectionLost(std::uint64_t sessionId, const Error& cause) {
    Error e = cause;
    e.withContext("session " + std::to_string(sessionId));
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!session_ || session_->info.id != sessionId || state_ != SessionState::Connected) return;
        state_ = SessionState::Failed;
        session_->info.state = SessionState::Failed;
        lastError_ = e;
    }
    LOGE("%s", e.describe().c_str());
    runHooks(sessionId, TeardownReason::ConnectionLost, e);
    publish(SessionState::Failed, sessionId);
}

std::optional<SessionInfo> SessionManager::currentSession() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!session_) return std::nullopt;
    return session_->info;
}

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

Error SessionManager::lastError() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return lastError_;
}

std::shared_ptr<TransportHandle> SessionManager::transport(Error& err) const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (session_ && state_ == SessionState::Connected) return session_->transport;
    if (state_ == SessionState::Failed && session_)
        err.set(ErrorKind::NotConnected, "session " + std::to_string(session_->info.id) +
                " lost its connection; reconnect required");
    else
        err.set(ErrorKind::NotConnected, "not connected");
    return nullptr;
}

} // namespace datadrift
