#include "datadrift/SessionManager.hpp"
#include "util.hpp"
#include <catch2/catch.hpp>
#include <thread>

namespace datadrift {
namespace test {

TEST_CASE("connect and disconnect walk the state machine", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    SessionManager sm(mockFactory(fs));
    std::vector<SessionState> seen;
    std::mutex m;
    sm.addStateListener([&](SessionState s, std::uint64_t) {
        std::lock_guard<std::mutex> lk(m);
        seen.push_back(s);
    });

    CHECK(sm.state() == SessionState::Disconnected);
    CHECK_FALSE(sm.currentSession());

    SessionInfo info;
    Error err;
    REQUIRE(sm.connect(mockOptions(), info, err));
    CHECK(info.state == SessionState::Connected);
    CHECK(info.host == "h");
    CHECK(info.username == "u");
    CHECK(sm.state() == SessionState::Connected);
    REQUIRE(sm.currentSession());
    CHECK(sm.currentSession()->id == info.id);
    CHECK(sm.transport(err) != nullptr);

    sm.disconnect();
    CHECK(sm.state() == SessionState::Disconnected);
    CHECK_FALSE(sm.currentSession());
    CHECK(sm.transport(err) == nullptr);
    CHECK(err.kind == ErrorKind::NotConnected);
    CHECK(fs->liveConnections() == 0);
    sm.disconnect(); // idempotent

    std::lock_guard<std::mutex> lk(m);
    CHECK(seen == std::vector<SessionState>{SessionState::Connecting, SessionState::Connected,
                                            SessionState::Disconnected});
}

TEST_CASE("connect failures are typed and leave no session", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addUser("u", "secret");
    SessionManager sm(mockFactory(fs));
    SessionInfo info;

    SECTION("bad password") {
        Error err;
        CHECK_FALSE(sm.connect(mockOptions(), info, err));
        CHECK(err.kind == ErrorKind::Auth);
        CHECK(sm.lastError().kind == ErrorKind::Auth);
    }
    SECTION("unreachable host") {
        fs->setUnreachable(true);
        Error err;
        SessionOptions opt = mockOptions();
        opt.password = std::string("secret");
        CHECK_FALSE(sm.connect(opt, info, err));
        CHECK(err.kind == ErrorKind::Network);
    }
    CHECK(sm.state() == SessionState::Disconnected);
    CHECK_FALSE(sm.currentSession());
    CHECK(fs->liveConnections() == 0);
}

TEST_CASE("host key policy", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->setHostKeyKnown(false);
    SessionManager sm(mockFactory(fs));
    SessionInfo info;
    Error err;
    SessionOptions opt = mockOptions();

    SECTION("strict rejects unknown hosts") {
        opt.known_hosts_policy = KnownHostsPolicy::Strict;
        CHECK_FALSE(sm.connect(opt, info, err));
        CHECK(err.kind == ErrorKind::HostKey);
    }
    SECTION("accept-new consults the confirmation callback") {
        opt.known_hosts_policy = KnownHostsPolicy::AcceptNew;
        int asked = 0;
        opt.hostkey_confirm_cb = [&](const std::string& host, std::uint16_t, const std::string&,
                                     const std::string&) {
            ++asked;
            CHECK(host == "h");
            return false;
        };
        CHECK_FALSE(sm.connect(opt, info, err));
        CHECK(err.kind == ErrorKind::HostKey);
        CHECK(asked == 1);

        opt.hostkey_confirm_cb = [&](const std::string&, std::uint16_t, const std::string&,
                                     const std::string&) { ++asked; return true; };
        err.clear();
        CHECK(sm.connect(opt, info, err));
        CHECK(asked == 2);
        CHECK(fs->hostKeyKnown());
    }
    SECTION("off connects") {
        opt.known_hosts_policy = KnownHostsPolicy::Off;
        CHECK(sm.connect(opt, info, err));
    }
}

TEST_CASE("reconnect tears down the previous session first", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    SessionManager sm(mockFactory(fs));
    SessionInfo first, second;
    Error err;
    REQUIRE(sm.connect(mockOptions(), first, err));
    REQUIRE(sm.connect(mockOptions(), second, err));
    CHECK(second.id > first.id);
    CHECK(fs->liveConnections() == 1);
    CHECK(fs->maxLiveConnections() == 1);
    CHECK(fs->connectCount() == 2);
}

TEST_CASE("concurrent connects never leave two live sessions", "[integration]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->setConnectDelayMs(20);
    SessionManager sm(mockFactory(fs));

    std::atomic<int> okCount{0};
    std::atomic<int> busyCount{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&] {
            for (int k = 0; k < 3; ++k) {
                SessionInfo info;
                Error err;
                if (sm.connect(mockOptions(), info, err)) ++okCount;
                else if (err.kind == ErrorKind::Busy) ++busyCount;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(okCount >= 1);
    CHECK(okCount + busyCount == 18);
    CHECK(fs->maxLiveConnections() == 1);
    CHECK(fs->liveConnections() == 1);
    CHECK(sm.state() == SessionState::Connected);
}

TEST_CASE("connection loss fails the session until reconnect", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    std::vector<std::pair<TeardownReason, ErrorKind>> hooks;
    SessionManager sm(mockFactory(fs));
    sm.addTeardownHook([&](std::uint64_t, TeardownReason r, const Error& cause) {
        hooks.emplace_back(r, cause.kind);
    });

    SessionInfo info;
    Error err;
    REQUIRE(sm.connect(mockOptions(), info, err));
    auto t = sm.transport(err);
    REQUIRE(t);

    fs->dropAllConnections();
    std::vector<FileInfo> out;
    CHECK_FALSE(t->list("/", out, err));

    CHECK(sm.state() == SessionState::Failed);
    CHECK(sm.lastError().kind == ErrorKind::Transport);
    CHECK(sm.transport(err) == nullptr);
    CHECK(err.kind == ErrorKind::NotConnected);
    REQUIRE(hooks.size() == 1);
    CHECK(hooks[0].first == TeardownReason::ConnectionLost);
    CHECK(hooks[0].second == ErrorKind::Transport);

    REQUIRE(sm.connect(mockOptions(), info, err));
    CHECK(sm.state() == SessionState::Connected);
    CHECK(sm.transport(err)->list("/", out, err));
    REQUIRE(hooks.size() == 2);
    CHECK(hooks[1].first == TeardownReason::Disconnect);
}

} // namespace test
} // namespace datadrift
