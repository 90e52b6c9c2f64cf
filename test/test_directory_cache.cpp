#include "datadrift/RemoteController.hpp"
#include "util.hpp"
#include <catch2/catch.hpp>
#include <thread>

namespace datadrift {
namespace test {

namespace {

std::shared_ptr<MockRemoteFs> sampleTree() {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/home/u/zeta.txt", "z");
    fs->addFile("/home/u/alpha.txt", "aa");
    fs->addDir("/home/u/src");
    fs->addDir("/home/u/bin");
    fs->addFile("/home/u/notes.md", "n");
    fs->addDir("/var");
    return fs;
}

std::vector<std::string> names(const DirectoryListing& l) {
    std::vector<std::string> out;
    for (const auto& e : l.entries) out.push_back(e.name);
    return out;
}

} // namespace

TEST_CASE("navigate lists directories first then by name", "[unit]") {
    auto fs = sampleTree();
    RemoteController ctl(mockFactory(fs));
    SessionInfo info;
    Error err;
    REQUIRE(ctl.connect(mockOptions(), info, err));

    DirectoryListing l;
    REQUIRE(ctl.navigate("/home/u", l, err));
    CHECK(l.path == "/home/u");
    CHECK(l.sessionId == info.id);
    CHECK(names(l) == std::vector<std::string>{"bin", "src", "alpha.txt", "notes.md", "zeta.txt"});
    CHECK(l.entries[0].kind == EntryKind::Directory);
    CHECK(l.entries[2].kind == EntryKind::File);
    CHECK(l.entries[2].size == 2);
    CHECK(ctl.currentPath() == "/home/u");

    DirectoryListing again;
    REQUIRE(ctl.navigate("src/..", again, err));
    CHECK(again.path == "/home/u");
    CHECK(again.version > l.version);
}

TEST_CASE("navigate failures keep the current directory", "[unit]") {
    auto fs = sampleTree();
    RemoteController ctl(mockFactory(fs));
    SessionInfo info;
    Error err;
    REQUIRE(ctl.connect(mockOptions(), info, err));
    DirectoryListing l;
    REQUIRE(ctl.navigate("/home/u", l, err));

    CHECK_FALSE(ctl.navigate("zeta.txt", l, err));
    CHECK(err.kind == ErrorKind::NotADirectory);
    CHECK(ctl.currentPath() == "/home/u");

    err.clear();
    CHECK_FALSE(ctl.navigate("/nope", l, err));
    CHECK(err.kind == ErrorKind::NotFound);
    CHECK(ctl.currentPath() == "/home/u");

    REQUIRE(ctl.currentListing(l, err));
    CHECK(l.path == "/home/u");
}

TEST_CASE("connect lists the start path and goUp stops at the root", "[unit]") {
    auto fs = sampleTree();
    RemoteController ctl(mockFactory(fs));
    SessionOptions opt = mockOptions();
    opt.start_path = "/home/u/src";
    SessionInfo info;
    Error err;
    REQUIRE(ctl.connect(opt, info, err));
    CHECK(ctl.currentPath() == "/home/u/src");

    DirectoryListing l;
    REQUIRE(ctl.currentListing(l, err));
    CHECK(l.entries.empty());

    REQUIRE(ctl.goUp(l, err));
    CHECK(l.path == "/home/u");
    REQUIRE(ctl.goUp(l, err));
    REQUIRE(ctl.goUp(l, err));
    CHECK(l.path == "/");
    REQUIRE(ctl.goUp(l, err));
    CHECK(l.path == "/");
    CHECK(names(l) == std::vector<std::string>{"home", "var"});
}

TEST_CASE("invalidated listings are stale until refreshed", "[unit]") {
    auto fs = sampleTree();
    RemoteController ctl(mockFactory(fs));
    SessionInfo info;
    Error err;
    REQUIRE(ctl.connect(mockOptions(), info, err));
    DirectoryListing l;
    REQUIRE(ctl.navigate("/var", l, err));
    CHECK(l.entries.empty());

    fs->addFile("/var/new.log", "x");
    ctl.cache().invalidate();
    CHECK_FALSE(ctl.currentListing(l, err));
    CHECK(err.kind == ErrorKind::Stale);

    REQUIRE(ctl.refresh(l, err));
    CHECK(names(l) == std::vector<std::string>{"new.log"});
    REQUIRE(ctl.currentListing(l, err));

    ctl.cache().invalidatePath("/var/");
    CHECK_FALSE(ctl.currentListing(l, err));
    CHECK(err.kind == ErrorKind::Stale);
}

TEST_CASE("cache is cleared when the session goes away", "[unit]") {
    auto fs = sampleTree();
    RemoteController ctl(mockFactory(fs));
    SessionInfo info;
    Error err;
    REQUIRE(ctl.connect(mockOptions(), info, err));
    DirectoryListing l;
    REQUIRE(ctl.navigate("/home/u", l, err));

    ctl.disconnect();
    CHECK_FALSE(ctl.currentListing(l, err));
    CHECK(err.kind == ErrorKind::NotConnected);
    CHECK_FALSE(ctl.navigate("/home/u", l, err));
    CHECK(err.kind == ErrorKind::NotConnected);

    REQUIRE(ctl.connect(mockOptions(), info, err));
    CHECK(ctl.currentPath() == "/");
    REQUIRE(ctl.currentListing(l, err));
    CHECK(l.sessionId == info.id);
}

TEST_CASE("a delete during a listing leaves the installed listing stale", "[integration]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/d/victim", "v");
    fs->addFile("/d/other", "o");
    RemoteController ctl(mockFactory(fs));
    SessionInfo info;
    Error err;
    REQUIRE(ctl.connect(mockOptions(), info, err));

    const int listsBefore = fs->listCalls();
    fs->setListDelayMs(150);
    bool listed = false;
    DirectoryListing racing;
    std::thread nav([&] {
        Error e;
        listed = ctl.navigate("/d", racing, e);
    });
    REQUIRE(waitUntil([&] { return fs->listCalls() > listsBefore; }));

    JobPtr del = ctl.remove("/d/victim", err);
    REQUIRE(del);
    del->wait();
    nav.join();
    fs->setListDelayMs(0);

    REQUIRE(del->state() == JobState::Succeeded);
    REQUIRE(listed);
    CHECK_FALSE(fs->exists("/d/victim"));
    CHECK(ctl.currentPath() == "/d");

    DirectoryListing l;
    CHECK_FALSE(ctl.currentListing(l, err));
    CHECK(err.kind == ErrorKind::Stale);

    err.clear();
    REQUIRE(ctl.refresh(l, err));
    CHECK(names(l) == std::vector<std::string>{"other"});
    REQUIRE(ctl.currentListing(l, err));
    CHECK(names(l) == std::vector<std::string>{"other"});
}

TEST_CASE("overlapping navigations leave the last issued directory current", "[integration]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/a");
    fs->addDir("/b");
    RemoteController ctl(mockFactory(fs));
    SessionInfo info;
    Error err;
    REQUIRE(ctl.connect(mockOptions(), info, err));

    for (int i = 0; i < 50; ++i) {
        DirectoryListing la, lb;
        bool okA = false, okB = false;
        std::thread ta([&] { Error e; okA = ctl.navigate("/a", la, e); });
        std::thread tb([&] { Error e; okB = ctl.navigate("/b", lb, e); });
        ta.join();
        tb.join();
        REQUIRE(okA);
        REQUIRE(okB);
        const std::string expected = la.version > lb.version ? "/a" : "/b";
        REQUIRE(ctl.currentPath() == expected);
    }
}

} // namespace test
} // namespace datadrift
