#include "datadrift/TransportHandle.hpp"
#include "util.hpp"
#include <catch2/catch.hpp>
#include <atomic>
#include <vector>

namespace datadrift {
namespace test {

namespace {

std::unique_ptr<TransportHandle> connectedHandle(const std::shared_ptr<MockRemoteFs>& fs) {
    auto client = std::make_unique<MockSftpClient>(fs);
    Error err;
    REQUIRE(client->connect(mockOptions(), err));
    return std::make_unique<TransportHandle>(std::move(client), 1);
}

} // namespace

TEST_CASE("transport handle stat distinguishes missing paths", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/home/u/a.txt", "abc");
    auto t = connectedHandle(fs);

    FileInfo fi;
    Error err;
    CHECK(t->stat("/home/u/a.txt", fi, err));
    CHECK(fi.size == 3);
    CHECK_FALSE(fi.is_dir);

    bool isDir = false;
    CHECK(t->isDirectory("/home/u", isDir, err));
    CHECK(isDir);
    CHECK(t->isDirectory("/home/u/a.txt", isDir, err));
    CHECK_FALSE(isDir);

    CHECK_FALSE(t->isDirectory("/home/nobody", isDir, err));
    CHECK(err.kind == ErrorKind::NotFound);
    CHECK(t->usable());
}

TEST_CASE("transport handle streams files by id", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/d");
    auto t = connectedHandle(fs);

    Error err;
    TransportHandle::FileId w = 0;
    REQUIRE(t->openWrite("/d/f", true, w, err));
    CHECK(t->write(w, "hello ", 6, err) == 6);
    CHECK(t->write(w, "world", 5, err) == 5);
    CHECK(t->closeFile(w, err));

    TransportHandle::FileId r = 0;
    REQUIRE(t->openRead("/d/f", r, err));
    char buf[64];
    std::int64_t n = t->read(r, buf, sizeof(buf), err);
    CHECK(std::string(buf, (std::size_t)n) == "hello world");
    CHECK(t->read(r, buf, sizeof(buf), err) == 0);
    CHECK(t->closeFile(r, err));

    CHECK(t->read(r, buf, sizeof(buf), err) == -1);
    CHECK(err.kind == ErrorKind::Transport);
}

TEST_CASE("transport handle remove handles files and empty directories", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/d/f", "x");
    fs->addDir("/e");
    auto t = connectedHandle(fs);

    Error err;
    CHECK_FALSE(t->remove("/d", err));      // not empty
    CHECK(err.kind == ErrorKind::Transport);
    CHECK(t->remove("/d/f", err));
    CHECK(t->remove("/d", err));
    CHECK(t->remove("/e", err));
    CHECK_FALSE(t->remove("/e", err));
    CHECK(err.kind == ErrorKind::NotFound);
    CHECK(fs->names("/").empty());
}

TEST_CASE("transport handle remove unlinks symlinks instead of following them", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/d/sub/keep.txt", "k");
    fs->addSymlink("/d/link", "sub");
    fs->addSymlink("/d/dangling", "/nowhere");
    auto t = connectedHandle(fs);

    Error err;
    FileInfo fi;
    REQUIRE(t->stat("/d/link", fi, err));
    CHECK(fi.is_dir);
    CHECK_FALSE(t->stat("/d/dangling", fi, err));
    CHECK(err.kind == ErrorKind::NotFound);

    err.clear();
    CHECK(t->remove("/d/link", err));
    CHECK(t->remove("/d/dangling", err));
    CHECK(err.ok());
    CHECK(fs->names("/d") == std::vector<std::string>{"sub"});
    CHECK(fs->exists("/d/sub/keep.txt"));
    CHECK(t->usable());
}

TEST_CASE("transport handle reports connection loss once", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addDir("/d");
    auto t = connectedHandle(fs);
    std::atomic<int> lost{0};
    t->setLostCallback([&](const Error& cause) {
        CHECK(cause.kind == ErrorKind::Transport);
        ++lost;
    });

    fs->dropAllConnections();
    std::vector<FileInfo> out;
    Error err;
    CHECK_FALSE(t->list("/d", out, err));
    CHECK(err.kind == ErrorKind::Transport);
    CHECK_FALSE(t->usable());
    CHECK_FALSE(t->list("/d", out, err));
    CHECK(err.kind == ErrorKind::Transport);
    CHECK(lost == 1);
}

TEST_CASE("closed transport handle fails without reporting a loss", "[unit]") {
    auto fs = std::make_shared<MockRemoteFs>();
    fs->addFile("/f", "x");
    auto t = connectedHandle(fs);
    std::atomic<int> lost{0};
    t->setLostCallback([&](const Error&) { ++lost; });

    Error err;
    TransportHandle::FileId r = 0;
    REQUIRE(t->openRead("/f", r, err));
    CHECK(fs->liveConnections() == 1);
    t->close();
    CHECK(fs->liveConnections() == 0);

    FileInfo fi;
    CHECK_FALSE(t->stat("/f", fi, err));
    CHECK(err.kind == ErrorKind::Transport);
    CHECK(lost == 0);
    t->close();
}

} // namespace test
} // namespace datadrift
