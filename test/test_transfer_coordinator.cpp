#include "datadrift/RemoteController.hpp"
#include "util.hpp"
#include <catch2/catch.hpp>
#include <algorithm>
#include <chrono>
#include <map>

namespace datadrift {
namespace test {

namespace {

TransferOptions smallChunks() {
    TransferOptions opt;
    opt.workers = 2;
    opt.chunk_bytes = 4096;
    return opt;
}

struct Fixture {
    std::shared_ptr<MockRemoteFs> fs = std::make_shared<MockRemoteFs>();
    TempDir local;
    std::unique_ptr<RemoteController> ctl;
    SessionInfo info;

    explicit Fixture(TransferOptions opt = smallChunks()) {
        fs->addDir("/home/u");
        ctl.reset(new RemoteController(mockFactory(fs), opt));
        Error err;
        REQUIRE(ctl->connect(mockOptions(), info, err));
        DirectoryListing l;
        REQUIRE(ctl->navigate("/home/u", l, err));
    }
};

bool containsEntry(const DirectoryListing& l, const std::string& name) {
    return std::any_of(l.entries.begin(), l.entries.end(),
                       [&](const RemoteEntry& e) { return e.name == name; });
}

} // namespace

TEST_CASE("upload, edit and reopen a file", "[integration]") {
    Fixture f;
    Error err;
    writeLocal(f.local.file("report.txt"), "v1");

    JobPtr up = f.ctl->upload(f.local.file("report.txt"), ".", err);
    REQUIRE(up);
    up->wait();
    REQUIRE(up->state() == JobState::Succeeded);
    CHECK(up->destination() == "/home/u/report.txt");

    JobPtr save = f.ctl->save("report.txt", "v2", err);
    REQUIRE(save);
    save->wait();
    REQUIRE(save->state() == JobState::Succeeded);

    JobPtr open = f.ctl->open("/home/u/report.txt", err);
    REQUIRE(open);
    open->wait();
    REQUIRE(open->state() == JobState::Succeeded);
    CHECK(open->text() == "v2");
    CHECK_FALSE(hasPartFile(f.fs->names("/home/u")));
}

TEST_CASE("upload then download round-trips binary content", "[integration]") {
    Fixture f;
    Error err;
    const std::string payload = pattern(100000);
    writeLocal(f.local.file("blob.bin"), payload);

    JobPtr up = f.ctl->upload(f.local.file("blob.bin"), "/home/u", err);
    REQUIRE(up);
    up->wait();
    REQUIRE(up->state() == JobState::Succeeded);
    CHECK(up->bytesDone() == payload.size());
    CHECK(up->bytesTotal() == payload.size());

    TempDir out;
    JobPtr down = f.ctl->download("/home/u/blob.bin", out.path(), err);
    REQUIRE(down);
    down->wait();
    REQUIRE(down->state() == JobState::Succeeded);
    CHECK(readLocal(out.file("blob.bin")) == payload);
    CHECK(localNames(out.path()) == std::vector<std::string>{"blob.bin"});
}

TEST_CASE("successful mutations invalidate the parent listing", "[integration]") {
    Fixture f;
    Error err;
    f.fs->addFile("/home/u/old.txt", "x");
    DirectoryListing l;
    REQUIRE(f.ctl->refresh(l, err));
    REQUIRE(containsEntry(l, "old.txt"));

    JobPtr del = f.ctl->remove("old.txt", err);
    REQUIRE(del);
    del->wait();
    REQUIRE(del->state() == JobState::Succeeded);

    CHECK_FALSE(f.ctl->currentListing(l, err));
    CHECK(err.kind == ErrorKind::Stale);
    REQUIRE(f.ctl->navigate("/home/u", l, err));
    CHECK_FALSE(containsEntry(l, "old.txt"));
}

TEST_CASE("two deletes of one path: exactly one succeeds", "[integration]") {
    Fixture f;
    f.fs->addFile("/home/u/gone.txt", "x");

    Error e1, e2;
    JobPtr j1 = f.ctl->remove("/home/u/gone.txt", e1);
    JobPtr j2 = f.ctl->remove("/home/u/gone.txt", e2);

    int succeeded = 0;
    for (auto p : {std::make_pair(j1, e1), std::make_pair(j2, e2)}) {
        if (!p.first) {
            CHECK(p.second.kind == ErrorKind::Conflict);
            continue;
        }
        p.first->wait();
        if (p.first->state() == JobState::Succeeded) {
            ++succeeded;
        } else {
            CHECK(p.first->state() == JobState::Failed);
            CHECK(p.first->error().kind == ErrorKind::NotFound);
        }
    }
    CHECK(succeeded == 1);
    CHECK_FALSE(f.fs->exists("/home/u/gone.txt"));
}

TEST_CASE("a second upload to a busy path is a conflict", "[integration]") {
    Fixture f;
    f.fs->setChunkDelayMs(5);
    Error err;
    writeLocal(f.local.file("big.bin"), pattern(64 * 1024));

    JobPtr first = f.ctl->upload(f.local.file("big.bin"), "/home/u", err);
    REQUIRE(first);
    Error again;
    CHECK_FALSE(f.ctl->upload(f.local.file("big.bin"), "/home/u", again));
    CHECK(again.kind == ErrorKind::Conflict);
    CHECK_FALSE(f.ctl->remove("/home/u/big.bin", again));
    CHECK(again.kind == ErrorKind::Conflict);

    first->wait();
    CHECK(first->state() == JobState::Succeeded);
    JobPtr del = f.ctl->remove("/home/u/big.bin", err);
    REQUIRE(del);
    del->wait();
    CHECK(del->state() == JobState::Succeeded);
}

TEST_CASE("cancelled download leaves the destination absent or unchanged", "[integration]") {
    Fixture f;
    f.fs->addFile("/home/u/large.bin", pattern(256 * 1024));
    f.fs->setChunkDelayMs(3);
    Error err;
    TempDir out;

    SECTION("no prior file") {
        JobPtr down = f.ctl->download("/home/u/large.bin", out.path(), err);
        REQUIRE(down);
        REQUIRE(waitUntil([&] { return down->bytesDone() > 0; }));
        down->cancel();
        down->wait();
        CHECK(down->state() == JobState::Cancelled);
        CHECK(down->error().kind == ErrorKind::Cancelled);
        CHECK(localNames(out.path()).empty());
    }
    SECTION("existing file") {
        writeLocal(out.file("large.bin"), "keep me");
        JobPtr down = f.ctl->download("/home/u/large.bin", out.path(), err);
        REQUIRE(down);
        REQUIRE(waitUntil([&] { return down->bytesDone() >= 8192; }));
        down->cancel();
        down->wait();
        CHECK(down->state() == JobState::Cancelled);
        CHECK(readLocal(out.file("large.bin")) == "keep me");
        CHECK(localNames(out.path()) == std::vector<std::string>{"large.bin"});
    }
    SECTION("cancelled before start") {
        f.fs->addFile("/home/u/a.bin", pattern(64 * 1024));
        f.fs->addFile("/home/u/b.bin", pattern(64 * 1024));
        f.fs->addFile("/home/u/c.bin", pattern(64 * 1024));
        // Two workers: c stays pending behind a and b.
        JobPtr a = f.ctl->download("/home/u/a.bin", out.path(), err);
        JobPtr b = f.ctl->download("/home/u/b.bin", out.path(), err);
        JobPtr c = f.ctl->download("/home/u/c.bin", out.path(), err);
        REQUIRE(a);
        REQUIRE(b);
        REQUIRE(c);
        c->cancel();
        c->wait();
        CHECK(c->state() == JobState::Cancelled);
        CHECK(c->bytesDone() == 0);
        a->wait();
        b->wait();
        CHECK(a->state() == JobState::Succeeded);
        CHECK_FALSE(localExists(out.file("c.bin")));
    }
}

TEST_CASE("download validates both ends before moving bytes", "[unit]") {
    Fixture f;
    f.fs->addFile("/home/u/a.txt", "a");
    Error err;

    CHECK_FALSE(f.ctl->download("/home/u/a.txt", f.local.file("missing"), err));
    CHECK(err.kind == ErrorKind::NotFound);

    JobPtr dir = f.ctl->download("/home/u", f.local.path(), err);
    REQUIRE(dir);
    dir->wait();
    CHECK(dir->state() == JobState::Failed);
    CHECK(dir->error().kind == ErrorKind::IsADirectory);

    JobPtr missing = f.ctl->download("/home/u/none.txt", f.local.path(), err);
    REQUIRE(missing);
    missing->wait();
    CHECK(missing->error().kind == ErrorKind::NotFound);
    CHECK(localNames(f.local.path()).empty());
}

TEST_CASE("upload validates the source and the remote directory", "[unit]") {
    Fixture f;
    Error err;
    CHECK_FALSE(f.ctl->upload(f.local.file("nothing.txt"), "/home/u", err));
    CHECK(err.kind == ErrorKind::NotFound);
    CHECK_FALSE(f.ctl->upload(f.local.path(), "/home/u", err));
    CHECK(err.kind == ErrorKind::IsADirectory);

    writeLocal(f.local.file("a.txt"), "a");
    f.fs->addFile("/home/u/file", "x");
    JobPtr j = f.ctl->upload(f.local.file("a.txt"), "/home/u/file", err);
    REQUIRE(j);
    j->wait();
    CHECK(j->error().kind == ErrorKind::NotADirectory);

    j = f.ctl->upload(f.local.file("a.txt"), "/home/nowhere", err);
    REQUIRE(j);
    j->wait();
    CHECK(j->error().kind == ErrorKind::NotFound);
}

TEST_CASE("failed upload leaves the partial temporary file", "[integration]") {
    Fixture f;
    Error err;
    writeLocal(f.local.file("report.txt"), pattern(20000));
    f.fs->failWritesAfterBytes(5000);

    JobPtr up = f.ctl->upload(f.local.file("report.txt"), "/home/u", err);
    REQUIRE(up);
    up->wait();
    REQUIRE(up->state() == JobState::Failed);
    CHECK(up->error().kind == ErrorKind::Transport);

    const std::string tmp = "/home/u/.report.txt.datadrift-" + std::to_string(up->id()) + ".part";
    CHECK(f.fs->exists(tmp));
    CHECK(up->error().message.find(tmp) != std::string::npos);
    CHECK_FALSE(f.fs->exists("/home/u/report.txt"));

    JobPtr again = f.ctl->transfers().retry(up->id(), err);
    REQUIRE(again);
    CHECK(again->attempt() == 2);
    again->wait();
    CHECK(again->state() == JobState::Succeeded);
    std::string content;
    REQUIRE(f.fs->readFile("/home/u/report.txt", content));
    CHECK(content == pattern(20000));
}

TEST_CASE("retry is limited to failed jobs and max attempts", "[unit]") {
    TransferOptions opt = smallChunks();
    opt.max_attempts = 2;
    Fixture f(opt);
    Error err;

    JobPtr j = f.ctl->remove("/home/u/none", err);
    REQUIRE(j);
    j->wait();
    REQUIRE(j->state() == JobState::Failed);

    JobPtr r = f.ctl->transfers().retry(j->id(), err);
    REQUIRE(r);
    r->wait();
    CHECK(r->attempt() == 2);
    CHECK_FALSE(f.ctl->transfers().retry(r->id(), err));
    CHECK(err.kind == ErrorKind::Busy);

    f.fs->addFile("/home/u/x", "x");
    JobPtr ok = f.ctl->remove("/home/u/x", err);
    REQUIRE(ok);
    ok->wait();
    CHECK_FALSE(f.ctl->transfers().retry(ok->id(), err));
    CHECK(err.kind == ErrorKind::Busy);
    CHECK_FALSE(f.ctl->transfers().retry(9999, err));
    CHECK(err.kind == ErrorKind::NotFound);
}

TEST_CASE("open enforces the size ceiling and UTF-8", "[unit]") {
    TransferOptions opt = smallChunks();
    opt.max_edit_bytes = 1000;
    Fixture f(opt);
    f.fs->addFile("/home/u/big.txt", std::string(1001, 'a'));
    f.fs->addFile("/home/u/bin.dat", std::string("\xFF\xFE\x00", 3));
    f.fs->addFile("/home/u/ok.txt", "caf\xC3\xA9");
    Error err;

    JobPtr big = f.ctl->open("big.txt", err);
    REQUIRE(big);
    big->wait();
    CHECK(big->error().kind == ErrorKind::TooLarge);

    JobPtr bin = f.ctl->open("bin.dat", err);
    REQUIRE(bin);
    bin->wait();
    CHECK(bin->error().kind == ErrorKind::NotUtf8);

    JobPtr ok = f.ctl->open("ok.txt", err);
    REQUIRE(ok);
    ok->wait();
    CHECK(ok->state() == JobState::Succeeded);
    CHECK(ok->text() == "caf\xC3\xA9");

    JobPtr dir = f.ctl->open("/home", err);
    REQUIRE(dir);
    dir->wait();
    CHECK(dir->error().kind == ErrorKind::IsADirectory);
}

TEST_CASE("save replaces the target atomically", "[integration]") {
    Fixture f;
    f.fs->addFile("/home/u/conf.ini", "old");
    Error err;

    SECTION("server refuses overwriting renames") {
        f.fs->setRejectOverwriteRename(true);
        JobPtr s = f.ctl->save("conf.ini", "new", err);
        REQUIRE(s);
        s->wait();
        CHECK(s->state() == JobState::Succeeded);
        std::string content;
        REQUIRE(f.fs->readFile("/home/u/conf.ini", content));
        CHECK(content == "new");
    }
    SECTION("a failed write keeps the old content and cleans up") {
        f.fs->failWritesAfterBytes(2);
        JobPtr s = f.ctl->save("conf.ini", "brand new", err);
        REQUIRE(s);
        s->wait();
        CHECK(s->state() == JobState::Failed);
        std::string content;
        REQUIRE(f.fs->readFile("/home/u/conf.ini", content));
        CHECK(content == "old");
    }
    SECTION("a new file can be created") {
        JobPtr s = f.ctl->save("fresh.txt", "hello", err);
        REQUIRE(s);
        s->wait();
        CHECK(s->state() == JobState::Succeeded);
        CHECK(f.fs->exists("/home/u/fresh.txt"));
    }
    CHECK_FALSE(hasPartFile(f.fs->names("/home/u")));
}

TEST_CASE("progress is monotonic and reaches the total", "[unit]") {
    std::mutex m;
    std::map<std::uint64_t, std::vector<std::uint64_t>> seen;
    Fixture f;
    f.ctl->transfers().setJobListener([&](const JobSnapshot& s) {
        std::lock_guard<std::mutex> lk(m);
        seen[s.id].push_back(s.bytesDone);
    });
    f.fs->addFile("/home/u/data.bin", pattern(50000));
    Error err;
    JobPtr down = f.ctl->download("/home/u/data.bin", f.local.path(), err);
    REQUIRE(down);
    down->wait();
    REQUIRE(down->state() == JobState::Succeeded);

    std::lock_guard<std::mutex> lk(m);
    const auto& v = seen[down->id()];
    REQUIRE(v.size() > 2);
    CHECK(std::is_sorted(v.begin(), v.end()));
    CHECK(v.back() == 50000);
}

TEST_CASE("connection loss cancels running jobs and requires a reconnect", "[integration]") {
    Fixture f;
    f.fs->addFile("/home/u/large.bin", pattern(128 * 1024));
    f.fs->dropConnectionAfterBytes(20000);
    Error err;

    JobPtr down = f.ctl->download("/home/u/large.bin", f.local.path(), err);
    REQUIRE(down);
    down->wait();
    CHECK(down->state() == JobState::Cancelled);
    CHECK(down->error().kind == ErrorKind::Transport);
    CHECK(localNames(f.local.path()).empty());

    CHECK(f.ctl->sessions().state() == SessionState::Failed);
    DirectoryListing l;
    CHECK_FALSE(f.ctl->navigate("/home/u", l, err));
    CHECK(err.kind == ErrorKind::NotConnected);
    CHECK_FALSE(f.ctl->open("/home/u/large.bin", err));
    CHECK(err.kind == ErrorKind::NotConnected);
    CHECK_FALSE(f.ctl->currentListing(l, err));
    CHECK(err.kind == ErrorKind::NotConnected);

    SessionInfo info;
    REQUIRE(f.ctl->connect(mockOptions(), info, err));
    CHECK(info.id > f.info.id);
    JobPtr again = f.ctl->transfers().retry(down->id(), err);
    REQUIRE(again);
    again->wait();
    CHECK(again->state() == JobState::Succeeded);
    CHECK(again->sessionId() == info.id);
}

TEST_CASE("disconnect cancels and awaits in-flight jobs", "[integration]") {
    Fixture f;
    f.fs->addFile("/home/u/large.bin", pattern(256 * 1024));
    f.fs->setChunkDelayMs(3);
    Error err;

    JobPtr down = f.ctl->download("/home/u/large.bin", f.local.path(), err);
    REQUIRE(down);
    REQUIRE(waitUntil([&] { return down->bytesDone() > 0; }));
    f.ctl->disconnect();
    CHECK(down->settled());
    CHECK(down->state() == JobState::Cancelled);
    CHECK(f.fs->liveConnections() == 0);
    CHECK(localNames(f.local.path()).empty());
}

TEST_CASE("registry keeps settled jobs until forgotten", "[unit]") {
    Fixture f;
    Error err;
    f.fs->addFile("/home/u/a", "a");
    JobPtr j = f.ctl->remove("/home/u/a", err);
    REQUIRE(j);
    j->wait();

    auto& tc = f.ctl->transfers();
    REQUIRE(tc.jobs().size() == 1);
    CHECK(tc.jobs()[0].state == JobState::Succeeded);
    CHECK(tc.forget(j->id()));
    CHECK(tc.jobs().empty());
    CHECK_FALSE(tc.forget(j->id()));

    JobPtr k = f.ctl->remove("/home/u/none", err);
    REQUIRE(k);
    k->wait();
    tc.clearCompleted();
    CHECK(tc.jobs().empty());
}

TEST_CASE("cancelAll stops running and pending jobs", "[integration]") {
    TransferOptions opt = smallChunks();
    opt.workers = 1;
    Fixture f(opt);
    f.fs->addFile("/home/u/one.bin", pattern(256 * 1024));
    f.fs->addFile("/home/u/two.bin", pattern(256 * 1024, 3));
    f.fs->setChunkDelayMs(3);
    Error err;

    JobPtr first = f.ctl->download("/home/u/one.bin", f.local.path(), err);
    REQUIRE(first);
    JobPtr second = f.ctl->download("/home/u/two.bin", f.local.path(), err);
    REQUIRE(second);
    REQUIRE(waitUntil([&] { return first->bytesDone() > 0; }));
    CHECK_FALSE(second->waitFor(std::chrono::milliseconds(1)));

    f.ctl->transfers().cancelAll();
    REQUIRE(first->waitFor(std::chrono::milliseconds(5000)));
    REQUIRE(second->waitFor(std::chrono::milliseconds(5000)));
    CHECK(first->state() == JobState::Cancelled);
    CHECK(second->state() == JobState::Cancelled);
    CHECK(second->bytesDone() == 0);
    CHECK(localNames(f.local.path()).empty());
}

TEST_CASE("speed limit paces transfers at chunk boundaries", "[integration]") {
    Fixture f;
    f.fs->addFile("/home/u/paced.bin", pattern(64 * 1024));
    f.ctl->transfers().setSpeedLimitKBps(64);
    CHECK(f.ctl->transfers().speedLimitKBps() == 64);
    Error err;

    const auto start = std::chrono::steady_clock::now();
    JobPtr down = f.ctl->download("/home/u/paced.bin", f.local.path(), err);
    REQUIRE(down);
    down->wait();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(down->state() == JobState::Succeeded);
    CHECK(elapsed >= std::chrono::milliseconds(700));

    f.ctl->transfers().setSpeedLimitKBps(-5);
    CHECK(f.ctl->transfers().speedLimitKBps() == 0);
}

TEST_CASE("cancelling an upload mid-stream removes the temporary file", "[integration]") {
    Fixture f;
    f.fs->setChunkDelayMs(3);
    Error err;
    writeLocal(f.local.file("big.bin"), pattern(256 * 1024));

    JobPtr up = f.ctl->upload(f.local.file("big.bin"), "/home/u", err);
    REQUIRE(up);
    REQUIRE(waitUntil([&] { return up->bytesDone() > 0; }));
    up->cancel();
    up->wait();

    CHECK(up->state() == JobState::Cancelled);
    CHECK(up->bytesDone() < up->bytesTotal());
    CHECK_FALSE(f.fs->exists("/home/u/big.bin"));
    CHECK_FALSE(hasPartFile(f.fs->names("/home/u")));
}

TEST_CASE("cancelling a save mid-stream keeps the previous content", "[integration]") {
    Fixture f;
    f.fs->addFile("/home/u/doc.txt", "original");
    f.fs->setChunkDelayMs(3);
    Error err;

    JobPtr save = f.ctl->save("/home/u/doc.txt", pattern(256 * 1024), err);
    REQUIRE(save);
    REQUIRE(waitUntil([&] { return save->bytesDone() > 0; }));
    save->cancel();
    save->wait();

    CHECK(save->state() == JobState::Cancelled);
    std::string content;
    REQUIRE(f.fs->readFile("/home/u/doc.txt", content));
    CHECK(content == "original");
    CHECK_FALSE(hasPartFile(f.fs->names("/home/u")));
}

} // namespace test
} // namespace datadrift
