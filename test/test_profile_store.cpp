#include "ProfileStore.hpp"
#include "SecretStore.hpp"
#include "util.hpp"
#include <catch2/catch.hpp>

namespace datadrift {
namespace test {

namespace {

ConnectionProfile makeProfile(const QString& name, const std::string& host) {
    ConnectionProfile p;
    p.name = name;
    p.opt.host = host;
    p.opt.port = 2222;
    p.opt.username = "deploy";
    p.opt.start_path = "/srv/app";
    p.opt.password = std::string("hunter2");
    p.opt.private_key_path = std::string("/home/me/.ssh/id_ed25519");
    p.opt.private_key_passphrase = std::string("open sesame");
    p.opt.known_hosts_path = std::string("/home/me/.ssh/known_hosts");
    p.opt.known_hosts_policy = KnownHostsPolicy::AcceptNew;
    return p;
}

} // namespace

TEST_CASE("profiles round-trip without secrets", "[unit]") {
    TempDir dir;
    const QString ini = QString::fromStdString(dir.file("profiles.ini"));
    {
        ProfileStore store(ini);
        store.upsert(makeProfile("prod", "prod.example.com"));
        store.upsert(makeProfile("staging", "staging.example.com"));
    }

    ProfileStore reopened(ini);
    const auto all = reopened.load();
    REQUIRE(all.size() == 2);
    CHECK(all[0].name == "prod");
    CHECK(all[1].name == "staging");

    ConnectionProfile p;
    REQUIRE(reopened.find("prod", p));
    CHECK(p.opt.host == "prod.example.com");
    CHECK(p.opt.port == 2222);
    CHECK(p.opt.username == "deploy");
    CHECK(p.opt.start_path == "/srv/app");
    REQUIRE(p.opt.private_key_path);
    CHECK(*p.opt.private_key_path == "/home/me/.ssh/id_ed25519");
    REQUIRE(p.opt.known_hosts_path);
    CHECK(*p.opt.known_hosts_path == "/home/me/.ssh/known_hosts");
    CHECK(p.opt.known_hosts_policy == KnownHostsPolicy::AcceptNew);
    CHECK_FALSE(p.opt.password);
    CHECK_FALSE(p.opt.private_key_passphrase);

    const std::string raw = readLocal(dir.file("profiles.ini"));
    CHECK(raw.find("hunter2") == std::string::npos);
    CHECK(raw.find("open sesame") == std::string::npos);
}

TEST_CASE("upsert replaces by name and remove drops the profile", "[unit]") {
    TempDir dir;
    ProfileStore store(QString::fromStdString(dir.file("profiles.ini")));
    store.upsert(makeProfile("box", "a.example.com"));
    store.upsert(makeProfile("box", "b.example.com"));

    auto all = store.load();
    REQUIRE(all.size() == 1);
    CHECK(all[0].opt.host == "b.example.com");

    CHECK(store.remove("box"));
    CHECK_FALSE(store.remove("box"));
    CHECK(store.load().isEmpty());
    ConnectionProfile p;
    CHECK_FALSE(store.find("box", p));
}

TEST_CASE("secret store keeps credentials keyed by profile", "[unit]") {
    SecretStore secrets;
    const QString key = ProfileStore::passwordKey("ci-runner");
    CHECK(key == "profile:ci-runner:password");
    CHECK(ProfileStore::passphraseKey("ci-runner") == "profile:ci-runner:keypass");

    secrets.setSecret(key, "tok");
    auto v = secrets.getSecret(key);
    REQUIRE(v);
    CHECK(*v == "tok");
    secrets.removeSecret(key);
    CHECK_FALSE(secrets.getSecret(key));
}

} // namespace test
} // namespace datadrift
