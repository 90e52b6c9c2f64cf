#include "datadrift/RemotePath.hpp"
#include <catch2/catch.hpp>

namespace datadrift {
namespace test {

using namespace remotepath;

TEST_CASE("normalize", "[unit]") {
    CHECK(normalize("/") == "/");
    CHECK(normalize("") == ".");
    CHECK(normalize("//home///u//") == "/home/u");
    CHECK(normalize("/home/./u/.") == "/home/u");
    CHECK(normalize("/home/u/../v") == "/home/v");
    CHECK(normalize("/..") == "/");
    CHECK(normalize("/../../etc") == "/etc");
    CHECK(normalize("a/../..") == "..");
    CHECK(normalize("a/b/..") == "a");
}

TEST_CASE("resolve", "[unit]") {
    CHECK(resolve("/home/u", "docs") == "/home/u/docs");
    CHECK(resolve("/home/u", "../v/./x") == "/home/v/x");
    CHECK(resolve("/home/u", "/etc") == "/etc");
    CHECK(resolve("/home/u", "") == "/home/u");
    CHECK(resolve("/", "../../..") == "/");
    CHECK(resolve("", "x") == "/x");
}

TEST_CASE("parent and baseName", "[unit]") {
    CHECK(parent("/") == "/");
    CHECK(parent("/a") == "/");
    CHECK(parent("/a/b/") == "/a");
    CHECK(baseName("/") == "");
    CHECK(baseName("/a/b.txt") == "b.txt");
    CHECK(baseName("/a/b/") == "b");
    CHECK(join("/", "a") == "/a");
    CHECK(join("/a", "b") == "/a/b");
    CHECK(join("/a/", "b") == "/a/b");
}

} // namespace test
} // namespace datadrift
