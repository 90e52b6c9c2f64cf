#include "datadrift/Utf8.hpp"
#include <catch2/catch.hpp>

namespace datadrift {
namespace test {

TEST_CASE("isValidUtf8 accepts well-formed text", "[unit]") {
    CHECK(isValidUtf8(std::string()));
    CHECK(isValidUtf8(std::string("plain ascii\n")));
    CHECK(isValidUtf8(std::string("caf\xC3\xA9")));                 // U+00E9
    CHECK(isValidUtf8(std::string("\xE2\x82\xAC")));                // U+20AC
    CHECK(isValidUtf8(std::string("\xF0\x9F\x98\x80")));            // U+1F600
    CHECK(isValidUtf8(std::string("\xF4\x8F\xBF\xBF")));            // U+10FFFF
    CHECK(isValidUtf8(std::string("a\0b", 3)));
}

TEST_CASE("isValidUtf8 rejects malformed input", "[unit]") {
    CHECK_FALSE(isValidUtf8(std::string("\xC3")));                  // truncated
    CHECK_FALSE(isValidUtf8(std::string("\xE2\x82")));              // truncated
    CHECK_FALSE(isValidUtf8(std::string("\x80")));                  // stray continuation
    CHECK_FALSE(isValidUtf8(std::string("\xC0\xAF")));              // overlong
    CHECK_FALSE(isValidUtf8(std::string("\xE0\x80\xAF")));          // overlong
    CHECK_FALSE(isValidUtf8(std::string("\xED\xA0\x80")));          // surrogate
    CHECK_FALSE(isValidUtf8(std::string("\xF4\x90\x80\x80")));      // above U+10FFFF
    CHECK_FALSE(isValidUtf8(std::string("\xFF")));
    CHECK_FALSE(isValidUtf8(std::string("ok\xC3(")));
}

} // namespace test
} // namespace datadrift
