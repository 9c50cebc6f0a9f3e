#include <catch2/catch.hpp>

#include "../src/utils.hpp"
using namespace shuttle::utils;

TEST_CASE("toLower", "[utils]") {
    REQUIRE(toLower("Content-Length") == "content-length");
}

TEST_CASE("toUpper", "[utils]") {
    REQUIRE(toUpper("Patch") == "PATCH");
}

TEST_CASE("equalsIgnoreCase", "[utils]") {
    REQUIRE(equalsIgnoreCase("User-Agent", "user-agent"));
    REQUIRE(equalsIgnoreCase("", ""));
    REQUIRE_FALSE(equalsIgnoreCase("User-Agent", "User-Agents"));
    REQUIRE_FALSE(equalsIgnoreCase("Accept", "Accent"));
}

TEST_CASE("trim", "[utils]") {
    REQUIRE(trim("  text/plain\r\n") == "text/plain");
    REQUIRE(trim("\t") == "");
    REQUIRE(trim("a b") == "a b");
}

TEST_CASE("base64Encode", "[utils]") {
    REQUIRE(base64Encode("") == "");
    REQUIRE(base64Encode("f") == "Zg==");
    REQUIRE(base64Encode("fo") == "Zm8=");
    REQUIRE(base64Encode("foo") == "Zm9v");
    REQUIRE(base64Encode("foob") == "Zm9vYg==");
    REQUIRE(base64Encode("fooba") == "Zm9vYmE=");
    REQUIRE(base64Encode("foobar") == "Zm9vYmFy");
    REQUIRE(base64Encode("user:pass") == "dXNlcjpwYXNz");
}

TEST_CASE("formUrlEncode", "[utils]") {
    REQUIRE(formUrlEncode("abc-._~XYZ019") == "abc-._~XYZ019");
    REQUIRE(formUrlEncode("a b") == "a+b");
    REQUIRE(formUrlEncode("a&b=c") == "a%26b%3Dc");
    REQUIRE(formUrlEncode("\xC3\xA9") == "%C3%A9");
}
