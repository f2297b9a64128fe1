#include <catch2/catch_test_macros.hpp>

#include "voice_gateway/utils/text.hpp"

#include <string>

using namespace voice_gateway::utils;

TEST_CASE("remove_emojis strips emoji codepoints") {
    const std::string emoji = "\xF0\x9F\x98\x80";
    const std::string input = "Hello " + emoji + " world";
    const std::string expected = "Hello  world";
    REQUIRE(remove_emojis(input) == expected);
}

TEST_CASE("remove_emojis leaves plain ASCII untouched") {
    const std::string input = "Plain text only.";
    REQUIRE(remove_emojis(input) == input);
}

TEST_CASE("sanitize_for_speech replaces typographic characters") {
    const std::string input = "\xE2\x80\x9CHi\xE2\x80\x9D \xE2\x80\x94 it\xE2\x80\x99s fine\xE2\x80\xA6";
    REQUIRE(sanitize_for_speech(input) == "\"Hi\" - it's fine...");
}

TEST_CASE("sanitize_for_speech keeps non-latin text") {
    const std::string input = "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82";
    REQUIRE(sanitize_for_speech(input) == input);
}

TEST_CASE("trim and is_blank handle whitespace") {
    REQUIRE(trim("  Hello\tWORLD \n") == "Hello\tWORLD");
    REQUIRE(trim("") == "");
    REQUIRE(is_blank(" \t\n"));
    REQUIRE_FALSE(is_blank(" a "));
}

TEST_CASE("is_recognition_noise accepts one or two digits with punctuation") {
    REQUIRE(is_recognition_noise("7"));
    REQUIRE(is_recognition_noise(" 42. "));
    REQUIRE(is_recognition_noise("3,"));
    REQUIRE_FALSE(is_recognition_noise("123"));
    REQUIRE_FALSE(is_recognition_noise("7 apples"));
    REQUIRE_FALSE(is_recognition_noise("yes"));
    REQUIRE_FALSE(is_recognition_noise(""));
}

TEST_CASE("utf8_length counts code points") {
    REQUIRE(utf8_length("abc") == 3);
    REQUIRE(utf8_length("\xD0\x9F\xD1\x80") == 2);
    REQUIRE(utf8_length("\xE2\x80\xA6") == 1);
}
