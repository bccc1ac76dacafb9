#include <catch2/catch.hpp>

#include "text/TextUtil.hpp"

#include <stdexcept>
#include <string>

TEST_CASE("unicode lowercase", "[textutil]") {
    REQUIRE(textutil::to_lower("Senior ENGINEER") == "senior engineer");
    REQUIRE(textutil::to_lower("ÉCOLE") == "école");
    REQUIRE(textutil::to_lower("СТАЖЁР") == "стажёр");
}

TEST_CASE("contains and replace_all", "[textutil]") {
    REQUIRE(textutil::contains("entry level", "level"));
    REQUIRE_FALSE(textutil::contains("entry level", ""));

    std::string s = "a--b--c";
    REQUIRE(textutil::replace_all(s, "--", "-") == 2);
    REQUIRE(s == "a-b-c");
    REQUIRE(textutil::replace_all(s, "", "x") == 0);
}

TEST_CASE("code point parsing and encoding", "[textutil]") {
    REQUIRE(textutil::parse_code_point("U+200B") == 0x200B);
    REQUIRE(textutil::parse_code_point("u+feff") == 0xFEFF);
    REQUIRE(textutil::parse_code_point("2060") == 0x2060);
    REQUIRE_THROWS_AS(textutil::parse_code_point("U+"), std::invalid_argument);
    REQUIRE_THROWS_AS(textutil::parse_code_point("U+12G4"), std::invalid_argument);

    REQUIRE(textutil::utf8_from_code_point(0x41) == "A");
    REQUIRE(textutil::utf8_from_code_point(0x200B) == "\u200B");
    REQUIRE(textutil::utf8_from_code_point(0x1E030) == "\U0001E030");
    REQUIRE_THROWS_AS(textutil::utf8_from_code_point(0xD800), std::invalid_argument);
    REQUIRE_THROWS_AS(textutil::utf8_from_code_point(0x110000), std::invalid_argument);

    REQUIRE(textutil::code_point_label("\uFEFF") == "U+FEFF");
    REQUIRE(textutil::code_point_label("\U0001E030") == "U+1E030");
}
