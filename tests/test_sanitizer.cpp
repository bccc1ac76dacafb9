#include <catch2/catch.hpp>

#include "security/Flags.hpp"
#include "security/TextSanitizer.hpp"

#include <string>
#include <vector>

using security::sanitize;
using security::SanitizeResult;
namespace flag = security::flag;

TEST_CASE("zero-width characters are stripped, one flag per distinct code point", "[sanitize]") {
    const std::vector<std::string> zw = {"\u200B", "\u200C", "\u200D", "\u2060", "\uFEFF"};

    SECTION("each code point alone") {
        for (const auto& c : zw) {
            const SanitizeResult r = sanitize("Sen" + c + "ior" + c + " Engineer");
            REQUIRE(r.text == "Senior Engineer");
            REQUIRE(r.zero_width_found);
            REQUIRE(r.flags == std::vector<std::string>{flag::kZeroWidthChars});
        }
    }

    SECTION("all five in one string") {
        std::string in = "a";
        for (const auto& c : zw) in += c + "b";
        const SanitizeResult r = sanitize(in);
        REQUIRE(r.text == "abbbbb");
        REQUIRE(r.flags.size() == 5);
        REQUIRE(security::count_flag(r.flags, flag::kZeroWidthChars) == 5);
        for (const auto& c : zw) REQUIRE(r.text.find(c) == std::string::npos);
    }
}

TEST_CASE("every Cyrillic look-alike maps to its Latin letter", "[sanitize]") {
    const std::vector<std::pair<std::string, std::string>> table = {
        {"а", "a"}, {"е", "e"}, {"о", "o"}, {"р", "p"}, {"с", "c"},
        {"у", "y"}, {"х", "x"}, {"А", "A"}, {"В", "B"}, {"Е", "E"},
        {"К", "K"}, {"М", "M"}, {"Н", "H"}, {"О", "O"}, {"Р", "P"},
        {"С", "C"}, {"Т", "T"}, {"Х", "X"},
    };
    REQUIRE(security::default_scan_config().homoglyphs.size() == table.size());

    for (const auto& e : table) {
        const SanitizeResult r = sanitize(e.first + e.first);
        INFO("homoglyph " << e.first);
        REQUIRE(r.text == e.second + e.second);
        REQUIRE(r.homoglyphs_detected);
        REQUIRE(r.flags == std::vector<std::string>{flag::kHomoglyphs});
    }
}

TEST_CASE("homoglyph flags follow table order, one per distinct entry", "[sanitize]") {
    // е twice, о once, р once
    const SanitizeResult r = sanitize("Dеvеlореr");
    REQUIRE(r.text == "Developer");
    REQUIRE(r.flags.size() == 3);
    REQUIRE_FALSE(r.zero_width_found);
}

TEST_CASE("NFKC folds compatibility forms without raising flags", "[sanitize]") {
    SECTION("ligature") {
        const SanitizeResult r = sanitize("ﬁle systems");
        REQUIRE(r.text == "file systems");
        REQUIRE(r.flags.empty());
    }
    SECTION("fullwidth letters") {
        const SanitizeResult r = sanitize("Ｓｅｎｉｏｒ");
        REQUIRE(r.text == "Senior");
        REQUIRE(r.flags.empty());
    }
    SECTION("plain ASCII is unchanged") {
        const SanitizeResult r = sanitize("Jane Doe, C++ engineer\n");
        REQUIRE(r.text == "Jane Doe, C++ engineer\n");
        REQUIRE(r.flags.empty());
        REQUIRE_FALSE(r.homoglyphs_detected);
    }
    SECTION("invalid UTF-8 becomes U+FFFD") {
        const SanitizeResult r = sanitize(std::string("ab\xFF") + "cd");
        REQUIRE(r.text == "ab\xEF\xBF\xBD" "cd");
    }
}

TEST_CASE("NFKC output that produces a homoglyph is normalized again", "[sanitize]") {
    // U+1E030 MODIFIER LETTER CYRILLIC SMALL A decomposes to U+0430
    const SanitizeResult r = sanitize("\U0001E030dmin");
    REQUIRE(r.text == "admin");
    REQUIRE(r.homoglyphs_detected);
}

TEST_CASE("sanitize is idempotent", "[sanitize]") {
    const std::vector<std::string> inputs = {
        "",
        "Plain text",
        "Sеniоr\u200B Enginееr ﬁx Ａ",
        "\u200D\u200D\uFEFFАВЕКМНОРСТХ",
        "\U0001E030\u200B\U0001E030",
        std::string("bad \xC3 utf8"),
    };

    for (const auto& in : inputs) {
        const SanitizeResult once = sanitize(in);
        const SanitizeResult twice = sanitize(once.text);
        REQUIRE(twice.text == once.text);
        REQUIRE(twice.flags.empty());
    }
}

TEST_CASE("sanitize honors a custom table", "[sanitize]") {
    security::ScanConfig cfg;
    cfg.zero_width_chars = {"\u00AD"};
    cfg.homoglyphs = {{"Α", "A"}};  // Greek capital alpha

    const SanitizeResult r = sanitize("Αuto\u00ADmation\u200B", cfg);
    REQUIRE(r.text == "Automation\u200B");
    REQUIRE(r.zero_width_found);
    REQUIRE(r.homoglyphs_detected);
}
