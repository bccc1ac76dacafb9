#include <catch2/catch.hpp>

#include "pdf/FixtureDocument.hpp"
#include "security/Flags.hpp"
#include "security/InvisibleTextDetector.hpp"

#include <string>

using nlohmann::json;
using security::detect_invisible_text;
using security::InvisibleTextResult;
namespace flag = security::flag;

static std::string fixture(const char* name) {
    return std::string(FIXTURE_DIR) + "/" + name;
}

TEST_CASE("white text is invisible, black is not", "[invisible]") {
    const auto& cfg = security::default_scan_config();
    REQUIRE(security::is_invisible_color(16777215, cfg));
    REQUIRE_FALSE(security::is_invisible_color(0, cfg));
    REQUIRE_FALSE(security::is_invisible_color(0xFEFEFE, cfg));
}

TEST_CASE("one flag per affected page, every span counted", "[invisible]") {
    const auto d = pdf::FixtureDocument::load(fixture("invisible_text.json"));
    std::vector<std::string> flags;
    const InvisibleTextResult r = detect_invisible_text(d, security::default_scan_config(), d.page_count(),
                                                        security::Deadline(), flags);
    REQUIRE(r.detected);
    REQUIRE(r.flagged_pages == 2);
    REQUIRE(r.invisible_span_count == 3);
    REQUIRE(r.pages_scanned == 3);
    REQUIRE(flags == std::vector<std::string>(2, flag::kInvisibleText));
}

TEST_CASE("a single black span is clean", "[invisible]") {
    const auto d = pdf::FixtureDocument::from_json(json::parse(R"({"pages": [{"spans": [{"text": "x", "color": 0}]}]})"));
    std::vector<std::string> flags;
    const InvisibleTextResult r = detect_invisible_text(d, security::default_scan_config(), 1, security::Deadline(), flags);
    REQUIRE_FALSE(r.detected);
    REQUIRE(flags.empty());
}

TEST_CASE("unreadable pages fail closed unless configured otherwise", "[invisible]") {
    const auto d = pdf::FixtureDocument::load(fixture("render_error.json"));
    security::ScanConfig cfg = security::default_scan_config();
    std::vector<std::string> flags;

    SECTION("fail closed") {
        const InvisibleTextResult r = detect_invisible_text(d, cfg, d.page_count(), security::Deadline(), flags);
        REQUIRE(flags == std::vector<std::string>{"RENDERING_INSPECTION_ERROR: page 1: content stream is corrupt"});
        REQUIRE(r.outcome.status == security::StageStatus::Degraded);
        REQUIRE(r.pages_scanned == 1);
    }

    SECTION("fail open") {
        cfg.fail_open_on_rendering_error = true;
        const InvisibleTextResult r = detect_invisible_text(d, cfg, d.page_count(), security::Deadline(), flags);
        REQUIRE(flags.empty());
        REQUIRE_FALSE(r.detected);
        REQUIRE(r.outcome.status == security::StageStatus::Degraded);
    }
}

TEST_CASE("custom invisible colors", "[invisible]") {
    const auto d = pdf::FixtureDocument::from_json(json::parse(R"({"pages": [{"spans": [{"text": "x", "color": 16711422}]}]})"));
    security::ScanConfig cfg = security::default_scan_config();
    cfg.invisible_colors.push_back(0xFEFEFE);

    std::vector<std::string> flags;
    REQUIRE(detect_invisible_text(d, cfg, 1, security::Deadline(), flags).detected);
}
