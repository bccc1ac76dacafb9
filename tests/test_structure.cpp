#include <catch2/catch.hpp>

#include "pdf/FixtureDocument.hpp"
#include "security/Flags.hpp"
#include "security/StructureValidator.hpp"

using nlohmann::json;
using security::check_structure;
using security::StructureResult;
namespace flag = security::flag;

static pdf::FixtureDocument doc(const char* text) {
    return pdf::FixtureDocument::from_json(json::parse(text));
}

TEST_CASE("a plain document is structurally clean", "[structure]") {
    const auto d = doc(R"({"pages": [{"spans": [{"text": "hi"}], "annotations": [{"subtype": "Link", "action": "URI"}]}]})");
    std::vector<std::string> flags;
    const StructureResult r = check_structure(d, d.page_count(), security::Deadline(), flags);
    REQUIRE(r.clean);
    REQUIRE(flags.empty());
    REQUIRE(r.outcome.status == security::StageStatus::Ok);
}

TEST_CASE("one flag per form widget", "[structure]") {
    const auto d = doc(R"({"pages": [
        {"annotations": [{"subtype": "Widget"}, {"subtype": "Widget"}]},
        {"annotations": [{"subtype": "Widget"}]}
    ]})");
    std::vector<std::string> flags;
    const StructureResult r = check_structure(d, d.page_count(), security::Deadline(), flags);
    REQUIRE_FALSE(r.clean);
    REQUIRE(r.widget_count == 3);
    REQUIRE(flags == std::vector<std::string>(3, flag::kFormWidget));
}

TEST_CASE("embedded files are flagged once", "[structure]") {
    SECTION("name tree entries") {
        const auto d = doc(R"({"pages": [{}], "embedded_files": 4})");
        std::vector<std::string> flags;
        const StructureResult r = check_structure(d, 1, security::Deadline(), flags);
        REQUIRE(r.embedded_files == 4);
        REQUIRE(flags == std::vector<std::string>{flag::kEmbeddedFiles});
    }
    SECTION("file attachment annotations") {
        const auto d = doc(R"({"pages": [{"annotations": [{"subtype": "FileAttachment"}, {"subtype": "FileAttachment"}]}]})");
        std::vector<std::string> flags;
        check_structure(d, 1, security::Deadline(), flags);
        REQUIRE(flags == std::vector<std::string>{flag::kEmbeddedFiles});
    }
}

TEST_CASE("JavaScript actions are flagged once", "[structure]") {
    const auto d = doc(R"({
        "pages": [{"annotations": [{"subtype": "Link", "action": "JavaScript"}]}],
        "document_actions": ["JavaScript", "GoTo"]
    })");
    std::vector<std::string> flags;
    const StructureResult r = check_structure(d, 1, security::Deadline(), flags);
    REQUIRE(r.javascript_actions == 2);
    REQUIRE(flags == std::vector<std::string>{flag::kJavaScript});
}

TEST_CASE("inspection failure degrades the stage", "[structure]") {
    const auto d = doc(R"({"pages": [{"annotation_error": "bad /Annots"}]})");
    std::vector<std::string> flags;
    const StructureResult r = check_structure(d, 1, security::Deadline(), flags);
    REQUIRE_FALSE(r.clean);
    REQUIRE(flags == std::vector<std::string>{"PDF_STRUCTURE_ERROR: bad /Annots"});
    REQUIRE(r.outcome.status == security::StageStatus::Degraded);
}

TEST_CASE("pages past the limit are not inspected", "[structure]") {
    const auto d = doc(R"({"pages": [{}, {"annotations": [{"subtype": "Widget"}]}]})");
    std::vector<std::string> flags;
    REQUIRE(check_structure(d, 1, security::Deadline(), flags).clean);
}
