#include <catch2/catch.hpp>

#include "security/Flags.hpp"
#include "security/MetadataCrossRef.hpp"

#include <string>
#include <vector>

using security::cross_reference_metadata;
using security::MetadataResult;

static pdf::Metadata meta(const std::string& title, const std::string& keywords) {
    pdf::Metadata md;
    for (const auto& f : pdf::metadata_fields()) {
        if (f == "title") md.emplace_back(f, title);
        else if (f == "keywords") md.emplace_back(f, keywords);
        else md.emplace_back(f, "");
    }
    return md;
}

static const std::vector<security::MismatchPair>& pairs() {
    return security::default_scan_config().metadata_mismatches;
}

TEST_CASE("entry-level title contradicted by senior text", "[metadata]") {
    std::vector<std::string> flags;
    const MetadataResult r = cross_reference_metadata("Senior Staff Engineer with 15 years",
                                                      meta("Entry Level Software Engineer", ""), pairs(), flags);
    REQUIRE(r.mismatch);
    REQUIRE(flags == std::vector<std::string>{
        "METADATA_MISMATCH: 'entry level' in metadata but 'senior' in text"});
    REQUIRE(r.hits.size() == 1);
}

TEST_CASE("keywords are checked as well as the title", "[metadata]") {
    std::vector<std::string> flags;
    const MetadataResult r = cross_reference_metadata("... promoted to Director of Sales",
                                                      meta("Resume", "Intern, marketing"), pairs(), flags);
    REQUIRE(r.mismatch);
    REQUIRE(flags.size() == 1);
    REQUIRE(security::flag_code(flags[0]) == security::flag::kMetadataMismatch);
}

TEST_CASE("several pairs can fire in order", "[metadata]") {
    std::vector<std::string> flags;
    cross_reference_metadata("senior director", meta("Junior intern", "entry level"), pairs(), flags);
    REQUIRE(flags.size() == 3);
    REQUIRE(flags[0].find("'entry level'") != std::string::npos);
    REQUIRE(flags[1].find("'junior'") != std::string::npos);
    REQUIRE(flags[2].find("'intern'") != std::string::npos);
}

TEST_CASE("no mismatch without both halves of a pair", "[metadata]") {
    std::vector<std::string> flags;

    SECTION("empty metadata") {
        REQUIRE_FALSE(cross_reference_metadata("Senior engineer", meta("", ""), pairs(), flags).mismatch);
    }
    SECTION("metadata term only") {
        REQUIRE_FALSE(cross_reference_metadata("Graduate developer", meta("Entry level", ""), pairs(), flags).mismatch);
    }
    SECTION("text term only in metadata") {
        REQUIRE_FALSE(cross_reference_metadata("Entry level analyst", meta("Senior", ""), pairs(), flags).mismatch);
    }
    REQUIRE(flags.empty());
}

TEST_CASE("matching ignores case", "[metadata]") {
    std::vector<std::string> flags;
    REQUIRE(cross_reference_metadata("SENIOR", meta("ENTRY LEVEL", ""), pairs(), flags).mismatch);
}
