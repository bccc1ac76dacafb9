#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "pdf/Document.hpp"

namespace security {

enum class StageStatus {
    Ok,
    Degraded,  // stage finished with reduced coverage
    Fatal      // scan stopped here
};

const char* to_string(StageStatus s);

struct StageOutcome {
    std::string stage;  // "parse" | "structure" | "invisible_text" | "extract_text" | ...
    StageStatus status = StageStatus::Ok;
    std::string reason;
};

struct ScanReport {
    bool is_safe = false;            // flags.empty() when the report was finalized
    std::vector<std::string> flags;  // detection order, not deduplicated
    bool invisible_text_detected = false;
    bool homoglyphs_detected = false;
    bool metadata_mismatch = false;
    std::string sanitized_text;
    pdf::Metadata metadata;

    std::string source;  // file path, "<buffer>" or "<document>"
    int page_count = 0;
    int pages_scanned = 0;
    int invisible_span_count = 0;
    std::vector<StageOutcome> stages;

    // flat wire form; `include_text` = false drops sanitized_text
    nlohmann::json to_json(bool include_text = true) const;
};

void write_scan_reports(const std::filesystem::path& path, const std::vector<ScanReport>& reports);

}  // namespace security
