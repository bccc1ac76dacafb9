#include "security/ScanReport.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace security {

const char* to_string(StageStatus s) {
    switch (s) {
        case StageStatus::Ok:       return "ok";
        case StageStatus::Degraded: return "degraded";
        case StageStatus::Fatal:    return "fatal";
    }
    return "unknown";
}

nlohmann::json ScanReport::to_json(bool include_text) const {
    nlohmann::json j;
    j["source"] = source;
    j["is_safe"] = is_safe;
    j["security_flags"] = flags;
    j["invisible_text_detected"] = invisible_text_detected;
    j["homoglyphs_detected"] = homoglyphs_detected;
    j["metadata_mismatch"] = metadata_mismatch;
    if (include_text) j["sanitized_text"] = sanitized_text;

    j["metadata"] = nlohmann::json::object();
    for (const auto& kv : metadata) j["metadata"][kv.first] = kv.second;

    j["page_count"] = page_count;
    j["pages_scanned"] = pages_scanned;
    j["invisible_span_count"] = invisible_span_count;

    j["stages"] = nlohmann::json::array();
    for (const auto& s : stages) {
        nlohmann::json sj;
        sj["stage"] = s.stage;
        sj["status"] = to_string(s.status);
        if (!s.reason.empty()) sj["reason"] = s.reason;
        j["stages"].push_back(sj);
    }
    return j;
}

void write_scan_reports(const fs::path& path, const std::vector<ScanReport>& reports) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    nlohmann::json j = nlohmann::json::array();
    for (const auto& r : reports) j.push_back(r.to_json());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + path.string());
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

}  // namespace security
