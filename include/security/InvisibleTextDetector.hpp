#pragma once

#include <string>
#include <vector>

#include "pdf/Document.hpp"
#include "security/Deadline.hpp"
#include "security/ScanConfig.hpp"
#include "security/ScanReport.hpp"

namespace security {

struct InvisibleTextResult {
    bool detected = false;
    int invisible_span_count = 0;  // every matching span, including ones after a page's first
    int flagged_pages = 0;
    int pages_scanned = 0;
    StageOutcome outcome{"invisible_text", StageStatus::Ok, ""};
};

bool is_invisible_color(int color, const ScanConfig& cfg);

// One INVISIBLE_TEXT_DETECTED per page holding at least one span in an
// invisible color. Unreadable pages raise RENDERING_INSPECTION_ERROR unless
// cfg.fail_open_on_rendering_error is set, in which case they are skipped.
InvisibleTextResult detect_invisible_text(const pdf::Document& doc,
                                          const ScanConfig& cfg,
                                          int max_pages,
                                          const Deadline& deadline,
                                          std::vector<std::string>& flags);

}  // namespace security
