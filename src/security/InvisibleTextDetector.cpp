#include "security/InvisibleTextDetector.hpp"
#include "security/Flags.hpp"

#include <algorithm>

namespace security {

bool is_invisible_color(int color, const ScanConfig& cfg) {
    const int rgb = color & 0xFFFFFF;
    return std::find(cfg.invisible_colors.begin(), cfg.invisible_colors.end(), rgb) != cfg.invisible_colors.end();
}

InvisibleTextResult detect_invisible_text(const pdf::Document& doc,
                                          const ScanConfig& cfg,
                                          int max_pages,
                                          const Deadline& deadline,
                                          std::vector<std::string>& flags) {
    InvisibleTextResult res;
    int unreadable = 0;
    std::string first_failure;

    for (int i = 0; i < max_pages; ++i) {
        deadline.check("invisible-text inspection");

        std::vector<pdf::PageSpan> spans;
        try {
            spans = doc.page_spans(i);
        } catch (const std::exception& e) {
            const std::string detail = "page " + std::to_string(i) + ": " + e.what();
            if (first_failure.empty()) first_failure = detail;
            ++unreadable;
            if (!cfg.fail_open_on_rendering_error) flags.push_back(with_detail(flag::kRenderingError, detail));
            continue;
        }

        ++res.pages_scanned;
        bool page_flagged = false;
        for (const auto& span : spans) {
            if (!is_invisible_color(span.color, cfg)) continue;
            ++res.invisible_span_count;
            if (page_flagged) continue;

            page_flagged = true;
            res.detected = true;
            ++res.flagged_pages;
            flags.push_back(flag::kInvisibleText);
        }
    }

    if (unreadable > 0) {
        res.outcome.status = StageStatus::Degraded;
        res.outcome.reason = std::to_string(unreadable) + " unreadable page(s), first: " + first_failure;
        if (cfg.fail_open_on_rendering_error) res.outcome.reason += " (treated as no invisible text)";
    }
    return res;
}

}  // namespace security
