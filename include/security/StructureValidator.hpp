#pragma once

#include <string>
#include <vector>

#include "pdf/Document.hpp"
#include "security/Deadline.hpp"
#include "security/ScanReport.hpp"

namespace security {

struct StructureResult {
    bool clean = true;  // no flags raised by this check
    int widget_count = 0;
    int embedded_files = 0;       // name-tree entries + FileAttachment annotations
    int javascript_actions = 0;
    StageOutcome outcome{"structure", StageStatus::Ok, ""};
};

// Inspects annotations of the first `max_pages` pages and document-level
// attachments / actions. Inspection failures become PDF_STRUCTURE_ERROR
// (stage Degraded); only ScanTimeout propagates.
StructureResult check_structure(const pdf::Document& doc,
                                int max_pages,
                                const Deadline& deadline,
                                std::vector<std::string>& flags);

}  // namespace security
