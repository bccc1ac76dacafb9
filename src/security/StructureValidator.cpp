#include "security/StructureValidator.hpp"
#include "security/Flags.hpp"

namespace security {

StructureResult check_structure(const pdf::Document& doc,
                                int max_pages,
                                const Deadline& deadline,
                                std::vector<std::string>& flags) {
    StructureResult res;
    const size_t before = flags.size();
    int attachment_annots = 0;

    try {
        for (int i = 0; i < max_pages; ++i) {
            deadline.check("structure check");

            for (const auto& a : doc.annotations(i)) {
                if (a.subtype == "Widget") {
                    flags.push_back(flag::kFormWidget);
                    ++res.widget_count;
                }
                if (a.subtype == "FileAttachment") ++attachment_annots;
                if (a.action == "JavaScript") ++res.javascript_actions;
            }
        }

        res.embedded_files = doc.embedded_file_count() + attachment_annots;
        if (res.embedded_files > 0) flags.push_back(flag::kEmbeddedFiles);

        for (const auto& action : doc.document_actions()) {
            if (action == "JavaScript") ++res.javascript_actions;
        }
        if (res.javascript_actions > 0) flags.push_back(flag::kJavaScript);
    } catch (const ScanTimeout&) {
        throw;
    } catch (const std::exception& e) {
        flags.push_back(with_detail(flag::kStructureError, e.what()));
        res.outcome.status = StageStatus::Degraded;
        res.outcome.reason = e.what();
    }

    res.clean = flags.size() == before;
    return res;
}

}  // namespace security
