#include "security/ResumeScanner.hpp"

#include "pdf/MuPdfDocument.hpp"
#include "security/Flags.hpp"
#include "security/InvisibleTextDetector.hpp"
#include "security/MetadataCrossRef.hpp"
#include "security/StructureValidator.hpp"
#include "security/TextSanitizer.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace security {

static const char* kBufferSource = "<buffer>";
static const char* kDocumentSource = "<document>";

static ScanReport parse_error_report(const std::string& source, const std::string& detail) {
    ScanReport rep;
    rep.source = source;
    rep.flags.push_back(with_detail(flag::kParseError, detail));
    rep.stages.push_back({"parse", StageStatus::Fatal, detail});
    rep.is_safe = false;
    return rep;
}

static pdf::Metadata empty_metadata() {
    pdf::Metadata md;
    for (const auto& f : pdf::metadata_fields()) md.emplace_back(f, "");
    return md;
}

// ---------- NullResumeScanner ----------

static ScanReport unavailable_report(const std::string& source) {
    ScanReport rep;
    rep.source = source;
    rep.flags.push_back(flag::kScannerUnavailable);
    rep.stages.push_back({"scan", StageStatus::Fatal, "scanner disabled"});
    rep.is_safe = false;
    return rep;
}

ScanReport NullResumeScanner::scan_file(const std::string& path) const {
    return unavailable_report(path);
}

ScanReport NullResumeScanner::scan_buffer(std::vector<unsigned char>) const {
    return unavailable_report(kBufferSource);
}

ScanReport NullResumeScanner::scan(const pdf::Document&) const {
    return unavailable_report(kDocumentSource);
}

// ---------- DocumentScanner ----------

DocumentScanner::DocumentScanner() : cfg_(default_scan_config()) {}

DocumentScanner::DocumentScanner(ScanConfig cfg) : cfg_(std::move(cfg)) {}

ScanReport DocumentScanner::scan_file(const std::string& path) const {
    const Deadline deadline(cfg_.timeout);

    std::unique_ptr<pdf::MuPdfDocument> doc;
    try {
        doc = pdf::MuPdfDocument::open_file(path);
    } catch (const std::exception& e) {
        ScanReport rep = parse_error_report(path, e.what());
        log_stage(rep, rep.stages.back());
        return rep;
    }

    ScanReport rep;
    rep.source = path;
    rep.stages.push_back({"parse", StageStatus::Ok, ""});
    return run(*doc, deadline, std::move(rep));
}

ScanReport DocumentScanner::scan_buffer(std::vector<unsigned char> bytes) const {
    const Deadline deadline(cfg_.timeout);

    std::unique_ptr<pdf::MuPdfDocument> doc;
    try {
        doc = pdf::MuPdfDocument::open_buffer(std::move(bytes));
    } catch (const std::exception& e) {
        ScanReport rep = parse_error_report(kBufferSource, e.what());
        log_stage(rep, rep.stages.back());
        return rep;
    }

    ScanReport rep;
    rep.source = kBufferSource;
    rep.stages.push_back({"parse", StageStatus::Ok, ""});
    return run(*doc, deadline, std::move(rep));
}

ScanReport DocumentScanner::scan(const pdf::Document& doc) const {
    const Deadline deadline(cfg_.timeout);

    ScanReport rep;
    rep.source = kDocumentSource;
    rep.stages.push_back({"parse", StageStatus::Ok, ""});
    return run(doc, deadline, std::move(rep));
}

ScanReport DocumentScanner::run(const pdf::Document& doc, const Deadline& deadline, ScanReport rep) const {
    try {
        rep.page_count = doc.page_count();

        int limit = rep.page_count;
        if (cfg_.max_pages > 0 && limit > cfg_.max_pages) {
            limit = cfg_.max_pages;
            rep.flags.push_back(with_detail(flag::kPageBudgetExceeded,
                                            std::to_string(rep.page_count) + " pages, limit " +
                                                std::to_string(cfg_.max_pages)));
        }

        const StructureResult structure = check_structure(doc, limit, deadline, rep.flags);
        rep.stages.push_back(structure.outcome);

        const InvisibleTextResult invisible = detect_invisible_text(doc, cfg_, limit, deadline, rep.flags);
        rep.invisible_text_detected = invisible.detected;
        rep.invisible_span_count = invisible.invisible_span_count;
        rep.pages_scanned = invisible.pages_scanned;
        rep.stages.push_back(invisible.outcome);

        const pdf::TextExtraction raw = pdf::extract_text(doc, limit, [&deadline](int) {
            deadline.check("text extraction");
        });
        StageOutcome extract_stage{"extract_text", StageStatus::Ok, ""};
        if (raw.failed_pages > 0) {
            extract_stage.status = StageStatus::Degraded;
            extract_stage.reason = std::to_string(raw.failed_pages) + " page(s) without text, first: " + raw.first_error;
        }
        rep.stages.push_back(extract_stage);

        SanitizeResult clean = sanitize(raw.text, cfg_);
        rep.flags.insert(rep.flags.end(), clean.flags.begin(), clean.flags.end());
        rep.homoglyphs_detected = clean.homoglyphs_detected;
        rep.sanitized_text = std::move(clean.text);
        rep.stages.push_back({"sanitize", StageStatus::Ok, ""});

        deadline.check("metadata extraction");
        StageOutcome metadata_stage{"metadata", StageStatus::Ok, ""};
        try {
            rep.metadata = doc.metadata();
        } catch (const std::exception& e) {
            rep.metadata = empty_metadata();
            metadata_stage.status = StageStatus::Degraded;
            metadata_stage.reason = e.what();
        }
        rep.stages.push_back(metadata_stage);

        const MetadataResult mr = cross_reference_metadata(rep.sanitized_text, rep.metadata,
                                                           cfg_.metadata_mismatches, rep.flags);
        rep.metadata_mismatch = mr.mismatch;
    } catch (const ScanTimeout& e) {
        rep.flags.push_back(with_detail(flag::kScanTimeout, e.what()));
        rep.stages.push_back({"deadline", StageStatus::Fatal, e.what()});
    } catch (const std::exception& e) {
        rep.flags.push_back(with_detail(flag::kScanError, e.what()));
        rep.stages.push_back({"scan", StageStatus::Fatal, e.what()});
    }

    for (const auto& s : rep.stages) log_stage(rep, s);

    rep.is_safe = rep.flags.empty();
    return rep;
}

void DocumentScanner::log_stage(const ScanReport& rep, const StageOutcome& s) const {
    if (!cfg_.verbose || s.status == StageStatus::Ok) return;

    // one write per line so concurrent scans do not interleave mid-line
    std::ostringstream line;
    line << (s.status == StageStatus::Fatal ? "[error] " : "[warn] ")
         << rep.source << ": " << s.stage << " " << to_string(s.status);
    if (!s.reason.empty()) line << ": " << s.reason;
    line << "\n";
    std::cerr << line.str();
}

std::unique_ptr<ResumeScanner> make_resume_scanner(bool enabled, const ScanConfig& cfg) {
    if (!enabled) return std::make_unique<NullResumeScanner>();
    return std::make_unique<DocumentScanner>(cfg);
}

}  // namespace security
