#pragma once

#include <memory>
#include <string>
#include <vector>

#include "pdf/Document.hpp"
#include "security/Deadline.hpp"
#include "security/ScanConfig.hpp"
#include "security/ScanReport.hpp"

namespace security {

// Entry point for screening one document. Implementations never throw a
// std::exception out of scan*: every failure becomes a flag in the report.
class ResumeScanner {
public:
    virtual ~ResumeScanner() = default;

    virtual ScanReport scan_file(const std::string& path) const = 0;
    virtual ScanReport scan_buffer(std::vector<unsigned char> bytes) const = 0;

    // Already-opened document (any pdf::Document implementation).
    virtual ScanReport scan(const pdf::Document& doc) const = 0;
};

// Stand-in for hosts deployed without the scanner: nothing is inspected and
// every report is unsafe with SCANNER_UNAVAILABLE, so input is never
// trusted by default.
class NullResumeScanner final : public ResumeScanner {
public:
    ScanReport scan_file(const std::string& path) const override;
    ScanReport scan_buffer(std::vector<unsigned char> bytes) const override;
    ScanReport scan(const pdf::Document& doc) const override;
};

// structure -> invisible text -> extract -> sanitize -> metadata cross-reference.
// Holds only immutable configuration; one instance may serve concurrent scans.
class DocumentScanner final : public ResumeScanner {
public:
    DocumentScanner();
    explicit DocumentScanner(ScanConfig cfg);

    ScanReport scan_file(const std::string& path) const override;
    ScanReport scan_buffer(std::vector<unsigned char> bytes) const override;
    ScanReport scan(const pdf::Document& doc) const override;

    const ScanConfig& config() const { return cfg_; }

private:
    ScanReport run(const pdf::Document& doc, const Deadline& deadline, ScanReport rep) const;
    void log_stage(const ScanReport& rep, const StageOutcome& s) const;

    ScanConfig cfg_;
};

std::unique_ptr<ResumeScanner> make_resume_scanner(bool enabled, const ScanConfig& cfg = default_scan_config());

}  // namespace security
