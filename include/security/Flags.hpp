#pragma once

#include <string>
#include <vector>

namespace security {

// Flag vocabulary. Flags with diagnostics read "CODE: detail"; match on the code.
// PDF_PARSE_ERROR is reserved for inputs that cannot be opened. An unexpected
// failure inside an already opened document is reported as SCAN_ERROR, which
// is fatal like PDF_PARSE_ERROR and always makes the report unsafe.
namespace flag {

constexpr char kZeroWidthChars[]       = "ZERO_WIDTH_CHARS_FOUND";
constexpr char kHomoglyphs[]           = "HOMOGLYPHS_DETECTED";
constexpr char kInvisibleText[]        = "INVISIBLE_TEXT_DETECTED";
constexpr char kFormWidget[]           = "PDF_CONTAINS_FORM_WIDGET";
constexpr char kEmbeddedFiles[]        = "PDF_CONTAINS_EMBEDDED_FILES";
constexpr char kJavaScript[]           = "PDF_CONTAINS_JAVASCRIPT";
constexpr char kMetadataMismatch[]     = "METADATA_MISMATCH";
constexpr char kParseError[]           = "PDF_PARSE_ERROR";
constexpr char kStructureError[]       = "PDF_STRUCTURE_ERROR";
constexpr char kRenderingError[]       = "RENDERING_INSPECTION_ERROR";
constexpr char kPageBudgetExceeded[]   = "PAGE_BUDGET_EXCEEDED";
constexpr char kScanTimeout[]          = "SCAN_TIMEOUT";
constexpr char kScanError[]            = "SCAN_ERROR";  // unexpected failure after open
constexpr char kScannerUnavailable[]   = "SCANNER_UNAVAILABLE";

}  // namespace flag

// "CODE: detail"
std::string with_detail(const std::string& code, const std::string& detail);

// Part before the first ':' (the whole flag when there is none).
std::string flag_code(const std::string& flag);

size_t count_flag(const std::vector<std::string>& flags, const std::string& code);

inline bool has_flag(const std::vector<std::string>& flags, const std::string& code) {
    return count_flag(flags, code) > 0;
}

}  // namespace security
