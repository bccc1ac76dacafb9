#pragma once

#include <string>
#include <vector>

#include "security/ScanConfig.hpp"

namespace security {

struct SanitizeResult {
    std::string text;
    std::vector<std::string> flags;  // in the order the transformations fired
    bool zero_width_found = false;
    bool homoglyphs_detected = false;
};

// Deletes every configured zero-width code point. Appends one
// ZERO_WIDTH_CHARS_FOUND per distinct code point present.
bool strip_zero_width(std::string& text,
                      const std::vector<std::string>& zero_width_chars,
                      std::vector<std::string>& flags);

// Rewrites table entries to their Latin look-alike. Appends one
// HOMOGLYPHS_DETECTED per distinct entry present.
bool normalize_homoglyphs(std::string& text,
                          const std::vector<HomoglyphEntry>& table,
                          std::vector<std::string>& flags);

// Unicode NFKC. Throws std::runtime_error if ICU cannot provide the normalizer.
std::string canonicalize(const std::string& text);

// zero-width stripping -> homoglyph normalization -> NFKC; idempotent.
SanitizeResult sanitize(const std::string& text, const ScanConfig& cfg = default_scan_config());

}  // namespace security
