#include "security/TextSanitizer.hpp"
#include "security/Flags.hpp"
#include "text/TextUtil.hpp"

#include <stdexcept>

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>

namespace security {

// NFKC can itself emit a mapped character (e.g. U+1E030 MODIFIER LETTER
// CYRILLIC SMALL A -> U+0430), so the passes repeat until stable.
static constexpr int kMaxRounds = 4;

bool strip_zero_width(std::string& text,
                      const std::vector<std::string>& zero_width_chars,
                      std::vector<std::string>& flags) {
    bool found = false;
    for (const auto& zw : zero_width_chars) {
        if (!textutil::contains(text, zw)) continue;
        flags.push_back(flag::kZeroWidthChars);
        textutil::replace_all(text, zw, "");
        found = true;
    }
    return found;
}

bool normalize_homoglyphs(std::string& text,
                          const std::vector<HomoglyphEntry>& table,
                          std::vector<std::string>& flags) {
    bool found = false;
    for (const auto& h : table) {
        if (!textutil::contains(text, h.from)) continue;
        flags.push_back(flag::kHomoglyphs);
        textutil::replace_all(text, h.from, h.to);
        found = true;
    }
    return found;
}

std::string canonicalize(const std::string& text) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkc = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("NFKC normalizer unavailable: ") + u_errorName(status));
    }

    const icu::UnicodeString src = icu::UnicodeString::fromUTF8(text);
    const icu::UnicodeString dst = nfkc->normalize(src, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("NFKC normalization failed: ") + u_errorName(status));
    }

    std::string out;
    dst.toUTF8String(out);
    return out;
}

static bool needs_another_round(const std::string& text, const ScanConfig& cfg) {
    for (const auto& zw : cfg.zero_width_chars) {
        if (textutil::contains(text, zw)) return true;
    }
    for (const auto& h : cfg.homoglyphs) {
        if (textutil::contains(text, h.from)) return true;
    }
    return false;
}

SanitizeResult sanitize(const std::string& text, const ScanConfig& cfg) {
    SanitizeResult res;
    res.text = text;

    for (int round = 0; round < kMaxRounds; ++round) {
        if (strip_zero_width(res.text, cfg.zero_width_chars, res.flags)) res.zero_width_found = true;
        if (normalize_homoglyphs(res.text, cfg.homoglyphs, res.flags)) res.homoglyphs_detected = true;
        res.text = canonicalize(res.text);

        if (!needs_another_round(res.text, cfg)) break;
    }

    return res;
}

}  // namespace security
