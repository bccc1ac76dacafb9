#pragma once

#include <string>
#include <vector>

#include "pdf/Document.hpp"
#include "security/ScanConfig.hpp"

namespace security {

struct MetadataResult {
    bool mismatch = false;
    std::vector<MismatchPair> hits;  // pairs that fired, in table order
};

// For each pair: meta_term in lower(title) or lower(keywords) AND text_term
// in lower(text) -> METADATA_MISMATCH: '<meta_term>' in metadata but '<text_term>' in text.
// Plain substring match, so career-progression narratives also fire.
MetadataResult cross_reference_metadata(const std::string& sanitized_text,
                                        const pdf::Metadata& metadata,
                                        const std::vector<MismatchPair>& pairs,
                                        std::vector<std::string>& flags);

}  // namespace security
