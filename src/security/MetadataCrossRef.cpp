#include "security/MetadataCrossRef.hpp"
#include "security/Flags.hpp"
#include "text/TextUtil.hpp"

namespace security {

MetadataResult cross_reference_metadata(const std::string& sanitized_text,
                                        const pdf::Metadata& metadata,
                                        const std::vector<MismatchPair>& pairs,
                                        std::vector<std::string>& flags) {
    MetadataResult res;

    const std::string title = textutil::to_lower(pdf::metadata_value(metadata, "title"));
    const std::string keywords = textutil::to_lower(pdf::metadata_value(metadata, "keywords"));
    const std::string text = textutil::to_lower(sanitized_text);

    for (const auto& p : pairs) {
        const std::string meta_term = textutil::to_lower(p.meta_term);
        const std::string text_term = textutil::to_lower(p.text_term);

        const bool in_meta = textutil::contains(title, meta_term) || textutil::contains(keywords, meta_term);
        if (!in_meta || !textutil::contains(text, text_term)) continue;

        res.mismatch = true;
        res.hits.push_back(p);
        flags.push_back(with_detail(flag::kMetadataMismatch,
                                    "'" + p.meta_term + "' in metadata but '" + p.text_term + "' in text"));
    }

    return res;
}

}  // namespace security
