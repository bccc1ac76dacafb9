#include "pdf/Document.hpp"

namespace pdf {

const std::vector<std::string>& metadata_fields() {
    static const std::vector<std::string> fields = {
        "format", "title", "author", "subject", "keywords", "creator",
        "producer", "creationDate", "modDate", "trapped", "encryption",
    };
    return fields;
}

std::string metadata_value(const Metadata& md, const std::string& field) {
    for (const auto& kv : md) {
        if (kv.first == field) return kv.second;
    }
    return "";
}

TextExtraction extract_text(const Document& doc, int max_pages, const std::function<void(int)>& before_page) {
    int n = doc.page_count();
    if (max_pages >= 0 && max_pages < n) n = max_pages;

    TextExtraction out;
    for (int i = 0; i < n; ++i) {
        if (before_page) before_page(i);
        try {
            out.text += doc.page_text(i);
        } catch (const RenderError& e) {
            if (out.failed_pages == 0) out.first_error = "page " + std::to_string(i) + ": " + e.what();
            ++out.failed_pages;
        }
    }
    return out;
}

}  // namespace pdf
