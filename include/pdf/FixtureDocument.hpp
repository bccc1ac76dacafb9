#pragma once

#include "pdf/Document.hpp"

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace pdf {

// Document described by JSON instead of PDF bytes:
//
// {
//   "pages": [
//     { "spans": [ {"text": "Jane Doe", "color": 0} ],
//       "text": "optional page text (defaults to span texts joined by newlines)",
//       "annotations": [ {"subtype": "Widget", "action": ""} ],
//       "render_error": "optional: page_spans/page_text throw RenderError",
//       "annotation_error": "optional: annotations throw StructureError" }
//   ],
//   "embedded_files": 0,
//   "document_actions": ["JavaScript"],
//   "metadata": { "title": "...", "keywords": "..." },
//   "metadata_error": "optional: metadata throws StructureError"
// }
class FixtureDocument final : public Document {
public:
    // Throws ParseError on malformed descriptions.
    static FixtureDocument from_json(const nlohmann::json& j);
    static FixtureDocument load(const std::string& path);

    int page_count() const override { return (int)pages_.size(); }
    std::vector<PageSpan> page_spans(int page) const override;
    std::string page_text(int page) const override;
    std::vector<Annotation> annotations(int page) const override;
    int embedded_file_count() const override { return embedded_files_; }
    std::vector<std::string> document_actions() const override { return document_actions_; }
    Metadata metadata() const override;

private:
    struct Page {
        std::vector<PageSpan> spans;
        std::string text;
        bool has_text = false;
        std::vector<Annotation> annotations;
        std::string render_error;
        std::string annotation_error;
    };

    const Page& page_at(int page) const;

    std::vector<Page> pages_;
    int embedded_files_ = 0;
    std::vector<std::string> document_actions_;
    Metadata metadata_;
    std::string metadata_error_;
};

}  // namespace pdf
