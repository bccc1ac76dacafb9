#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pdf {

// Malformed, empty or non-PDF input.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

// Failure while reading page content (text runs, colors) of an opened document.
class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& what) : std::runtime_error(what) {}
};

// Failure while walking the object tree (annotations, name trees, actions).
class StructureError : public std::runtime_error {
public:
    explicit StructureError(const std::string& what) : std::runtime_error(what) {}
};

struct PageSpan {
    std::string text;
    int color = 0;  // packed sRGB 0xRRGGBB
    int page = 0;
};

struct Annotation {
    std::string subtype;  // "Widget" | "Link" | "FileAttachment" | ...
    std::string action;   // /A /S name ("JavaScript", "URI", ...), empty if none
};

// Ordered field -> value; absent fields hold "".
using Metadata = std::vector<std::pair<std::string, std::string>>;

// Field names reported by metadata(), in order.
const std::vector<std::string>& metadata_fields();

// Returns "" when the field is missing.
std::string metadata_value(const Metadata& md, const std::string& field);

class Document {
public:
    virtual ~Document() = default;

    virtual int page_count() const = 0;

    // Runs of text sharing one fill color. Throws RenderError.
    virtual std::vector<PageSpan> page_spans(int page) const = 0;

    // Plain visible text of one page. Throws RenderError.
    virtual std::string page_text(int page) const = 0;

    virtual std::vector<Annotation> annotations(int page) const = 0;

    virtual int embedded_file_count() const = 0;

    // Document-level action types (OpenAction, Names/JavaScript entries).
    virtual std::vector<std::string> document_actions() const = 0;

    virtual Metadata metadata() const = 0;
};

struct TextExtraction {
    std::string text;
    int failed_pages = 0;
    std::string first_error;
};

// Concatenates page_text() over the first `max_pages` pages (all if < 0).
// Pages that fail to render are skipped and counted. `before_page` runs
// ahead of each page and may throw to abort the extraction.
TextExtraction extract_text(const Document& doc,
                            int max_pages = -1,
                            const std::function<void(int)>& before_page = nullptr);

}  // namespace pdf
