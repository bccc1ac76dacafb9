#include "pdf/FixtureDocument.hpp"

#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace pdf {

static std::string opt_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) return "";
    if (!j.at(key).is_string()) {
        throw ParseError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

// Rejects values that would not survive narrowing to int.
static int require_int(const json& v, long long lo, long long hi, const std::string& where) {
    const bool ok = v.is_number_unsigned()
                        ? v.get<unsigned long long>() <= (unsigned long long)hi
                        : v.is_number_integer() && v.get<long long>() >= lo && v.get<long long>() <= hi;
    if (!ok) {
        throw ParseError(where + " must be an integer in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
    return v.get<int>();
}

static const json& opt_array(const json& j, const char* key, const std::string& where) {
    static const json empty = json::array();
    if (!j.contains(key)) return empty;
    if (!j.at(key).is_array()) {
        throw ParseError(where + "." + std::string(key) + " must be an array");
    }
    return j.at(key);
}

static PageSpan parse_span(const json& j, int page, const std::string& where) {
    if (!j.is_object()) throw ParseError(where + " must be an object");

    PageSpan s;
    s.text = opt_string(j, "text", where);
    s.page = page;
    if (j.contains("color")) {
        s.color = require_int(j.at("color"), 0, 0xFFFFFF, where + ".color");
    }
    return s;
}

static Annotation parse_annotation(const json& j, const std::string& where) {
    if (!j.is_object()) throw ParseError(where + " must be an object");

    Annotation a;
    a.subtype = opt_string(j, "subtype", where);
    a.action = opt_string(j, "action", where);
    return a;
}

FixtureDocument FixtureDocument::from_json(const json& j) {
    if (!j.is_object()) throw ParseError("root must be an object");

    FixtureDocument d;

    const json& pages = opt_array(j, "pages", "root");
    for (size_t i = 0; i < pages.size(); ++i) {
        std::ostringstream oss;
        oss << "root.pages[" << i << "]";
        const std::string where = oss.str();
        const json& pj = pages.at(i);
        if (!pj.is_object()) throw ParseError(where + " must be an object");

        Page p;
        const json& spans = opt_array(pj, "spans", where);
        for (size_t k = 0; k < spans.size(); ++k) {
            p.spans.push_back(parse_span(spans.at(k), (int)i, where + ".spans[" + std::to_string(k) + "]"));
        }

        const json& annots = opt_array(pj, "annotations", where);
        for (size_t k = 0; k < annots.size(); ++k) {
            p.annotations.push_back(parse_annotation(annots.at(k), where + ".annotations[" + std::to_string(k) + "]"));
        }

        p.has_text = pj.contains("text");
        p.text = opt_string(pj, "text", where);
        p.render_error = opt_string(pj, "render_error", where);
        p.annotation_error = opt_string(pj, "annotation_error", where);
        d.pages_.push_back(std::move(p));
    }

    if (d.pages_.empty()) throw ParseError("document has no pages");

    if (j.contains("embedded_files")) {
        d.embedded_files_ = require_int(j.at("embedded_files"), 0, std::numeric_limits<int>::max(), "root.embedded_files");
    }

    for (const auto& a : opt_array(j, "document_actions", "root")) {
        if (!a.is_string()) throw ParseError("root.document_actions must hold strings");
        d.document_actions_.push_back(a.get<std::string>());
    }

    json md = json::object();
    if (j.contains("metadata")) {
        md = j.at("metadata");
        if (!md.is_object()) throw ParseError("root.metadata must be an object");
    }
    for (const auto& field : metadata_fields()) {
        d.metadata_.emplace_back(field, opt_string(md, field.c_str(), "root.metadata"));
    }
    d.metadata_error_ = opt_string(j, "metadata_error", "root");

    return d;
}

FixtureDocument FixtureDocument::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ParseError("cannot open file: " + path);

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw ParseError(std::string("failed to parse JSON: ") + e.what());
    }
    return from_json(j);
}

const FixtureDocument::Page& FixtureDocument::page_at(int page) const {
    if (page < 0 || page >= page_count()) {
        throw RenderError("page index out of range: " + std::to_string(page));
    }
    return pages_[(size_t)page];
}

std::vector<PageSpan> FixtureDocument::page_spans(int page) const {
    const Page& p = page_at(page);
    if (!p.render_error.empty()) throw RenderError(p.render_error);
    return p.spans;
}

std::string FixtureDocument::page_text(int page) const {
    const Page& p = page_at(page);
    if (!p.render_error.empty()) throw RenderError(p.render_error);
    if (p.has_text) return p.text;

    std::string out;
    for (const auto& s : p.spans) {
        out += s.text;
        out += "\n";
    }
    return out;
}

std::vector<Annotation> FixtureDocument::annotations(int page) const {
    if (page < 0 || page >= page_count()) {
        throw StructureError("page index out of range: " + std::to_string(page));
    }
    const Page& p = pages_[(size_t)page];
    if (!p.annotation_error.empty()) throw StructureError(p.annotation_error);
    return p.annotations;
}

Metadata FixtureDocument::metadata() const {
    if (!metadata_error_.empty()) throw StructureError(metadata_error_);
    return metadata_;
}

}  // namespace pdf
