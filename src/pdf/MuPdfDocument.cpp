#include "pdf/MuPdfDocument.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <utility>

namespace pdf {

namespace {

// %PDF- may be preceded by junk; readers accept it within the first 1 KiB.
constexpr size_t kHeaderWindow = 1024;

bool has_pdf_header(const unsigned char* data, size_t n) {
    static const char magic[] = "%PDF-";
    const size_t m = sizeof(magic) - 1;
    const size_t limit = std::min(n, kHeaderWindow);
    for (size_t i = 0; i + m <= limit; ++i) {
        if (std::memcmp(data + i, magic, m) == 0) return true;
    }
    return false;
}

struct BufferDeleter {
    fz_context* ctx;
    void operator()(fz_buffer* b) const { fz_drop_buffer(ctx, b); }
};

int char_color(const fz_stext_char* ch) {
#if FZ_VERSION_MAJOR > 1 || (FZ_VERSION_MAJOR == 1 && FZ_VERSION_MINOR >= 25)
    return static_cast<int>(ch->argb & 0xFFFFFFu);
#else
    return ch->color & 0xFFFFFF;
#endif
}

// Prefers JavaScript when any trigger in /AA carries it.
const char* action_type(fz_context* ctx, pdf_obj* holder) {
    pdf_obj* a = pdf_dict_get(ctx, holder, PDF_NAME(A));
    pdf_obj* a_type = pdf_dict_get(ctx, a, PDF_NAME(S));
    if (pdf_name_eq(ctx, a_type, PDF_NAME(JavaScript))) return "JavaScript";

    pdf_obj* aa = pdf_dict_get(ctx, holder, PDF_NAME(AA));
    const int n = pdf_dict_len(ctx, aa);
    for (int i = 0; i < n; ++i) {
        pdf_obj* s = pdf_dict_get(ctx, pdf_dict_get_val(ctx, aa, i), PDF_NAME(S));
        if (pdf_name_eq(ctx, s, PDF_NAME(JavaScript))) return "JavaScript";
    }

    return pdf_to_name(ctx, a_type);
}

const std::pair<const char*, const char*> kMetadataKeys[] = {
    {"format", "format"},
    {"title", "info:Title"},
    {"author", "info:Author"},
    {"subject", "info:Subject"},
    {"keywords", "info:Keywords"},
    {"creator", "info:Creator"},
    {"producer", "info:Producer"},
    {"creationDate", "info:CreationDate"},
    {"modDate", "info:ModDate"},
    {"trapped", "info:Trapped"},
    {"encryption", "encryption"},
};

}  // namespace

MuPdfDocument::MuPdfDocument() {
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) throw ParseError("cannot create MuPDF context");
}

MuPdfDocument::~MuPdfDocument() {
    if (m_ctx) {
        pdf_drop_document(m_ctx, m_doc);
        fz_drop_context(m_ctx);
    }
}

std::unique_ptr<MuPdfDocument> MuPdfDocument::open_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw ParseError("cannot open file: " + path);

    unsigned char head[kHeaderWindow];
    in.read(reinterpret_cast<char*>(head), sizeof(head));
    const size_t n = static_cast<size_t>(in.gcount());
    if (n == 0) throw ParseError("empty file: " + path);
    if (!has_pdf_header(head, n)) throw ParseError("not a PDF document: " + path);

    std::unique_ptr<MuPdfDocument> d(new MuPdfDocument());
    d->open_stream_or_path(path);
    return d;
}

std::unique_ptr<MuPdfDocument> MuPdfDocument::open_buffer(std::vector<unsigned char> bytes) {
    if (bytes.empty()) throw ParseError("empty buffer");
    if (!has_pdf_header(bytes.data(), bytes.size())) throw ParseError("not a PDF document");

    std::unique_ptr<MuPdfDocument> d(new MuPdfDocument());
    d->m_bytes = std::move(bytes);
    d->open_stream_or_path("");
    return d;
}

void MuPdfDocument::open_stream_or_path(const std::string& path) {
    pdf_document* doc = nullptr;
    fz_stream* stm = nullptr;
    bool failed = false;
    std::string msg;

    fz_var(doc);
    fz_var(stm);

    fz_try(m_ctx) {
        if (path.empty()) {
            stm = fz_open_memory(m_ctx, m_bytes.data(), m_bytes.size());
            doc = pdf_open_document_with_stream(m_ctx, stm);
        } else {
            doc = pdf_open_document(m_ctx, path.c_str());
        }
    }
    fz_always(m_ctx) {
        fz_drop_stream(m_ctx, stm);
    }
    fz_catch(m_ctx) {
        failed = true;
        msg = fz_caught_message(m_ctx);
    }

    if (failed) throw ParseError(msg);
    m_doc = doc;
    finish_open();
}

void MuPdfDocument::finish_open() {
    int needs_password = 0;
    int pages = 0;
    bool failed = false;
    std::string msg;

    fz_try(m_ctx) {
        needs_password = pdf_needs_password(m_ctx, m_doc);
        if (!needs_password) pages = pdf_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        failed = true;
        msg = fz_caught_message(m_ctx);
    }

    if (failed) throw ParseError(msg);
    if (needs_password) throw ParseError("document is encrypted");
    if (pages <= 0) throw ParseError("document has no pages");
    m_page_count = pages;
}

void MuPdfDocument::check_page(int page) const {
    if (page < 0 || page >= m_page_count) {
        throw RenderError("page index out of range: " + std::to_string(page));
    }
}

MuPdfDocument::StextPtr MuPdfDocument::load_stext(int page) const {
    check_page(page);

    fz_stext_page* sp = nullptr;
    bool failed = false;
    std::string msg;

    fz_var(sp);

    fz_try(m_ctx) {
        sp = fz_new_stext_page_from_page_number(m_ctx, &m_doc->super, page, nullptr);
    }
    fz_catch(m_ctx) {
        failed = true;
        msg = fz_caught_message(m_ctx);
    }

    if (failed) throw RenderError("page " + std::to_string(page) + ": " + msg);
    return StextPtr(sp, StextDeleter{m_ctx});
}

std::vector<PageSpan> MuPdfDocument::page_spans(int page) const {
    StextPtr sp = load_stext(page);
    std::vector<PageSpan> out;

    for (fz_stext_block* b = sp->first_block; b; b = b->next) {
        if (b->type != FZ_STEXT_BLOCK_TEXT) continue;

        for (fz_stext_line* line = b->u.t.first_line; line; line = line->next) {
            PageSpan cur;
            bool open = false;
            const fz_font* font = nullptr;
            float size = 0.0f;

            for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                const int color = char_color(ch);
                if (!open || color != cur.color || ch->font != font || ch->size != size) {
                    if (open) out.push_back(std::move(cur));
                    cur = PageSpan{};
                    cur.color = color;
                    cur.page = page;
                    font = ch->font;
                    size = ch->size;
                    open = true;
                }
                char utf8[FZ_UTFMAX];
                const int n = fz_runetochar(utf8, ch->c);
                cur.text.append(utf8, static_cast<size_t>(n));
            }

            if (open) out.push_back(std::move(cur));
        }
    }

    return out;
}

std::string MuPdfDocument::page_text(int page) const {
    StextPtr sp = load_stext(page);

    fz_buffer* buf = nullptr;
    bool failed = false;
    std::string msg;

    fz_var(buf);

    fz_try(m_ctx) {
        buf = fz_new_buffer_from_stext_page(m_ctx, sp.get());
    }
    fz_catch(m_ctx) {
        failed = true;
        msg = fz_caught_message(m_ctx);
    }

    if (failed) throw RenderError("page " + std::to_string(page) + ": " + msg);
    std::unique_ptr<fz_buffer, BufferDeleter> owned(buf, BufferDeleter{m_ctx});

    unsigned char* data = nullptr;
    const size_t len = fz_buffer_storage(m_ctx, owned.get(), &data);
    return std::string(reinterpret_cast<const char*>(data), len);
}

std::vector<Annotation> MuPdfDocument::annotations(int page) const {
    if (page < 0 || page >= m_page_count) {
        throw StructureError("page index out of range: " + std::to_string(page));
    }

    pdf_obj* annots = nullptr;
    int n = 0;
    bool failed = false;
    std::string msg;

    fz_try(m_ctx) {
        pdf_obj* page_obj = pdf_lookup_page_obj(m_ctx, m_doc, page);
        annots = pdf_dict_get(m_ctx, page_obj, PDF_NAME(Annots));
        n = pdf_array_len(m_ctx, annots);
    }
    fz_catch(m_ctx) {
        failed = true;
        msg = fz_caught_message(m_ctx);
    }
    if (failed) throw StructureError("annotations on page " + std::to_string(page) + ": " + msg);

    // Only MuPDF calls inside fz_try; a C++ exception there would bypass fz_catch.
    std::vector<Annotation> out;
    out.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        const char* subtype = nullptr;
        const char* action = nullptr;

        fz_try(m_ctx) {
            pdf_obj* a = pdf_array_get(m_ctx, annots, i);
            if (pdf_is_dict(m_ctx, a)) {
                subtype = pdf_to_name(m_ctx, pdf_dict_get(m_ctx, a, PDF_NAME(Subtype)));
                action = action_type(m_ctx, a);
            }
        }
        fz_catch(m_ctx) {
            failed = true;
            msg = fz_caught_message(m_ctx);
        }
        if (failed) throw StructureError("annotations on page " + std::to_string(page) + ": " + msg);

        if (subtype) out.push_back(Annotation{subtype, action});
    }
    return out;
}

int MuPdfDocument::embedded_file_count() const {
    pdf_obj* tree = nullptr;
    int n = 0;
    bool failed = false;
    std::string msg;

    fz_var(tree);

    fz_try(m_ctx) {
        tree = pdf_load_name_tree(m_ctx, m_doc, PDF_NAME(EmbeddedFiles));
        n = pdf_dict_len(m_ctx, tree);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, tree);
    }
    fz_catch(m_ctx) {
        failed = true;
        msg = fz_caught_message(m_ctx);
    }

    if (failed) throw StructureError("embedded files: " + msg);
    return n;
}

std::vector<std::string> MuPdfDocument::document_actions() const {
    pdf_obj* js = nullptr;
    pdf_obj* aa = nullptr;
    const char* open_action = "";
    int n_aa = 0;
    int n_js = 0;
    bool failed = false;
    std::string msg;

    fz_var(js);

    fz_try(m_ctx) {
        pdf_obj* root = pdf_dict_get(m_ctx, pdf_trailer(m_ctx, m_doc), PDF_NAME(Root));

        pdf_obj* oa = pdf_dict_get(m_ctx, root, PDF_NAME(OpenAction));
        if (pdf_is_dict(m_ctx, oa)) open_action = pdf_to_name(m_ctx, pdf_dict_get(m_ctx, oa, PDF_NAME(S)));

        aa = pdf_dict_get(m_ctx, root, PDF_NAME(AA));
        n_aa = pdf_dict_len(m_ctx, aa);

        js = pdf_load_name_tree(m_ctx, m_doc, PDF_NAME(JavaScript));
        n_js = pdf_dict_len(m_ctx, js);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, js);
    }
    fz_catch(m_ctx) {
        failed = true;
        msg = fz_caught_message(m_ctx);
    }
    if (failed) throw StructureError("document actions: " + msg);

    std::vector<std::string> out;
    if (*open_action) out.emplace_back(open_action);

    for (int i = 0; i < n_aa; ++i) {
        const char* s = "";
        fz_try(m_ctx) {
            s = pdf_to_name(m_ctx, pdf_dict_get(m_ctx, pdf_dict_get_val(m_ctx, aa, i), PDF_NAME(S)));
        }
        fz_catch(m_ctx) {
            failed = true;
            msg = fz_caught_message(m_ctx);
        }
        if (failed) throw StructureError("document actions: " + msg);
        if (*s) out.emplace_back(s);
    }

    out.insert(out.end(), static_cast<size_t>(n_js), std::string("JavaScript"));
    return out;
}

Metadata MuPdfDocument::metadata() const {
    Metadata md;
    md.reserve(sizeof(kMetadataKeys) / sizeof(kMetadataKeys[0]));

    for (const auto& key : kMetadataKeys) {
        char small[512];
        std::vector<char> big;
        int n = -1;
        bool failed = false;
        std::string msg;

        fz_try(m_ctx) {
            n = fz_lookup_metadata(m_ctx, &m_doc->super, key.second, small, sizeof(small));
        }
        fz_catch(m_ctx) {
            failed = true;
            msg = fz_caught_message(m_ctx);
        }
        if (failed) throw StructureError(std::string("metadata ") + key.first + ": " + msg);

        if (n <= 0) {
            md.emplace_back(key.first, "");
            continue;
        }
        if (static_cast<size_t>(n) <= sizeof(small)) {
            md.emplace_back(key.first, std::string(small));
            continue;
        }

        // value longer than the stack buffer: ask again with the reported size
        big.resize(static_cast<size_t>(n));
        fz_try(m_ctx) {
            fz_lookup_metadata(m_ctx, &m_doc->super, key.second, big.data(), n);
        }
        fz_catch(m_ctx) {
            failed = true;
            msg = fz_caught_message(m_ctx);
        }
        if (failed) throw StructureError(std::string("metadata ") + key.first + ": " + msg);
        md.emplace_back(key.first, std::string(big.data()));
    }

    return md;
}

}  // namespace pdf
