#pragma once

#include "pdf/Document.hpp"

#include <memory>
#include <string>
#include <vector>

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

namespace pdf {

// PDF-only document backed by MuPDF. Each instance owns its own fz_context,
// so separate instances can be used from separate threads.
class MuPdfDocument final : public Document {
public:
    // Both throw ParseError on empty, non-PDF, encrypted or unrecoverable input.
    static std::unique_ptr<MuPdfDocument> open_file(const std::string& path);
    static std::unique_ptr<MuPdfDocument> open_buffer(std::vector<unsigned char> bytes);

    ~MuPdfDocument() override;

    MuPdfDocument(const MuPdfDocument&) = delete;
    MuPdfDocument& operator=(const MuPdfDocument&) = delete;

    int page_count() const override { return m_page_count; }
    std::vector<PageSpan> page_spans(int page) const override;
    std::string page_text(int page) const override;
    std::vector<Annotation> annotations(int page) const override;
    int embedded_file_count() const override;
    std::vector<std::string> document_actions() const override;
    Metadata metadata() const override;

private:
    MuPdfDocument();

    void open_stream_or_path(const std::string& path);
    void finish_open();

    struct StextDeleter {
        fz_context* ctx;
        void operator()(fz_stext_page* p) const { fz_drop_stext_page(ctx, p); }
    };
    using StextPtr = std::unique_ptr<fz_stext_page, StextDeleter>;

    StextPtr load_stext(int page) const;
    void check_page(int page) const;

    fz_context* m_ctx = nullptr;
    pdf_document* m_doc = nullptr;
    int m_page_count = 0;
    std::vector<unsigned char> m_bytes;  // backing store for open_buffer
};

}  // namespace pdf
