#ifndef PDFMASK_PDFIUM_DOCUMENT_HPP
#define PDFMASK_PDFIUM_DOCUMENT_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fpdfview.h>

#include "document.hpp"

namespace pdfmask {

// PDFium is not thread-safe. Every object below holds this lock for as long
// as it has a PDFium handle open.
std::recursive_mutex &pdfium_mutex();

// Initialises the library once per process. The classes below call it.
void pdfium_init();

class PdfiumDocument;

class PdfiumPage : public Page {
public:
    PdfiumPage(PdfiumDocument &owner, FPDF_PAGE page) : owner_(owner), page_(page) {}
    ~PdfiumPage() override;
    PdfiumPage(const PdfiumPage &) = delete;
    PdfiumPage &operator=(const PdfiumPage &) = delete;

    std::string text() override;
    std::vector<PositionedWord> words() override;
    std::vector<Rect> search(const std::string &needle) override;
    void add_redaction(const Rect &area) override;
    std::vector<std::size_t> apply_redactions() override;
    bool insert_label(const Rect &box, const std::string &label, double font_size) override;
    cv::Mat render(int dpi) override;
    int rotation() const override;
    void rotate(int clockwise_degrees) override;

    // True when the page has at least one non-whitespace character.
    bool has_text();

private:
    FPDF_TEXTPAGE text_page();
    void drop_text_page();
    std::vector<std::size_t> count_residual(const std::vector<Rect> &marks);

    PdfiumDocument &owner_;
    FPDF_PAGE page_;
    FPDF_TEXTPAGE text_ = nullptr;
    std::vector<Rect> marks_;
};

class PdfiumDocument : public Document {
public:
    // Throws IoError when `data` is not a readable PDF.
    explicit PdfiumDocument(Bytes data, const std::string &password = "");
    ~PdfiumDocument() override;
    PdfiumDocument(const PdfiumDocument &) = delete;
    PdfiumDocument &operator=(const PdfiumDocument &) = delete;

    int page_count() const override;
    Page &page(int index) override;
    PdfiumPage &pdfium_page(int index);
    Bytes save() override;

    FPDF_DOCUMENT handle() { return doc_; }

private:
    std::unique_lock<std::recursive_mutex> lock_;
    Bytes data_; // PDFium reads from this buffer for the document's lifetime
    FPDF_DOCUMENT doc_ = nullptr;
    bool encrypted_ = false;
    std::vector<std::unique_ptr<PdfiumPage>> pages_;
};

class PdfiumProvider : public DocumentProvider {
public:
    explicit PdfiumProvider(std::string password = "") : password_(std::move(password)) {}

    std::unique_ptr<Document> open(const Bytes &data) const override;

private:
    std::string password_;
};

// Builds a new PDF out of pages copied from other documents.
class PdfAssembler {
public:
    PdfAssembler();
    ~PdfAssembler();
    PdfAssembler(const PdfAssembler &) = delete;
    PdfAssembler &operator=(const PdfAssembler &) = delete;

    void append(PdfiumDocument &src, int page_index);
    int page_count() const;
    Bytes save();

private:
    std::unique_lock<std::recursive_mutex> lock_;
    FPDF_DOCUMENT doc_ = nullptr;
};

} // namespace pdfmask

#endif // PDFMASK_PDFIUM_DOCUMENT_HPP
