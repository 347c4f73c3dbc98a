#ifndef PDFMASK_TESSERACT_OCR_ENGINE_HPP
#define PDFMASK_TESSERACT_OCR_ENGINE_HPP

#include <string>
#include <utility>

#include "ocr_engine.hpp"

namespace pdfmask {

struct TesseractOcrConfig {
    std::string datapath;    // empty: tesseract's default tessdata
    int dpi = 300;
    bool clean_input = true; // recognise a thresholded copy of each page
};

// Rewrites a PDF page by page: render with PDFium, recognise with tesseract,
// emit a searchable page with TessPDFRenderer, stitch the pages back together.
class TesseractOcrEngine : public OcrEngine {
public:
    explicit TesseractOcrEngine(TesseractOcrConfig cfg = {}) : cfg_(std::move(cfg)) {}

    OcrOutcome run(const Bytes &input, const OcrRequest &request, const OcrProgress &progress) override;

private:
    OcrOutcome run_pages(const Bytes &input, const OcrRequest &request, const OcrProgress &progress);

    TesseractOcrConfig cfg_;
};

} // namespace pdfmask

#endif // PDFMASK_TESSERACT_OCR_ENGINE_HPP
