#ifndef PDFMASK_OCR_ENGINE_HPP
#define PDFMASK_OCR_ENGINE_HPP

#include <functional>
#include <string>

#include "document.hpp"

namespace pdfmask {

enum class OcrMode {
    ForceOcr, // replace every page's text with recognised text
    SkipText, // keep pages that already have text, normalise the document
};

const char *ocr_mode_str(OcrMode m);

struct OcrRequest {
    std::string language = "chi_tra+eng";
    OcrMode mode = OcrMode::ForceOcr;
};

// Incremental progress, 0-100 for the whole call. Returning false asks the
// engine to stop as soon as it can.
using OcrProgress = std::function<bool(int pct, const std::string &message)>;

struct OcrOutcome {
    bool cancelled = false;
    Bytes data;
};

class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    // Returns the rewritten document, or cancelled=true with no data.
    // Throws EngineError on failure.
    virtual OcrOutcome run(const Bytes &input, const OcrRequest &request, const OcrProgress &progress) = 0;
};

inline const char *ocr_mode_str(OcrMode m) {
    return m == OcrMode::ForceOcr ? "force_ocr" : "skip_text";
}

} // namespace pdfmask

#endif // PDFMASK_OCR_ENGINE_HPP
