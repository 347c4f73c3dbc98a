#include "tesseract_ocr_engine.hpp"

#include <memory>
#include <string>
#include <vector>

#include <leptonica/allheaders.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <tesseract/baseapi.h>
#include <tesseract/ocrclass.h>
#include <tesseract/renderer.h>

#include "errors.hpp"
#include "file_io.hpp"
#include "image_util.hpp"
#include "log.hpp"
#include "pdfium_document.hpp"

namespace pdfmask {

namespace {

// Shared between the engine loop and tesseract's cancel hook.
struct MonitorCtx {
    const OcrProgress *progress = nullptr;
    ETEXT_DESC *monitor = nullptr;
    int page = 0;
    int pages = 1;
    int last_pct = -1;
    bool cancelled = false;

    // false once the caller asked to stop
    bool report(int page_pct) {
        if (cancelled) return false;
        const int pct = (page * 100 + page_pct) / pages;
        if (pct == last_pct) return true;
        last_pct = pct;
        if (*progress && !(*progress)(pct, "page " + std::to_string(page + 1) + "/" + std::to_string(pages))) {
            cancelled = true;
        }
        return !cancelled;
    }
};

bool cancel_hook(void *cancel_this, int /*words*/) {
    auto *ctx = static_cast<MonitorCtx *>(cancel_this);
    return !ctx->report(ctx->monitor->progress);
}

struct PageInfo {
    bool has_text = false;
    cv::Mat image;
};

// Holds the PDFium lock only while the page is rendered.
PageInfo load_page(const Bytes &input, int index, int dpi, bool need_image) {
    PageInfo info;
    PdfiumDocument doc(input);
    PdfiumPage &page = doc.pdfium_page(index);
    info.has_text = page.has_text();
    if (need_image) info.image = page.render(dpi);
    return info;
}

int count_pages(const Bytes &input) {
    PdfiumDocument doc(input);
    return doc.page_count();
}

PixPtr read_pix(const std::string &path, int dpi) {
    PixPtr px(pixRead(path.c_str()));
    if (!px) throw EngineError("cannot read page image " + path);
    pixSetResolution(px.get(), dpi, dpi);
    return px;
}

} // namespace

// OpenCV errors are not runtime_errors; callers only see EngineError.
OcrOutcome TesseractOcrEngine::run(const Bytes &input, const OcrRequest &request, const OcrProgress &progress) {
    try {
        return run_pages(input, request, progress);
    } catch (const cv::Exception &e) {
        throw EngineError(std::string("image processing failed: ") + e.what());
    }
}

OcrOutcome TesseractOcrEngine::run_pages(const Bytes &input, const OcrRequest &request, const OcrProgress &progress) {
    OcrOutcome out;
    const int pages = count_pages(input);
    if (pages == 0) throw EngineError("document has no pages");

    tesseract::TessBaseAPI tess;
    if (tess.Init(cfg_.datapath.empty() ? nullptr : cfg_.datapath.c_str(), request.language.c_str(),
                  tesseract::OEM_LSTM_ONLY)) {
        throw EngineError("Tesseract init failed for " + request.language);
    }
    tess.SetVariable("preserve_interword_spaces", "1");

    TempDir tmp("pdfmask_ocr_");
    ETEXT_DESC monitor;
    MonitorCtx ctx;
    ctx.progress = &progress;
    ctx.monitor = &monitor;
    ctx.pages = pages;
    monitor.cancel = &cancel_hook;
    monitor.cancel_this = &ctx;

    // per page: empty when the original page is kept
    std::vector<std::string> page_pdfs(static_cast<size_t>(pages));
    int recognised = 0;
    for (int i = 0; i < pages; ++i) {
        ctx.page = i;
        if (!ctx.report(0)) break;

        PageInfo info = load_page(input, i, cfg_.dpi, true);
        if (request.mode == OcrMode::SkipText && info.has_text) {
            log_debug("ocr", LogLine("page has text, kept").kv("page", i + 1).str());
            continue;
        }

        const std::string color_png = tmp.file("page_" + std::to_string(i) + ".png");
        const std::string ocr_png = tmp.file("page_" + std::to_string(i) + ".ocr.png");
        if (!cv::imwrite(color_png, info.image)) throw IoError("cannot write " + color_png);
        if (cfg_.clean_input && !cv::imwrite(ocr_png, clean_for_ocr(info.image))) throw IoError("cannot write " + ocr_png);
        info.image.release();

        PixPtr color = read_pix(color_png, cfg_.dpi);
        PixPtr ocr_input = cfg_.clean_input ? read_pix(ocr_png, cfg_.dpi) : nullptr;

        const std::string base = tmp.file("page_" + std::to_string(i));
        tesseract::TessPDFRenderer renderer(base.c_str(), tess.GetDatapath(), false);
        if (!renderer.BeginDocument("pdfmask")) throw EngineError("cannot start PDF output for page " + std::to_string(i + 1));

        tess.SetInputName(color_png.c_str());
        tess.SetImage(ocr_input ? ocr_input.get() : color.get());
        tess.SetSourceResolution(cfg_.dpi);
        // SetImage replaced the input image with what is recognised; the page shows the colour render
        tess.SetInputImage(color.get());

        monitor.progress = 0;
        const int rc = tess.Recognize(&monitor);
        if (ctx.cancelled) break;
        if (rc != 0) throw EngineError("recognition failed on page " + std::to_string(i + 1));
        if (!renderer.AddImage(&tess) || !renderer.EndDocument()) {
            throw EngineError("PDF output failed on page " + std::to_string(i + 1));
        }
        tess.Clear();
        page_pdfs[static_cast<size_t>(i)] = base + ".pdf";
        ++recognised;
    }
    tess.End();

    if (ctx.cancelled) {
        out.cancelled = true;
        return out;
    }

    PdfAssembler assembler;
    std::unique_ptr<PdfiumDocument> original;
    for (int i = 0; i < pages; ++i) {
        const std::string &pdf = page_pdfs[static_cast<size_t>(i)];
        if (pdf.empty()) {
            if (!original) original.reset(new PdfiumDocument(input));
            assembler.append(*original, i);
        } else {
            PdfiumDocument page_doc(read_file(pdf));
            if (page_doc.page_count() != 1) throw EngineError("unexpected OCR output for page " + std::to_string(i + 1));
            assembler.append(page_doc, 0);
        }
    }
    out.data = assembler.save();
    log_info("ocr", LogLine("engine finished").kv("mode", ocr_mode_str(request.mode)).kv("pages", pages)
                        .kv("recognised", recognised).str());
    ctx.report(100);
    return out;
}

} // namespace pdfmask
