#include "rotation.hpp"

#include <tesseract/baseapi.h>

#include "errors.hpp"
#include "image_util.hpp"
#include "log.hpp"

namespace pdfmask {

int TesseractOsdDetector::detect(const cv::Mat &page_image) {
    try {
        return detect_orientation(page_image);
    } catch (const cv::Exception &e) {
        throw EngineError(std::string("image processing failed: ") + e.what());
    }
}

int TesseractOsdDetector::detect_orientation(const cv::Mat &page_image) {
    if (is_blank_page(page_image)) return 0;

    tesseract::TessBaseAPI tess;
    if (tess.Init(datapath_.empty() ? nullptr : datapath_.c_str(), "osd", tesseract::OEM_TESSERACT_ONLY)) {
        throw EngineError("Tesseract init failed for osd");
    }
    tess.SetPageSegMode(tesseract::PSM_OSD_ONLY);
    PixPtr px = mat_to_pix(to_gray(page_image), dpi_);
    tess.SetImage(px.get());
    tess.SetSourceResolution(dpi_);

    int orient_deg = 0;
    float orient_conf = 0.0f;
    const char *script_name = nullptr;
    float script_conf = 0.0f;
    bool ok = tess.DetectOrientationScript(&orient_deg, &orient_conf, &script_name, &script_conf);
    tess.End();
    if (!ok) return 0;
    // orient_deg is how far the image is turned; undo it clockwise
    return (360 - orient_deg) % 360;
}

RotationSummary correct_rotation(const DocumentProvider &provider, const Bytes &input,
                                 RotationDetector &detector, int dpi) {
    RotationSummary out;
    auto doc = provider.open(input);
    for (int i = 0; i < doc->page_count(); ++i) {
        Page &page = doc->page(i);
        int angle = detector.detect(page.render(dpi));
        if (angle % 90 != 0) {
            log_warn("rotation", LogLine("ignoring non right-angle rotation").kv("page", i + 1).kv("angle", angle).str());
            continue;
        }
        if (angle % 360 == 0) continue;
        log_info("rotation", LogLine("rotating page").kv("page", i + 1).kv("angle", angle).str());
        page.rotate(angle);
        ++out.rotated_pages;
    }
    out.data = doc->save();
    return out;
}

} // namespace pdfmask
