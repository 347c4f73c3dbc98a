#ifndef PDFMASK_ROTATION_HPP
#define PDFMASK_ROTATION_HPP

#include <string>
#include <utility>

#include <opencv2/core.hpp>

#include "document.hpp"

namespace pdfmask {

class RotationDetector {
public:
    virtual ~RotationDetector() = default;

    // Clockwise degrees (0, 90, 180, 270) that make the rendered page
    // upright. 0 when unknown or blank.
    virtual int detect(const cv::Mat &page_image) = 0;
};

// Tesseract orientation detection on the rendered page.
class TesseractOsdDetector : public RotationDetector {
public:
    explicit TesseractOsdDetector(std::string datapath = "", int dpi = 300)
        : datapath_(std::move(datapath)), dpi_(dpi) {}

    int detect(const cv::Mat &page_image) override;

private:
    int detect_orientation(const cv::Mat &page_image);

    std::string datapath_;
    int dpi_;
};

struct RotationSummary {
    Bytes data;
    int rotated_pages = 0;
};

// Renders every page at `dpi`, asks `detector` for its angle and adds it to
// the page's rotation. The document is re-serialised either way.
RotationSummary correct_rotation(const DocumentProvider &provider, const Bytes &input,
                                 RotationDetector &detector, int dpi = 300);

} // namespace pdfmask

#endif // PDFMASK_ROTATION_HPP
