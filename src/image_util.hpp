#ifndef PDFMASK_IMAGE_UTIL_HPP
#define PDFMASK_IMAGE_UTIL_HPP

#include <memory>

#include <leptonica/allheaders.h>
#include <opencv2/core.hpp>

namespace pdfmask {

struct PixDeleter {
    void operator()(Pix *p) const { pixDestroy(&p); }
};
using PixPtr = std::unique_ptr<Pix, PixDeleter>;

cv::Mat to_gray(const cv::Mat &img);

// 8-bit grey for 1-channel input, 32-bit RGB otherwise. `dpi` is stored as
// the Pix resolution.
PixPtr mat_to_pix(const cv::Mat &img, int dpi);

// Grey + adaptive threshold, what tesseract sees when input cleaning is on.
cv::Mat clean_for_ocr(const cv::Mat &img);

// Mean luminance / 255 above `threshold` counts as blank.
bool is_blank_page(const cv::Mat &img, double threshold = 0.98);

} // namespace pdfmask

#endif // PDFMASK_IMAGE_UTIL_HPP
