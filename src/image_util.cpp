#include "image_util.hpp"

#include <opencv2/imgproc.hpp>

#include "errors.hpp"

namespace pdfmask {

cv::Mat to_gray(const cv::Mat &img) {
    if (img.channels() == 1) return img;
    cv::Mat gray;
    cv::cvtColor(img, gray, img.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    return gray;
}

PixPtr mat_to_pix(const cv::Mat &img, int dpi) {
    if (img.empty() || img.depth() != CV_8U) throw EngineError("unsupported page image");
    const int w = img.cols, h = img.rows;
    const bool gray = img.channels() == 1;
    PixPtr pix(pixCreate(w, h, gray ? 8 : 32));
    if (!pix) throw EngineError("pixCreate failed");
    pixSetResolution(pix.get(), dpi, dpi);

    l_uint32 *data = pixGetData(pix.get());
    const l_int32 wpl = pixGetWpl(pix.get());
    for (int y = 0; y < h; ++y) {
        l_uint32 *line = data + y * wpl;
        const unsigned char *src = img.ptr<unsigned char>(y);
        if (gray) {
            for (int x = 0; x < w; ++x) SET_DATA_BYTE(line, x, src[x]);
        } else {
            const int cn = img.channels();
            for (int x = 0; x < w; ++x) {
                const unsigned char *px = src + x * cn;
                composeRGBPixel(px[2], px[1], px[0], line + x);
            }
        }
    }
    return pix;
}

cv::Mat clean_for_ocr(const cv::Mat &img) {
    cv::Mat gray = to_gray(img);
    cv::Mat th;
    cv::adaptiveThreshold(gray, th, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 31, 15);
    return th;
}

bool is_blank_page(const cv::Mat &img, double threshold) {
    if (img.empty()) return true;
    return cv::mean(to_gray(img))[0] / 255.0 > threshold;
}

} // namespace pdfmask
