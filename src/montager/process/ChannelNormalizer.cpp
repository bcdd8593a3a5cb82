#include "montager/process/ChannelNormalizer.hpp"
#include "montager/core/Errors.hpp"
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace montager {

/* Brightest R/G/B component over the whole image, at least 1. */
static int peakComponent(const cv::Mat& rgba) {
    int peak = 1;
    for (int y = 0; y < rgba.rows; ++y) {
        const Pixel* row = rgba.ptr<Pixel>(y);
        for (int x = 0; x < rgba.cols; ++x) {
            peak = std::max({peak, int(row[x][0]), int(row[x][1]), int(row[x][2])});
        }
    }
    return peak;
}

/*
  Steps:
    1) Crop to ROI (a view, no copy).
    2) Resize to the target size. INTER_AREA when shrinking in both axes,
       INTER_LINEAR otherwise. Both are deterministic.
    3) peak = max(R,G,B) over all pixels, floored at 1.
    4) One draw u in [0,1):
         shift  = u*randomness - randomness/2
         target = targetIntensity * (1 + shift)
         scale  = target / peak
    5) R,G,B *= scale with rounding and clamping to [0..255]; alpha untouched.
*/
Raster normalizeChannel(const Raster& src,
                        const cv::Rect& roi,
                        const ProcessingConfig& cfg,
                        IRandomSource& random)
{
    if (src.empty()) throw DegenerateGeometryError("source raster is empty");
    if (cfg.targetWidth <= 0 || cfg.targetHeight <= 0) {
        throw DegenerateGeometryError("target size must be positive");
    }
    if (roi.width <= 0 || roi.height <= 0 ||
        roi.x < 0 || roi.y < 0 ||
        roi.x + roi.width > src.width() || roi.y + roi.height > src.height()) {
        throw DegenerateGeometryError("ROI (" + std::to_string(roi.x) + "," + std::to_string(roi.y) + " "
                                      + std::to_string(roi.width) + "x" + std::to_string(roi.height)
                                      + ") is not inside the "
                                      + std::to_string(src.width()) + "x" + std::to_string(src.height())
                                      + " source");
    }

    const cv::Mat crop = src.mat()(roi);
    const cv::Size target(cfg.targetWidth, cfg.targetHeight);

    cv::Mat resized;
    const bool shrinking = target.width <= crop.cols && target.height <= crop.rows;
    cv::resize(crop, resized, target, 0, 0, shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);

    const int peak = peakComponent(resized);

    const double shift      = random.uniform01() * cfg.randomness - cfg.randomness / 2.0;
    const double stochastic = 1.0 + shift;
    const double scale      = (cfg.targetIntensity * stochastic) / peak;

    for (int y = 0; y < resized.rows; ++y) {
        Pixel* row = resized.ptr<Pixel>(y);
        for (int x = 0; x < resized.cols; ++x) {
            row[x][0] = cv::saturate_cast<uchar>(row[x][0] * scale);
            row[x][1] = cv::saturate_cast<uchar>(row[x][1] * scale);
            row[x][2] = cv::saturate_cast<uchar>(row[x][2] * scale);
        }
    }

    return Raster(std::move(resized));
}

} // namespace montager
