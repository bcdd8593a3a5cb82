#include "montager/align/RoiLocator.hpp"
#include "montager/align/IntegralImage.hpp"
#include "montager/core/Errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace montager {

static std::string sizeStr(int w, int h) {
    return std::to_string(w) + "x" + std::to_string(h);
}

/*
  r = targetW / targetH, evaluated in integers so that e.g. 246 * (494/246)
  does not round down to 493:
    cropW = width, cropH = floor(width / r) = floor(width * targetH / targetW)
    if cropH > h: cropH = h, cropW = floor(h * r) = floor(h * targetW / targetH)
*/
cv::Size cropSizeFor(int width, int effectiveHeight, cv::Size targetSize) {
    if (targetSize.width <= 0 || targetSize.height <= 0) {
        throw DegenerateGeometryError("target size must be positive, got "
                                      + sizeStr(targetSize.width, targetSize.height));
    }
    const long long tw = targetSize.width;
    const long long th = targetSize.height;

    long long cropW = width;
    long long cropH = (static_cast<long long>(width) * th) / tw;
    if (cropH > effectiveHeight) {
        cropH = effectiveHeight;
        cropW = (static_cast<long long>(effectiveHeight) * tw) / th;
    }
    if (cropW <= 0 || cropH <= 0) {
        throw DegenerateGeometryError("crop for aspect " + sizeStr(targetSize.width, targetSize.height)
                                      + " inside " + sizeStr(width, effectiveHeight)
                                      + " is empty");
    }
    return cv::Size(static_cast<int>(cropW), static_cast<int>(cropH));
}

/*
  Co-brightest ROI search.

  Steps:
    1) Effective height h = max(1, height - clipBottom).
    2) Crop size from the target aspect ratio (cropSizeFor).
    3) One integral table per channel over the FULL raster; clipping only
       limits where the window may be placed.
    4) Stride-sampled scan of corners (x, y), 0 <= x <= width-cropW,
       0 <= y <= h-cropH. Total = sum1 + sum2; strict '>' keeps the first
       maximum in scan order.

  The true optimum may lie between sampled corners.
*/
cv::Rect findCoBrightestRoi(const Raster& ch1,
                            const Raster& ch2,
                            cv::Size targetSize,
                            int clipBottom,
                            int stride)
{
    if (ch1.size() != ch2.size()) {
        throw DimensionMismatchError("channel sizes differ: " + sizeStr(ch1.width(), ch1.height())
                                     + " vs " + sizeStr(ch2.width(), ch2.height()));
    }
    if (ch1.empty()) throw DegenerateGeometryError("channel rasters are empty");
    if (stride <= 0) throw std::invalid_argument("ROI stride must be positive");
    if (clipBottom < 0) throw std::invalid_argument("clipBottom must be >= 0");
    if (clipBottom >= ch1.height()) {
        throw DegenerateGeometryError("clipBottom " + std::to_string(clipBottom)
                                      + " leaves no rows of a " + std::to_string(ch1.height())
                                      + " px high image");
    }

    const int W = ch1.width();
    const int h = std::max(1, ch1.height() - clipBottom);
    const cv::Size crop = cropSizeFor(W, h, targetSize);

    const IntegralImage integral1(ch1);
    const IntegralImage integral2(ch2);

    double best = -1.0;
    int bestX = 0, bestY = 0;

    for (int y = 0; y <= h - crop.height; y += stride) {
        for (int x = 0; x <= W - crop.width; x += stride) {
            const double total = integral1.rectSum(x, y, crop.width, crop.height)
                               + integral2.rectSum(x, y, crop.width, crop.height);
            if (total > best) {
                best  = total;
                bestX = x;
                bestY = y;
            }
        }
    }

    return cv::Rect(bestX, bestY, crop.width, crop.height);
}

} // namespace montager
