#include "montager/align/IntegralImage.hpp"

namespace montager {

/*
  Single row-major pass: each cell is the running sum of its row so far
  plus the cell directly above, which is the standard 2-D summed-area table.
*/
IntegralImage::IntegralImage(const Raster& src)
    : width_(src.width()), height_(src.height())
{
    CV_Assert(!src.empty());
    table_.resize(static_cast<std::size_t>(width_) * height_);

    const cv::Mat& m = src.mat();
    for (int y = 0; y < height_; ++y) {
        const Pixel* row = m.ptr<Pixel>(y);
        double* out = &table_[static_cast<std::size_t>(y) * width_];
        const double* above = y > 0 ? out - width_ : nullptr;

        double rowSum = 0.0;
        for (int x = 0; x < width_; ++x) {
            rowSum += luminance(row[x]);
            out[x] = above ? rowSum + above[x] : rowSum;
        }
    }
}

/*
  Four-corner inclusion-exclusion: D - B - C + A, where
    D = bottom-right corner,
    B = cell above the top-right corner,
    C = cell left of the bottom-left corner,
    A = diagonal cell above-left of the top-left corner.
  Corners with a negative row or column contribute 0.
*/
double IntegralImage::rectSum(int x, int y, int w, int h) const {
    CV_Assert(w > 0 && h > 0);
    CV_Assert(x >= 0 && y >= 0 && x + w <= width_ && y + h <= height_);

    const int x2 = x + w - 1;
    const int y2 = y + h - 1;

    const double A = (x > 0 && y > 0) ? at(x - 1, y - 1) : 0.0;
    const double B = (y > 0)          ? at(x2,    y - 1) : 0.0;
    const double C = (x > 0)          ? at(x - 1, y2)    : 0.0;
    const double D = at(x2, y2);

    return D - B - C + A;
}

} // namespace montager
