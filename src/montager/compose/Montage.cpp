#include "montager/compose/Montage.hpp"
#include "montager/core/Errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace montager {

Raster stackRows(const std::vector<Raster>& rows, int gap) {
    if (rows.empty()) throw std::invalid_argument("montage needs at least one row");
    if (gap < 0)      throw std::invalid_argument("montage gap must be >= 0");

    const int W = rows.front().width();
    int H = 0;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const Raster& r = rows[i];
        if (r.empty()) throw DegenerateGeometryError("montage row " + std::to_string(i) + " is empty");
        if (r.width() != W) {
            throw DimensionMismatchError("montage row " + std::to_string(i) + " is "
                                         + std::to_string(r.width()) + " px wide, expected "
                                         + std::to_string(W));
        }
        H += r.height();
    }
    H += gap * static_cast<int>(rows.size() - 1);

    cv::Mat canvas(H, W, CV_8UC4, cv::Scalar(255, 255, 255, 255));
    int y = 0;
    for (const Raster& r : rows) {
        r.mat().copyTo(canvas(cv::Rect(0, y, W, r.height())));
        y += r.height() + gap;
    }
    return Raster(std::move(canvas));
}

} // namespace montager
