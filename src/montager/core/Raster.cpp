#include "montager/core/Raster.hpp"

#include <utility>

namespace montager {

Raster::Raster(cv::Mat&& rgba)
    : mat_(std::move(rgba))
{
    CV_Assert(mat_.empty() || mat_.type() == CV_8UC4);
    // ROI views still point into their parent; detach them
    if (!mat_.empty() && (mat_.isSubmatrix() || !mat_.isContinuous())) mat_ = mat_.clone();
}

Raster Raster::copyOf(const cv::Mat& rgba) {
    CV_Assert(rgba.empty() || rgba.type() == CV_8UC4);
    return Raster(rgba.clone());
}

} // namespace montager
