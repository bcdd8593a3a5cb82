//====================================================================
// File: core/include/montager/core/Raster.hpp
//====================================================================
#pragma once

#include <opencv2/core.hpp>
#include <cstdint>

namespace montager {

/// Single RGBA8 pixel, channel order R,G,B,A.
using Pixel = cv::Vec4b;

/**
 * Read-only RGBA8 image passed between pipeline stages.
 *
 * Storage is a CV_8UC4 cv::Mat in R,G,B,A order (not OpenCV's usual BGR).
 * Every stage allocates its own output and hands it over by move. Copies of
 * a Raster share its buffer, which is safe because nothing writes through it.
 */
class Raster {
public:
    Raster() = default;

    /// Take ownership of an RGBA8 buffer. The caller must not keep another header on it.
    explicit Raster(cv::Mat&& rgba);

    /// Deep copy of an RGBA8 matrix (or ROI view).
    static Raster copyOf(const cv::Mat& rgba);

    [[nodiscard]] int  width()  const noexcept { return mat_.cols; }
    [[nodiscard]] int  height() const noexcept { return mat_.rows; }
    [[nodiscard]] bool empty()  const noexcept { return mat_.empty(); }
    [[nodiscard]] cv::Size size() const noexcept { return mat_.size(); }

    /// Total byte size (width*height*4).
    [[nodiscard]] std::size_t bytes() const noexcept { return mat_.total() * mat_.elemSize(); }

    [[nodiscard]] const Pixel& at(int x, int y) const { return mat_.at<Pixel>(y, x); }

    /// Underlying CV_8UC4 matrix (read-only).
    [[nodiscard]] const cv::Mat& mat() const noexcept { return mat_; }

private:
    cv::Mat mat_;
};

} // namespace montager
