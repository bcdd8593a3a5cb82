#pragma once
#include "montager/core/Raster.hpp"

#include <vector>

namespace montager {

/**
 * Summed-area table of pixel luminance (0.299R + 0.587G + 0.114B, alpha ignored).
 * at(x,y) = sum of luminance over all (x',y') with x'<=x, y'<=y.
 * Build is O(width*height); rectSum() is O(1).
 */
class IntegralImage {
public:
    explicit IntegralImage(const Raster& src);

    [[nodiscard]] int width()  const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }

    [[nodiscard]] double at(int x, int y) const { return table_[static_cast<std::size_t>(y) * width_ + x]; }

    /// Luminance sum over [x, x+w) x [y, y+h). The rectangle must lie inside the table.
    [[nodiscard]] double rectSum(int x, int y, int w, int h) const;

    /// Luminance of one RGBA8 pixel.
    [[nodiscard]] static double luminance(const Pixel& p) noexcept {
        return 0.299 * p[0] + 0.587 * p[1] + 0.114 * p[2];
    }

private:
    int width_{0};
    int height_{0};
    std::vector<double> table_;   // row-major, width_*height_
};

} // namespace montager
