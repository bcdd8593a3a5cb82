#include "montager/compose/ChannelMerger.hpp"
#include "montager/core/Errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace montager {

static inline uchar addClamp(uchar a, uchar b) {
    return static_cast<uchar>(std::min(255, int(a) + int(b)));
}

Raster mergeChannels(const Raster& ch1, const Raster& ch2) {
    if (ch1.size() != ch2.size()) {
        throw DimensionMismatchError("cannot merge " + std::to_string(ch1.width()) + "x" + std::to_string(ch1.height())
                                     + " with " + std::to_string(ch2.width()) + "x" + std::to_string(ch2.height()));
    }
    if (ch1.empty()) throw DegenerateGeometryError("cannot merge empty rasters");

    cv::Mat out(ch1.height(), ch1.width(), CV_8UC4);

    for (int y = 0; y < out.rows; ++y) {
        const Pixel* a = ch1.mat().ptr<Pixel>(y);
        const Pixel* b = ch2.mat().ptr<Pixel>(y);
        Pixel* o = out.ptr<Pixel>(y);
        for (int x = 0; x < out.cols; ++x) {
            if (isGrayPixel(a[x])) {
                o[x] = Pixel(b[x][0], a[x][0], 0, 255);
            } else {
                // already colored input: additive blend
                o[x] = Pixel(addClamp(a[x][0], b[x][0]),
                             addClamp(a[x][1], b[x][1]),
                             addClamp(a[x][2], b[x][2]),
                             255);
            }
        }
    }
    return Raster(std::move(out));
}

} // namespace montager
