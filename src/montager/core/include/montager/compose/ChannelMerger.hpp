#pragma once
#include "montager/core/Raster.hpp"

namespace montager {

/** True if R == G == B. */
[[nodiscard]] inline bool isGrayPixel(const Pixel& p) noexcept {
    return p[0] == p[1] && p[1] == p[2];
}

/**
 * Pseudo-color merge of two normalized same-size channels
 * (channel 1 -> green, channel 2 -> red).
 *
 * Per pixel, decided by the channel-1 pixel:
 *   gray    : R = ch2.R, G = ch1.R, B = 0
 *   colored : R,G,B = min(255, ch1 + ch2) (additive)
 * Alpha is always 255. Throws DimensionMismatchError on size mismatch.
 */
Raster mergeChannels(const Raster& ch1, const Raster& ch2);

} // namespace montager
