#pragma once
#include <opencv2/core.hpp>
#include "montager/core/Config.hpp"
#include "montager/core/Random.hpp"
#include "montager/core/Raster.hpp"

namespace montager {

/**
 * Crop `src` to `roi`, resample to targetWidth x targetHeight and rescale
 * R,G,B so the brightest component lands near targetIntensity.
 *
 * Exactly one value is drawn from `random` per call; it sets a jitter of
 * +/- randomness/2 on the target shared by every pixel. Alpha is kept.
 * roi must be non-empty and inside src (DegenerateGeometryError otherwise).
 */
Raster normalizeChannel(const Raster& src,
                        const cv::Rect& roi,
                        const ProcessingConfig& cfg,
                        IRandomSource& random);

} // namespace montager
