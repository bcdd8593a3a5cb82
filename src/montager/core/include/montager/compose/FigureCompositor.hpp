#pragma once
#include "montager/core/Config.hpp"
#include "montager/core/Raster.hpp"

#include <string>

namespace montager {

/** Inset (px) of every label from the edge it is anchored to. */
constexpr int kLabelInset = 10;

/**
 * Map a CSS-like font family ("serif", "'Courier New', monospace", ...) to
 * the closest bold OpenCV Hershey face.
 */
int hersheyFontFor(const std::string& fontFamily);

/**
 * Lay out [ch1] [ch2] [merged] side by side on a white canvas of
 * (targetWidth*3 + padding*2) x targetHeight.
 *
 * With showLabels:
 *   - rowLabel (if non-empty) at the bottom-left of the whole figure;
 *   - columnLabels (only when isFirstRow and exactly 3 entries) at the
 *     top-left of each panel.
 * Labels are white with a soft dark shadow. All panels must be
 * targetWidth x targetHeight (DimensionMismatchError otherwise).
 */
Raster composeFigure(const Raster& ch1,
                     const Raster& ch2,
                     const Raster& merged,
                     const std::string& rowLabel,
                     bool isFirstRow,
                     const ProcessingConfig& cfg);

} // namespace montager
