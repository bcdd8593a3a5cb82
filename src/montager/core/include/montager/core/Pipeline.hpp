#pragma once
#include "montager/core/Config.hpp"
#include "montager/core/Random.hpp"
#include "montager/core/Raster.hpp"

#include <string>

namespace montager {

/*
  Compose one montage row from a pair of aligned channels:
    ROI search -> normalize ch1, ch2 -> merge -> figure layout.

  All preconditions are checked before any buffer is allocated:
    - DimensionMismatchError  : ch1 and ch2 differ in size;
    - DegenerateGeometryError : empty input, invalid target size,
                                clipBottom >= height;
    - std::invalid_argument   : other invalid config values.

  `random` supplies one draw for channel 1, then one for channel 2.
*/
Raster composeRow(const Raster& ch1,
                  const Raster& ch2,
                  const ProcessingConfig& cfg,
                  const std::string& rowLabel,
                  bool isFirstRow,
                  IRandomSource& random);

/* Same as above with a freshly seeded MersenneRandomSource. */
Raster composeRow(const Raster& ch1,
                  const Raster& ch2,
                  const ProcessingConfig& cfg,
                  const std::string& rowLabel,
                  bool isFirstRow);

} // namespace montager
