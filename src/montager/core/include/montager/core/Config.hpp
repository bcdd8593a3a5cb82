#pragma once

#include <string>
#include <vector>

namespace montager {

/* Per-invocation settings for composing one montage row.
   Supplied by the caller and never modified by the pipeline. */
struct ProcessingConfig {
    int targetWidth  {494};          // output size of each panel (px)
    int targetHeight {246};

    double targetIntensity {200.0};  // peak channel value after normalization, 0..255
    double randomness {0.05};        // jitter range, 0.05 means +/-2.5%

    int clipBottom {25};             // rows excluded from the bottom during ROI search
    int padding    {10};             // gap between panels (px)
    int roiStride  {4};              // ROI search step in both axes (px)

    std::vector<std::string> columnLabels {"Channel 1", "Channel 2", "Merge"};
    int rowLabelFontSize    {24};    // px
    int columnLabelFontSize {24};    // px
    std::string fontFamily {"sans-serif"};
    bool showLabels {true};
};

/* Throw if the config cannot produce a figure.
   DegenerateGeometryError: non-positive target size, font size or stride.
   std::invalid_argument : intensity/randomness out of range, negative clip/padding. */
void validateConfig(const ProcessingConfig& cfg);

} // namespace montager
