#include "montager/core/Pipeline.hpp"
#include "montager/core/Errors.hpp"
#include "montager/align/RoiLocator.hpp"
#include "montager/process/ChannelNormalizer.hpp"
#include "montager/compose/ChannelMerger.hpp"
#include "montager/compose/FigureCompositor.hpp"

#include <string>

namespace montager {

Raster composeRow(const Raster& ch1,
                  const Raster& ch2,
                  const ProcessingConfig& cfg,
                  const std::string& rowLabel,
                  bool isFirstRow,
                  IRandomSource& random)
{
    if (ch1.size() != ch2.size()) {
        throw DimensionMismatchError("channel 1 is " + std::to_string(ch1.width()) + "x" + std::to_string(ch1.height())
                                     + " but channel 2 is "
                                     + std::to_string(ch2.width()) + "x" + std::to_string(ch2.height()));
    }
    if (ch1.empty()) throw DegenerateGeometryError("channel rasters are empty");
    validateConfig(cfg);
    if (cfg.clipBottom >= ch1.height()) {
        throw DegenerateGeometryError("clipBottom " + std::to_string(cfg.clipBottom)
                                      + " >= image height " + std::to_string(ch1.height()));
    }

    const cv::Rect roi = findCoBrightestRoi(ch1, ch2,
                                            cv::Size(cfg.targetWidth, cfg.targetHeight),
                                            cfg.clipBottom, cfg.roiStride);

    const Raster n1 = normalizeChannel(ch1, roi, cfg, random);
    const Raster n2 = normalizeChannel(ch2, roi, cfg, random);
    const Raster merged = mergeChannels(n1, n2);

    return composeFigure(n1, n2, merged, rowLabel, isFirstRow, cfg);
}

Raster composeRow(const Raster& ch1,
                  const Raster& ch2,
                  const ProcessingConfig& cfg,
                  const std::string& rowLabel,
                  bool isFirstRow)
{
    MersenneRandomSource random;
    return composeRow(ch1, ch2, cfg, rowLabel, isFirstRow, random);
}

} // namespace montager
