#include "montager/core/Config.hpp"
#include "montager/core/Errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace montager {

void validateConfig(const ProcessingConfig& cfg) {
    if (cfg.targetWidth <= 0 || cfg.targetHeight <= 0) {
        throw DegenerateGeometryError("target size must be positive, got "
                                      + std::to_string(cfg.targetWidth) + "x"
                                      + std::to_string(cfg.targetHeight));
    }
    if (cfg.roiStride <= 0) {
        throw DegenerateGeometryError("ROI search stride must be positive");
    }
    if (cfg.rowLabelFontSize <= 0 || cfg.columnLabelFontSize <= 0) {
        throw DegenerateGeometryError("label font sizes must be positive");
    }
    if (!std::isfinite(cfg.targetIntensity) || cfg.targetIntensity < 0.0 || cfg.targetIntensity > 255.0) {
        throw std::invalid_argument("targetIntensity must be in [0, 255]");
    }
    if (!std::isfinite(cfg.randomness) || cfg.randomness < 0.0 || cfg.randomness > 1.0) {
        throw std::invalid_argument("randomness must be in [0, 1]");
    }
    if (cfg.clipBottom < 0) throw std::invalid_argument("clipBottom must be >= 0");
    if (cfg.padding < 0)    throw std::invalid_argument("padding must be >= 0");
}

} // namespace montager
