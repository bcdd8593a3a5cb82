#include "utils.hpp"
#include "args.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <iostream>
#include <sstream>

montager::ProcessingConfig config_from_args(int argc, char** argv) {
    montager::ProcessingConfig cfg{};

    // size=WxH
    const std::string size = argValue(argc, argv, "size", "");
    if (!size.empty()) {
        const auto xPos = size.find('x');
        if (xPos != std::string::npos && xPos > 0) {
            try {
                cfg.targetWidth  = std::stoi(size.substr(0, xPos));
                cfg.targetHeight = std::stoi(size.substr(xPos + 1));
            } catch (const std::logic_error&) {
                std::cerr << "[args] bad --size='" << size << "', keeping "
                          << cfg.targetWidth << "x" << cfg.targetHeight << "\n";
            }
        } else {
            std::cerr << "[args] --size expects WxH, got '" << size << "'\n";
        }
    }

    cfg.targetIntensity     = argValueDouble(argc, argv, "intensity",  cfg.targetIntensity);
    cfg.randomness          = argValueDouble(argc, argv, "randomness", cfg.randomness);
    cfg.clipBottom          = argValueInt   (argc, argv, "clip",       cfg.clipBottom);
    cfg.padding             = argValueInt   (argc, argv, "padding",    cfg.padding);
    cfg.roiStride           = argValueInt   (argc, argv, "stride",     cfg.roiStride);
    cfg.rowLabelFontSize    = argValueInt   (argc, argv, "rowfont",    cfg.rowLabelFontSize);
    cfg.columnLabelFontSize = argValueInt   (argc, argv, "colfont",    cfg.columnLabelFontSize);
    cfg.fontFamily          = argValue      (argc, argv, "font",       cfg.fontFamily);
    cfg.showLabels          = !argHas(argc, argv, "nolabels");

    const std::string cols = argValue(argc, argv, "columns", "");
    if (!cols.empty()) {
        cfg.columnLabels = splitCommas(cols);
        if (cfg.columnLabels.size() != 3) {
            std::cerr << "[args] --columns has " << cfg.columnLabels.size()
                      << " labels; column labels need exactly 3 and will not be drawn\n";
        }
    }
    return cfg;
}

std::string describe(const montager::ProcessingConfig& cfg) {
    std::ostringstream os;
    os << cfg.targetWidth << "x" << cfg.targetHeight
       << ", intensity=" << cfg.targetIntensity
       << ", randomness=" << cfg.randomness
       << ", clip=" << cfg.clipBottom
       << ", padding=" << cfg.padding
       << ", stride=" << cfg.roiStride
       << ", labels=" << (cfg.showLabels ? "on" : "off");
    return os.str();
}

/*
  Save a raster as a PNG image.

  - If the raster is empty, do nothing (print a message).
  - Rasters are RGBA; imwrite expects BGRA.
  - On success/failure, print a log line with the path and size.
*/
bool save_raster_png(const montager::Raster& r, const std::string& path) {
    if (r.empty()) {
        std::cout << "[save] raster is empty, nothing to save\n";
        return false;
    }
    cv::Mat bgra;
    cv::cvtColor(r.mat(), bgra, cv::COLOR_RGBA2BGRA);

    bool ok = false;
    try {
        ok = cv::imwrite(path, bgra);
    } catch (const cv::Exception& e) {
        std::cout << "[save] " << e.what() << "\n";
    }
    if (ok) {
        std::cout << "[save] saved to " << path
                  << " (" << r.width() << "x" << r.height() << ")\n";
    } else {
        std::cout << "[save] failed to save " << path << "\n";
    }
    return ok;
}

void show_raster(const montager::Raster& r, const std::string& title) {
    if (r.empty()) return;
    cv::Mat bgra;
    cv::cvtColor(r.mat(), bgra, cv::COLOR_RGBA2BGRA);
    cv::imshow(title, bgra);
    std::cout << "[view] press any key in the window to close\n";
    cv::waitKey(0);
    cv::destroyWindow(title);
}
