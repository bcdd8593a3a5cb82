#include "montager/compose/FigureCompositor.hpp"
#include "montager/core/Errors.hpp"
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

namespace montager {

namespace {
constexpr double kShadowOpacity = 0.8;   // rgba(0,0,0,0.8)
constexpr double kShadowSigma   = 2.0;   // ~4 px blur radius

const cv::Scalar kWhite(255, 255, 255, 255);

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

struct TextStyle {
    int    face{cv::FONT_HERSHEY_DUPLEX};
    double scale{1.0};
    int    thickness{2};
};

/* Bold style whose glyph height is about `px` pixels. */
TextStyle boldStyle(const std::string& family, int px) {
    TextStyle s;
    s.face      = hersheyFontFor(family);
    s.thickness = std::max(2, px / 12);
    s.scale     = cv::getFontScaleFromHeight(s.face, px, s.thickness);
    return s;
}

/* Darken the canvas under a blurred copy of the glyphs, then draw them in white. */
void drawShadowedText(cv::Mat& canvas, const std::string& text, cv::Point origin, const TextStyle& st) {
    cv::Mat mask = cv::Mat::zeros(canvas.size(), CV_8UC1);
    cv::putText(mask, text, origin, st.face, st.scale, cv::Scalar(255), st.thickness, cv::LINE_AA);
    cv::GaussianBlur(mask, mask, cv::Size(0, 0), kShadowSigma);

    for (int y = 0; y < canvas.rows; ++y) {
        const uchar* m = mask.ptr<uchar>(y);
        Pixel* row = canvas.ptr<Pixel>(y);
        for (int x = 0; x < canvas.cols; ++x) {
            if (!m[x]) continue;
            const double keep = 1.0 - kShadowOpacity * (m[x] / 255.0);
            row[x][0] = cv::saturate_cast<uchar>(row[x][0] * keep);
            row[x][1] = cv::saturate_cast<uchar>(row[x][1] * keep);
            row[x][2] = cv::saturate_cast<uchar>(row[x][2] * keep);
        }
    }

    cv::putText(canvas, text, origin, st.face, st.scale, kWhite, st.thickness, cv::LINE_AA);
}

void requirePanel(const Raster& r, cv::Size expected, const char* what) {
    if (r.size() != expected) {
        throw DimensionMismatchError(std::string(what) + " panel is "
                                     + std::to_string(r.width()) + "x" + std::to_string(r.height())
                                     + ", expected "
                                     + std::to_string(expected.width) + "x" + std::to_string(expected.height));
    }
}
} // namespace

int hersheyFontFor(const std::string& fontFamily) {
    const std::string f = lower(fontFamily);
    if (f.find("mono") != std::string::npos || f.find("courier") != std::string::npos) {
        return cv::FONT_HERSHEY_PLAIN;
    }
    const bool serif = (f.find("serif") != std::string::npos && f.find("sans") == std::string::npos)
                    || f.find("times") != std::string::npos
                    || f.find("georgia") != std::string::npos;
    return serif ? cv::FONT_HERSHEY_TRIPLEX : cv::FONT_HERSHEY_DUPLEX;
}

/*
  Layout (all panels at y = 0):
    ch1    at x = 0
    ch2    at x = targetWidth + padding
    merged at x = 2 * (targetWidth + padding)
  Padding columns stay white.

  Labels:
    - row label: left edge at 10 px, text bottom (descenders included)
      10 px above the figure bottom. Drawn once for the whole figure.
    - column labels: text top-left 10 px inside each panel, first row only.
*/
Raster composeFigure(const Raster& ch1,
                     const Raster& ch2,
                     const Raster& merged,
                     const std::string& rowLabel,
                     bool isFirstRow,
                     const ProcessingConfig& cfg)
{
    if (cfg.targetWidth <= 0 || cfg.targetHeight <= 0) {
        throw DegenerateGeometryError("target size must be positive");
    }
    if (cfg.padding < 0) throw std::invalid_argument("padding must be >= 0");

    const cv::Size panel(cfg.targetWidth, cfg.targetHeight);
    requirePanel(ch1,    panel, "channel 1");
    requirePanel(ch2,    panel, "channel 2");
    requirePanel(merged, panel, "merged");

    const int step = cfg.targetWidth + cfg.padding;
    cv::Mat canvas(cfg.targetHeight, cfg.targetWidth * 3 + cfg.padding * 2, CV_8UC4, kWhite);

    ch1.mat().copyTo(canvas(cv::Rect(0, 0, panel.width, panel.height)));
    ch2.mat().copyTo(canvas(cv::Rect(step, 0, panel.width, panel.height)));
    merged.mat().copyTo(canvas(cv::Rect(2 * step, 0, panel.width, panel.height)));

    if (cfg.showLabels) {
        if (!rowLabel.empty()) {
            const TextStyle st = boldStyle(cfg.fontFamily, cfg.rowLabelFontSize);
            int baseLine = 0;
            cv::getTextSize(rowLabel, st.face, st.scale, st.thickness, &baseLine);
            const cv::Point origin(kLabelInset, cfg.targetHeight - kLabelInset - baseLine);
            drawShadowedText(canvas, rowLabel, origin, st);
        }

        if (isFirstRow && cfg.columnLabels.size() == 3) {
            const TextStyle st = boldStyle(cfg.fontFamily, cfg.columnLabelFontSize);
            for (int i = 0; i < 3; ++i) {
                const std::string& label = cfg.columnLabels[static_cast<std::size_t>(i)];
                if (label.empty()) continue;
                int baseLine = 0;
                const cv::Size ts = cv::getTextSize(label, st.face, st.scale, st.thickness, &baseLine);
                const cv::Point origin(i * step + kLabelInset, kLabelInset + ts.height);
                drawShadowedText(canvas, label, origin, st);
            }
        }
    }

    return Raster(std::move(canvas));
}

} // namespace montager
