#include <gtest/gtest.h>
#include "montager/process/ChannelNormalizer.hpp"
#include "montager/core/Errors.hpp"
#include "test_helpers.hpp"

using namespace montager;
using montager::test::FixedRandomSource;
using montager::test::gray;
using montager::test::grayGradient;
using montager::test::identical;
using montager::test::solid;

namespace {

ProcessingConfig cfgFor(int w, int h, double intensity = 200.0, double randomness = 0.0) {
    ProcessingConfig c;
    c.targetWidth = w;
    c.targetHeight = h;
    c.targetIntensity = intensity;
    c.randomness = randomness;
    return c;
}

/* Left half `lo`, right half `hi`. */
Raster halves(int w, int h, uchar lo, uchar hi) {
    cv::Mat m(h, w, CV_8UC4, cv::Scalar(lo, lo, lo, 255));
    m(cv::Rect(w / 2, 0, w - w / 2, h)).setTo(cv::Scalar(hi, hi, hi, 255));
    return Raster(std::move(m));
}

} // namespace

TEST(ChannelNormalizerTest, OutputHasTargetSize) {
    FixedRandomSource rnd(0.5);
    const Raster src = grayGradient(300, 200);

    const Raster down = normalizeChannel(src, cv::Rect(10, 20, 200, 100), cfgFor(50, 25), rnd);
    EXPECT_EQ(down.size(), cv::Size(50, 25));

    const Raster up = normalizeChannel(src, cv::Rect(0, 0, 20, 10), cfgFor(80, 40), rnd);
    EXPECT_EQ(up.size(), cv::Size(80, 40));
}

TEST(ChannelNormalizerTest, PeakIsScaledToTargetKeepingRatios) {
    FixedRandomSource rnd(0.5);
    const Raster src = halves(40, 20, 50, 100);

    const Raster out = normalizeChannel(src, cv::Rect(0, 0, 40, 20), cfgFor(40, 20, 200.0), rnd);

    EXPECT_EQ(out.at(0, 0),  Pixel(100, 100, 100, 255));
    EXPECT_EQ(out.at(39, 19), Pixel(200, 200, 200, 255));
}

TEST(ChannelNormalizerTest, CropSelectsRoiContent) {
    FixedRandomSource rnd(0.5);
    const Raster src = halves(40, 20, 30, 90);

    // right half only: uniform 90 -> scaled to exactly 200
    const Raster out = normalizeChannel(src, cv::Rect(20, 0, 20, 20), cfgFor(10, 10, 200.0), rnd);
    for (int y = 0; y < out.height(); ++y)
        for (int x = 0; x < out.width(); ++x)
            ASSERT_EQ(out.at(x, y), Pixel(200, 200, 200, 255)) << x << "," << y;
}

TEST(ChannelNormalizerTest, ZeroRandomnessIsBitIdentical) {
    const Raster src = grayGradient(180, 120);
    const cv::Rect roi(13, 7, 150, 75);
    const ProcessingConfig cfg = cfgFor(64, 32, 200.0, 0.0);

    FixedRandomSource r1(0.1), r2(0.9);
    const Raster a = normalizeChannel(src, roi, cfg, r1);
    const Raster b = normalizeChannel(src, roi, cfg, r2);
    EXPECT_TRUE(identical(a, b));
}

TEST(ChannelNormalizerTest, DrawsExactlyOncePerCall) {
    FixedRandomSource rnd(0.5);
    const Raster src = grayGradient(50, 50);
    (void)normalizeChannel(src, cv::Rect(0, 0, 50, 50), cfgFor(20, 20, 200.0, 0.3), rnd);
    EXPECT_EQ(rnd.calls(), 1);
    (void)normalizeChannel(src, cv::Rect(0, 0, 50, 50), cfgFor(20, 20, 200.0, 0.3), rnd);
    EXPECT_EQ(rnd.calls(), 2);
}

TEST(ChannelNormalizerTest, JitterSpansHalfRandomnessEachWay) {
    const Raster src = gray(10, 10, 100);
    const cv::Rect roi(0, 0, 10, 10);
    const ProcessingConfig cfg = cfgFor(10, 10, 200.0, 0.2);

    FixedRandomSource low(0.0), high(1.0), mid(0.5);
    EXPECT_EQ(normalizeChannel(src, roi, cfg, low).at(5, 5)[0],  180);   // 200 * 0.9
    EXPECT_EQ(normalizeChannel(src, roi, cfg, high).at(5, 5)[0], 220);   // 200 * 1.1
    EXPECT_EQ(normalizeChannel(src, roi, cfg, mid).at(5, 5)[0],  200);
}

TEST(ChannelNormalizerTest, ChannelsAreClampedAndAlphaKept) {
    FixedRandomSource rnd(0.999);
    const Raster src = solid(16, 16, Pixel(40, 80, 160, 77));
    const ProcessingConfig cfg = cfgFor(16, 16, 255.0, 1.0);   // target up to ~382

    const Raster out = normalizeChannel(src, cv::Rect(0, 0, 16, 16), cfg, rnd);
    const Pixel p = out.at(3, 3);
    EXPECT_EQ(p[2], 255);          // 160 * 382/160 saturates
    EXPECT_LE(p[0], 255);
    EXPECT_GT(p[1], 80);
    EXPECT_EQ(p[3], 77);
}

TEST(ChannelNormalizerTest, BlackInputStaysBlack) {
    FixedRandomSource rnd(0.5);
    const Raster out = normalizeChannel(gray(20, 20, 0), cv::Rect(0, 0, 20, 20), cfgFor(10, 10), rnd);
    EXPECT_EQ(out.at(0, 0), Pixel(0, 0, 0, 255));
}

TEST(ChannelNormalizerTest, RoiOutsideSourceIsRejected) {
    FixedRandomSource rnd(0.5);
    const Raster src = gray(20, 20, 10);
    EXPECT_THROW((void)normalizeChannel(src, cv::Rect(10, 10, 20, 5), cfgFor(5, 5), rnd), DegenerateGeometryError);
    EXPECT_THROW((void)normalizeChannel(src, cv::Rect(0, 0, 0, 5),    cfgFor(5, 5), rnd), DegenerateGeometryError);
    EXPECT_THROW((void)normalizeChannel(src, cv::Rect(0, 0, 5, 5),    cfgFor(0, 5), rnd), DegenerateGeometryError);
    EXPECT_EQ(rnd.calls(), 0);
}
