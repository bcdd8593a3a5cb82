#include <gtest/gtest.h>
#include "montager/core/Pipeline.hpp"
#include "montager/core/Errors.hpp"
#include "test_helpers.hpp"

using namespace montager;
using montager::test::FixedRandomSource;
using montager::test::gray;
using montager::test::identical;
using montager::test::noise;
using montager::test::squareOn;

namespace {

ProcessingConfig squareCfg() {
    ProcessingConfig c;
    c.targetWidth = 50;
    c.targetHeight = 50;
    c.clipBottom = 0;
    c.padding = 10;
    c.randomness = 0.0;
    c.targetIntensity = 200.0;
    c.showLabels = false;
    return c;
}

} // namespace

TEST(PipelineTest, WhiteSquareEndToEnd) {
    const Raster a = squareOn(100, 100, cv::Rect(40, 40, 20, 20));
    const Raster b = squareOn(100, 100, cv::Rect(40, 40, 20, 20));
    FixedRandomSource rnd(0.5);

    const Raster fig = composeRow(a, b, squareCfg(), "", true, rnd);

    ASSERT_EQ(fig.size(), cv::Size(50 * 3 + 10 * 2, 50));
    // 100 -> 50 area resample maps the square onto [20,30); peak 255 -> 200
    EXPECT_EQ(fig.at(25, 25),       Pixel(200, 200, 200, 255));   // channel 1
    EXPECT_EQ(fig.at(60 + 25, 25),  Pixel(200, 200, 200, 255));   // channel 2
    EXPECT_EQ(fig.at(120 + 25, 25), Pixel(200, 200, 0, 255));     // merge
    EXPECT_EQ(fig.at(120 + 5, 5),   Pixel(0, 0, 0, 255));
    EXPECT_EQ(fig.at(55, 25),       Pixel(255, 255, 255, 255));   // padding
}

TEST(PipelineTest, OneDrawPerChannelInOrder) {
    const Raster a = gray(64, 64, 100);
    const Raster b = gray(64, 64, 100);
    ProcessingConfig cfg = squareCfg();
    cfg.targetWidth = cfg.targetHeight = 32;
    cfg.randomness = 0.2;

    FixedRandomSource rnd(std::vector<double>{0.0, 1.0});
    const Raster fig = composeRow(a, b, cfg, "", false, rnd);

    EXPECT_EQ(rnd.calls(), 2);
    EXPECT_EQ(fig.at(5, 5)[0],      180);   // channel 1: 200 * 0.9
    EXPECT_EQ(fig.at(42 + 5, 5)[0], 220);   // channel 2: 200 * 1.1
    EXPECT_EQ(fig.at(84 + 5, 5),    Pixel(220, 180, 0, 255));
}

TEST(PipelineTest, ZeroRandomnessIsDeterministic) {
    const Raster a = noise(160, 120, 1);
    const Raster b = noise(160, 120, 2);
    ProcessingConfig cfg = squareCfg();
    cfg.targetWidth = 80;
    cfg.targetHeight = 40;
    cfg.clipBottom = 10;

    const Raster r1 = composeRow(a, b, cfg, "row", true);
    const Raster r2 = composeRow(a, b, cfg, "row", true);
    EXPECT_TRUE(identical(r1, r2));
}

TEST(PipelineTest, JitterKeepsGeometry) {
    const Raster a = noise(160, 120, 3);
    const Raster b = noise(160, 120, 4);
    ProcessingConfig cfg = squareCfg();
    cfg.randomness = 0.5;

    FixedRandomSource low(0.0), high(0.99);
    const Raster r1 = composeRow(a, b, cfg, "", false, low);
    const Raster r2 = composeRow(a, b, cfg, "", false, high);
    EXPECT_EQ(r1.size(), r2.size());
    EXPECT_FALSE(identical(r1, r2));
}

TEST(PipelineTest, DimensionMismatchRaisedBeforeAnyWork) {
    FixedRandomSource rnd(0.5);
    EXPECT_THROW((void)composeRow(gray(100, 100, 1), gray(100, 90, 1), squareCfg(), "", true, rnd),
                 DimensionMismatchError);
    EXPECT_THROW((void)composeRow(gray(100, 100, 1), gray(90, 100, 1), squareCfg(), "", true, rnd),
                 DimensionMismatchError);
    EXPECT_EQ(rnd.calls(), 0);
}

TEST(PipelineTest, ClipBottomAtOrBeyondHeightIsDegenerate) {
    FixedRandomSource rnd(0.5);
    ProcessingConfig cfg = squareCfg();
    cfg.clipBottom = 100;
    EXPECT_THROW((void)composeRow(gray(100, 100, 1), gray(100, 100, 1), cfg, "", true, rnd),
                 DegenerateGeometryError);
    cfg.clipBottom = 250;
    EXPECT_THROW((void)composeRow(gray(100, 100, 1), gray(100, 100, 1), cfg, "", true, rnd),
                 DegenerateGeometryError);
    EXPECT_EQ(rnd.calls(), 0);
}

TEST(PipelineTest, InvalidTargetSizeIsDegenerate) {
    FixedRandomSource rnd(0.5);
    ProcessingConfig cfg = squareCfg();
    cfg.targetHeight = 0;
    EXPECT_THROW((void)composeRow(gray(10, 10, 1), gray(10, 10, 1), cfg, "", true, rnd),
                 DegenerateGeometryError);
}

TEST(PipelineTest, EmptyInputsAreRejected) {
    FixedRandomSource rnd(0.5);
    EXPECT_THROW((void)composeRow(Raster{}, Raster{}, squareCfg(), "", true, rnd),
                 DegenerateGeometryError);
}
