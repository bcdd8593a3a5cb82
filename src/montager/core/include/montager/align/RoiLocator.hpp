#pragma once
#include <opencv2/core.hpp>
#include "montager/core/Raster.hpp"

namespace montager {

/** Default step (px) of the ROI search in both axes. */
constexpr int kDefaultRoiStride = 4;

/**
 * Largest crop with the aspect ratio of targetSize that fits into
 * width x effectiveHeight (width-constrained first, height-constrained fallback).
 * Throws DegenerateGeometryError if either side comes out <= 0.
 */
cv::Size cropSizeFor(int width, int effectiveHeight, cv::Size targetSize);

/**
 * Find the co-brightest region shared by two same-size channels.
 *
 * The crop has the aspect ratio of targetSize, lies fully inside the image and
 * its bottom edge stays above height - clipBottom. Top-left corners are sampled
 * every `stride` px (y outer, x inner); the first corner with the strictly
 * greatest luminance sum of both channels wins.
 *
 * Throws DimensionMismatchError, DegenerateGeometryError (clipBottom >= height,
 * empty crop), std::invalid_argument (stride <= 0).
 */
cv::Rect findCoBrightestRoi(const Raster& ch1,
                            const Raster& ch2,
                            cv::Size targetSize,
                            int clipBottom,
                            int stride = kDefaultRoiStride);

} // namespace montager
