#pragma once
#include "montager/core/Raster.hpp"

#include <vector>

namespace montager {

/** Vertical gap (px) between montage rows. */
constexpr int kDefaultRowGap = 10;

/**
 * Stack composed rows top to bottom on a white canvas, `gap` px apart.
 * Result height = sum(row heights) + gap * (rows - 1).
 * Throws std::invalid_argument for no rows or a negative gap,
 * DimensionMismatchError if row widths differ.
 */
Raster stackRows(const std::vector<Raster>& rows, int gap = kDefaultRowGap);

} // namespace montager
