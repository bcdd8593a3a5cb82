#pragma once
#include "montager/core/Raster.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace montager {

/** True if `bytes` starts with a classic or BigTIFF signature (II / MM). */
bool hasTiffSignature(const std::vector<std::uint8_t>& bytes) noexcept;

/**
 * Decode the first page of a TIFF buffer into an RGBA8 raster.
 * Gray, BGR and BGRA pages of 8/16-bit or float depth are accepted.
 * Throws DecodeError if the buffer is not a TIFF or cannot be decoded.
 */
Raster decodeTiff(const std::vector<std::uint8_t>& bytes);

/** Read a whole file and decode it with decodeTiff(). Throws DecodeError. */
Raster readTiffFile(const std::string& path);

} // namespace montager
