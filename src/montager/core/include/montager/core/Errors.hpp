#pragma once

#include <stdexcept>
#include <string>

namespace montager {

/* Base class for all failures raised by the montager library.
   Each one is fatal to a single pipeline invocation only. */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* Input buffer is not a decodable image (raised by the io layer). */
class DecodeError : public Error {
public:
    using Error::Error;
};

/* Two rasters that must share width and height do not. */
class DimensionMismatchError : public Error {
public:
    using Error::Error;
};

/* Crop or output geometry would be empty (e.g. clipBottom >= height). */
class DegenerateGeometryError : public Error {
public:
    using Error::Error;
};

} // namespace montager
