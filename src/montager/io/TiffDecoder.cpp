#include "montager/io/TiffDecoder.hpp"
#include "montager/core/Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <fstream>
#include <iterator>
#include <utility>

namespace montager {

namespace {

// Bring any depth down to 8 bit. Float data is assumed to be in [0..1].
cv::Mat to8u(const cv::Mat& src) {
    cv::Mat u8;
    switch (src.depth()) {
        case CV_8U:  u8 = src;                                  break;
        case CV_16U: src.convertTo(u8, CV_8U, 1.0 / 257.0);     break;
        case CV_32F:
        case CV_64F: src.convertTo(u8, CV_8U, 255.0);           break;
        default:     src.convertTo(u8, CV_8U);                  break;
    }
    return u8;
}

} // namespace

bool hasTiffSignature(const std::vector<std::uint8_t>& bytes) noexcept {
    if (bytes.size() < 4) return false;
    const bool little = bytes[0] == 'I' && bytes[1] == 'I' && bytes[3] == 0 && (bytes[2] == 42 || bytes[2] == 43);
    const bool big    = bytes[0] == 'M' && bytes[1] == 'M' && bytes[2] == 0 && (bytes[3] == 42 || bytes[3] == 43);
    return little || big;
}

/*
  imdecode() returns only the first page of a multi-page TIFF,
  in OpenCV channel order (Gray / BGR / BGRA). Convert to RGBA8.
*/
Raster decodeTiff(const std::vector<std::uint8_t>& bytes) {
    if (!hasTiffSignature(bytes)) {
        throw DecodeError("Invalid TIFF file: missing TIFF signature");
    }

    cv::Mat page;
    try {
        page = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("Invalid TIFF file: ") + e.what());
    }
    if (page.empty()) {
        throw DecodeError("Invalid TIFF file: no decodable page");
    }

    const cv::Mat u8 = to8u(page);
    cv::Mat rgba;
    switch (u8.channels()) {
        case 1: cv::cvtColor(u8, rgba, cv::COLOR_GRAY2RGBA); break;
        case 3: cv::cvtColor(u8, rgba, cv::COLOR_BGR2RGBA);  break;
        case 4: cv::cvtColor(u8, rgba, cv::COLOR_BGRA2RGBA); break;
        default:
            throw DecodeError("Unsupported TIFF page with " + std::to_string(u8.channels()) + " channels");
    }
    return Raster(std::move(rgba));
}

Raster readTiffFile(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw DecodeError("cannot open " + path);

    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(ifs)),
                                    std::istreambuf_iterator<char>());
    if (ifs.bad()) throw DecodeError("failed to read " + path);
    return decodeTiff(bytes);
}

} // namespace montager
