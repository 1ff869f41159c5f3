#pragma once

#include "framestream/image.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace framestream {

// Upper bound on the pixel buffer a single JPEG may expand into.
constexpr size_t kDefaultMaxDecodedBytes = size_t(256) << 20;

// Compresses a raw uint8 image with 1 or 3 channels. Returns false and
// leaves `error` set when the image cannot be represented as JPEG or
// libjpeg reports a failure.
bool encode_jpeg(const Image& image, int quality, std::vector<uint8_t>& output,
                 std::string& error);

// Decompresses a JPEG bitstream into a raw uint8 image of shape
// [height, width] (grayscale) or [height, width, 3]. Corrupt input is
// reported through the return value; libjpeg is never allowed to exit the
// process. Headers declaring more than `max_bytes` of pixels are rejected
// before anything is allocated.
bool decode_jpeg(const uint8_t* data, size_t size, size_t max_bytes, Image& output,
                 std::string& error);

} // namespace framestream
