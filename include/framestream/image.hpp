#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace framestream {

enum class ImageEncoding {
    Raw,
    Jpeg
};

// Pixel buffer as it travels on the wire and through the handoff queue.
// Raw images are row-major with shape [height, width] or
// [height, width, channels]; Jpeg images carry the compressed bitstream and
// an empty shape until the router decodes them.
struct Image {
    ImageEncoding encoding = ImageEncoding::Raw;
    std::string dtype = "uint8";
    std::vector<int> shape;
    std::vector<uint8_t> data;

    int height() const { return shape.size() >= 1 ? shape[0] : 0; }
    int width() const { return shape.size() >= 2 ? shape[1] : 0; }
    int channels() const { return shape.size() >= 3 ? shape[2] : 1; }
};

// Size in bytes of one element of dtype, 0 when the dtype is unknown.
size_t dtype_item_size(const std::string& dtype);

// Number of bytes a raw image of this dtype and shape occupies, 0 when the
// dtype is unknown, any dimension is not positive or the product does not
// fit in size_t.
size_t expected_byte_size(const std::string& dtype, const std::vector<int>& shape);

std::string describe_shape(const std::vector<int>& shape);

} // namespace framestream
