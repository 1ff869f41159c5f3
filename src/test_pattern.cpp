#include "framestream/test_pattern.hpp"

namespace framestream {

Image make_test_pattern(int width, int height, int channels, uint32_t frame_number) {
    Image image;
    image.encoding = ImageEncoding::Raw;
    image.dtype = "uint8";
    image.shape = channels == 1 ? std::vector<int>{height, width}
                                : std::vector<int>{height, width, channels};
    image.data.resize(static_cast<size_t>(width) * height * channels);

    const int bar = width > 0 ? static_cast<int>(frame_number % static_cast<uint32_t>(width)) : 0;
    size_t index = 0;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const bool on_bar = x >= bar && x < bar + 4;
            for (int c = 0; c < channels; ++c) {
                const int value = on_bar ? 255 : (x + y + static_cast<int>(frame_number) + c * 85) & 0xff;
                image.data[index++] = static_cast<uint8_t>(value);
            }
        }
    }
    return image;
}

} // namespace framestream
