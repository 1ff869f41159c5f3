#include "framestream/jpeg_codec.hpp"

#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <new>

extern "C" {
#include <jpeglib.h>
}

namespace framestream {

namespace {

// libjpeg's default error_exit calls exit(); route it back to the caller.
struct ErrorManager {
    jpeg_error_mgr pub;
    jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void on_error_exit(j_common_ptr cinfo) {
    ErrorManager* err = reinterpret_cast<ErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->jump, 1);
}

void on_output_message(j_common_ptr) {
    // Warnings on corrupt-but-decodable data are not worth a log line per frame.
}

} // namespace

bool encode_jpeg(const Image& image, int quality, std::vector<uint8_t>& output,
                 std::string& error) {
    if (image.encoding != ImageEncoding::Raw || image.dtype != "uint8") {
        error = "jpeg needs a raw uint8 image";
        return false;
    }
    const int width = image.width();
    const int height = image.height();
    const int channels = image.channels();
    if (width <= 0 || height <= 0 || (channels != 1 && channels != 3) ||
        image.data.size() != static_cast<size_t>(width) * height * channels) {
        error = "unsupported image shape " + describe_shape(image.shape);
        return false;
    }

    jpeg_compress_struct cinfo;
    ErrorManager jerr;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = on_error_exit;
    jerr.pub.output_message = on_output_message;

    // Output to memory. Kept off the stack: locals changed after setjmp are
    // indeterminate once longjmp returns.
    struct MemDest {
        unsigned char* mem = nullptr;
        unsigned long size = 0;
    };
    auto dest = std::make_unique<MemDest>();

    if (setjmp(jerr.jump)) {
        jpeg_destroy_compress(&cinfo);
        std::free(dest->mem);
        error = jerr.message;
        return false;
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &dest->mem, &dest->size);

    cinfo.image_width = width;
    cinfo.image_height = height;
    cinfo.input_components = channels;
    cinfo.in_color_space = channels == 3 ? JCS_RGB : JCS_GRAYSCALE;

    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);

    // Fast compression for real-time
    cinfo.dct_method = JDCT_FASTEST;

    jpeg_start_compress(&cinfo, TRUE);

    JSAMPROW row_pointer[1];
    const int row_stride = width * channels;

    while (cinfo.next_scanline < cinfo.image_height) {
        row_pointer[0] = const_cast<JSAMPROW>(&image.data[cinfo.next_scanline * row_stride]);
        jpeg_write_scanlines(&cinfo, row_pointer, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    output.assign(dest->mem, dest->mem + dest->size);
    std::free(dest->mem);

    if (output.empty()) {
        error = "jpeg encoder produced no data";
        return false;
    }
    return true;
}

bool decode_jpeg(const uint8_t* data, size_t size, size_t max_bytes, Image& output,
                 std::string& error) {
    if (data == nullptr || size == 0) {
        error = "empty jpeg buffer";
        return false;
    }

    jpeg_decompress_struct cinfo;
    ErrorManager jerr;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = on_error_exit;
    jerr.pub.output_message = on_output_message;

    auto pixels = std::make_unique<std::vector<uint8_t>>();

    if (setjmp(jerr.jump)) {
        jpeg_destroy_decompress(&cinfo);
        error = jerr.message;
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(data), static_cast<unsigned long>(size));

    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        jpeg_destroy_decompress(&cinfo);
        error = "missing jpeg header";
        return false;
    }

    cinfo.out_color_space = cinfo.num_components == 1 ? JCS_GRAYSCALE : JCS_RGB;

    // Dimensions are at most 65535 each, so this product fits in 64 bits.
    const uint64_t declared = static_cast<uint64_t>(cinfo.image_width) * cinfo.image_height *
                              (cinfo.num_components == 1 ? 1 : 3);
    if (declared > static_cast<uint64_t>(max_bytes)) {
        jpeg_destroy_decompress(&cinfo);
        error = "jpeg declares " + std::to_string(cinfo.image_width) + "x" +
                std::to_string(cinfo.image_height) + " pixels, over the " +
                std::to_string(max_bytes) + " byte limit";
        return false;
    }

    jpeg_start_decompress(&cinfo);

    const int width = static_cast<int>(cinfo.output_width);
    const int height = static_cast<int>(cinfo.output_height);
    const int channels = cinfo.output_components;
    const size_t row_stride = static_cast<size_t>(width) * channels;
    try {
        pixels->resize(row_stride * height);
    } catch (const std::bad_alloc&) {
        jpeg_destroy_decompress(&cinfo);
        error = "out of memory for " + describe_shape({height, width, channels}) + " jpeg";
        return false;
    }

    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row_pointer[1] = {&(*pixels)[cinfo.output_scanline * row_stride]};
        jpeg_read_scanlines(&cinfo, row_pointer, 1);
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);

    output.encoding = ImageEncoding::Raw;
    output.dtype = "uint8";
    output.shape = channels == 1 ? std::vector<int>{height, width}
                                 : std::vector<int>{height, width, channels};
    output.data = std::move(*pixels);
    return true;
}

} // namespace framestream
