#include "framestream/image_writer.hpp"
#include "framestream/jpeg_codec.hpp"
#include "framestream/logger.hpp"
#include "framestream/time_format.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace framestream {

std::string resolve_file_id(const nlohmann::json& annotation,
                            const std::string& key_path,
                            const std::string& source_id) {
    if (key_path.empty()) {
        return source_id;
    }

    const nlohmann::json* node = &annotation;
    size_t start = 0;
    while (true) {
        const size_t dot = key_path.find('.', start);
        const std::string key = key_path.substr(start, dot == std::string::npos ? std::string::npos
                                                                                 : dot - start);
        if (!node->is_object()) {
            return source_id;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return source_id;
        }
        node = &*it;
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    if (!node->is_string()) {
        return source_id;
    }
    return node->get<std::string>();
}

std::string sanitize_file_id(const std::string& id) {
    std::string clean;
    clean.reserve(id.size());
    for (char c : id) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '/' || c == '\\') {
            continue;
        }
        clean.push_back(c);
    }
    return clean.empty() ? "unknown" : clean;
}

std::string image_file_extension(ImageFileFormat format, const Image& image) {
    if (format == ImageFileFormat::Jpeg) {
        return ".jpg";
    }
    return image.channels() == 1 ? ".pgm" : ".ppm";
}

std::string image_file_name(double frame_time, const std::string& file_id,
                            ImageFileFormat format, const Image& image) {
    return format_timestamp(frame_time) + "_" + sanitize_file_id(file_id) +
           image_file_extension(format, image);
}

bool encode_pnm(const Image& image, std::vector<uint8_t>& output, std::string& error) {
    const size_t item_size = dtype_item_size(image.dtype);
    if (image.dtype != "uint8" && image.dtype != "uint16") {
        error = "pnm needs a uint8 or uint16 image, got " + image.dtype;
        return false;
    }
    const int channels = image.channels();
    if (image.shape.size() < 2 || image.shape.size() > 3 || (channels != 1 && channels != 3) ||
        expected_byte_size(image.dtype, image.shape) != image.data.size()) {
        error = "unsupported image shape " + describe_shape(image.shape);
        return false;
    }

    const std::string header = std::string(channels == 1 ? "P5" : "P6") + "\n" +
                               std::to_string(image.width()) + " " +
                               std::to_string(image.height()) + "\n" +
                               (item_size == 1 ? "255" : "65535") + "\n";
    output.assign(header.begin(), header.end());

    if (item_size == 1) {
        output.insert(output.end(), image.data.begin(), image.data.end());
        return true;
    }

    // netpbm stores 16-bit samples big-endian; the wire buffer is host order.
    output.reserve(output.size() + image.data.size());
    for (size_t i = 0; i + 1 < image.data.size(); i += 2) {
        uint16_t sample;
        std::memcpy(&sample, &image.data[i], sizeof(sample));
        output.push_back(static_cast<uint8_t>(sample >> 8));
        output.push_back(static_cast<uint8_t>(sample & 0xff));
    }
    return true;
}

ImageWriter::ImageWriter(const Config& config)
    : config_(config)
{
}

bool ImageWriter::encode(const Image& image, std::vector<uint8_t>& output,
                         std::string& error) const {
    if (config_.format == ImageFileFormat::Jpeg) {
        return encode_jpeg(image, config_.jpeg_quality, output, error);
    }
    return encode_pnm(image, output, error);
}

bool ImageWriter::write(const Image& image, double frame_time,
                        const nlohmann::json& annotation, const std::string& source_id) {
    const std::string file_id = resolve_file_id(annotation, config_.file_id_key, source_id);
    const std::string name = image_file_name(frame_time, file_id, config_.format, image);
    const std::string temp_path = config_.directory + "/transferring." + name;
    const std::string final_path = config_.directory + "/" + name;

    std::vector<uint8_t> encoded;
    std::string error;
    if (!encode(image, encoded, error)) {
        Logger::warn("Failed to encode image " + name + ": " + error);
        failed_count_++;
        return false;
    }

    std::ofstream out(temp_path, std::ios::out | std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(encoded.data()),
              static_cast<std::streamsize>(encoded.size()));
    out.close();
    if (!out) {
        Logger::warn("Failed to write " + temp_path + ": " + std::strerror(errno));
        std::remove(temp_path.c_str());
        failed_count_++;
        return false;
    }

    if (std::rename(temp_path.c_str(), final_path.c_str()) != 0) {
        Logger::warn("Failed to rename " + temp_path + " to " + final_path + ": " +
                     std::strerror(errno));
        std::remove(temp_path.c_str());
        failed_count_++;
        return false;
    }

    last_path_ = final_path;
    written_count_++;
    return true;
}

} // namespace framestream
