#pragma once

#include "framestream/image.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace framestream {

enum class ImageFileFormat {
    Jpeg,  // .jpg
    Pnm    // .ppm / .pgm, uncompressed
};

// Walks a dot-separated key path through nested objects. Falls back to
// `source_id` when the path is empty or does not end at a string.
std::string resolve_file_id(const nlohmann::json& annotation,
                            const std::string& key_path,
                            const std::string& source_id);

// Drops whitespace and path separators; never returns an empty string.
std::string sanitize_file_id(const std::string& id);

std::string image_file_extension(ImageFileFormat format, const Image& image);

// "<timestamp>_<id><ext>"; the same frame time and id always give the same name.
std::string image_file_name(double frame_time, const std::string& file_id,
                            ImageFileFormat format, const Image& image);

// Binary netpbm (P5/P6) encoding for uint8 and uint16 images.
bool encode_pnm(const Image& image, std::vector<uint8_t>& output, std::string& error);

class ImageWriter {
public:
    struct Config {
        std::string directory;
        std::string file_id_key;
        ImageFileFormat format = ImageFileFormat::Jpeg;
        int jpeg_quality = 95;
    };

    explicit ImageWriter(const Config& config);

    // Encodes, stages as "transferring.<name>" and renames into place.
    // Returns false after best-effort cleanup on any failure; never throws.
    bool write(const Image& image, double frame_time,
               const nlohmann::json& annotation, const std::string& source_id);

    const std::string& last_path() const { return last_path_; }
    uint64_t written_count() const { return written_count_; }
    uint64_t failed_count() const { return failed_count_; }

private:
    bool encode(const Image& image, std::vector<uint8_t>& output, std::string& error) const;

    Config config_;
    std::string last_path_;
    uint64_t written_count_{0};
    uint64_t failed_count_{0};
};

} // namespace framestream
