#pragma once

#include "framestream/image_writer.hpp"
#include "framestream/jpeg_codec.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace framestream {

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct SubscriberConfig {
    // Transport
    std::vector<std::string> connect;   // mutually exclusive with bind
    std::vector<std::string> bind;
    std::vector<std::string> topics;    // empty subscribes to everything
    int receive_hwm = 8;
    int poll_timeout_ms = 100;
    size_t max_decoded_bytes = kDefaultMaxDecodedBytes;

    // Persistence; an empty directory disables that output
    std::string image_dir;
    std::string log_dir;
    std::string file_id_key;
    std::string timezone = "local";
    double inhibition_period = 0.0;     // seconds, >= 0
    double log_dump_interval = 60.0;    // seconds, >= 1
    bool flatten = false;
    std::vector<std::string> csv_fields;
    ImageFileFormat image_format = ImageFileFormat::Jpeg;
    int jpeg_quality = 95;

    // Reporting and display
    double stats_interval = 5.0;        // seconds, 0 disables
    bool display = false;
    bool quiet = false;
    size_t queue_capacity = 8;
    int refresh_ms = 30;

    bool persistence_enabled() const { return !image_dir.empty() || !log_dir.empty(); }
};

// Throws ConfigError naming the first invalid setting.
void validate(const SubscriberConfig& config);

ImageFileFormat parse_image_format(const std::string& name);

} // namespace framestream
