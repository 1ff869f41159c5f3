#include "framestream/config.hpp"

#include <sys/stat.h>
#include <unistd.h>

namespace framestream {

namespace {

void check_output_directory(const std::string& option, const std::string& path) {
    if (path.empty()) {
        return;
    }
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        throw ConfigError(option + ": " + path + " is not a directory");
    }
    if (::access(path.c_str(), W_OK | X_OK) != 0) {
        throw ConfigError(option + ": " + path + " is not writable");
    }
}

} // namespace

void validate(const SubscriberConfig& config) {
    if (config.connect.empty() && config.bind.empty()) {
        throw ConfigError("at least one --connect or --bind endpoint is required");
    }
    if (!config.connect.empty() && !config.bind.empty()) {
        throw ConfigError("--connect and --bind are mutually exclusive");
    }
    if (config.poll_timeout_ms <= 0) {
        throw ConfigError("poll timeout must be positive");
    }
    if (config.max_decoded_bytes == 0) {
        throw ConfigError("--max-image-mb must be >= 1");
    }
    if (config.inhibition_period < 0.0) {
        throw ConfigError("--inhibit must be >= 0");
    }
    if (config.log_dump_interval < 1.0) {
        throw ConfigError("--log-interval must be >= 1");
    }
    if (config.jpeg_quality < 0 || config.jpeg_quality > 100) {
        throw ConfigError("--quality must be within 0-100");
    }
    if (config.stats_interval < 0.0) {
        throw ConfigError("--stats-interval must be >= 0");
    }
    if (config.queue_capacity == 0) {
        throw ConfigError("--queue-size must be >= 1");
    }
    if (config.refresh_ms <= 0) {
        throw ConfigError("display refresh period must be positive");
    }
    check_output_directory("--image-dir", config.image_dir);
    check_output_directory("--log-dir", config.log_dir);
}

ImageFileFormat parse_image_format(const std::string& name) {
    if (name == "jpeg" || name == "jpg") {
        return ImageFileFormat::Jpeg;
    }
    if (name == "pnm" || name == "raw") {
        return ImageFileFormat::Pnm;
    }
    throw ConfigError("unknown image encoding: " + name);
}

} // namespace framestream
