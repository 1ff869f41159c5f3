#pragma once

#include "framestream/image.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace framestream {

enum class Topic {
    Video,
    Jpeg,
    Log,
    Unknown
};

// One decoded wire message. `image` is only meaningful for the Video and
// Jpeg topics; `annotation` is always an object after decoding.
struct Envelope {
    Topic topic = Topic::Unknown;
    std::string source_id;
    double frame_time = 0.0;
    Image image;
    nlohmann::json annotation = nlohmann::json::object();
};

} // namespace framestream
