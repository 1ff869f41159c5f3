#include "framestream/topic_router.hpp"
#include "framestream/jpeg_codec.hpp"
#include "framestream/logger.hpp"

namespace framestream {

Topic topic_from_name(const std::string& logical_topic) {
    if (logical_topic == "VideoFrame") {
        return Topic::Video;
    }
    if (logical_topic == "JpegFrame") {
        return Topic::Jpeg;
    }
    if (logical_topic == "LogFrame") {
        return Topic::Log;
    }
    return Topic::Unknown;
}

const char* topic_name(Topic topic) {
    switch (topic) {
    case Topic::Video:
        return "VideoFrame";
    case Topic::Jpeg:
        return "JpegFrame";
    case Topic::Log:
        return "LogFrame";
    case Topic::Unknown:
        break;
    }
    return "Unknown";
}

RouteStatus route(Envelope& envelope, size_t max_decoded_bytes) {
    switch (envelope.topic) {
    case Topic::Video:
        return RouteStatus::Image;
    case Topic::Jpeg: {
        Image decoded;
        std::string error;
        if (!decode_jpeg(envelope.image.data.data(), envelope.image.data.size(),
                         max_decoded_bytes, decoded, error)) {
            Logger::debug("jpeg decode failed for source " + envelope.source_id + ": " + error);
            return RouteStatus::Dropped;
        }
        envelope.image = std::move(decoded);
        return RouteStatus::Image;
    }
    case Topic::Log:
        return RouteStatus::Log;
    case Topic::Unknown:
        break;
    }
    return RouteStatus::Dropped;
}

} // namespace framestream
