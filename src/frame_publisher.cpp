#include "framestream/frame_publisher.hpp"
#include "framestream/logger.hpp"
#include "framestream/wire_codec.hpp"

namespace framestream {

FramePublisher::FramePublisher(const Config& config)
    : config_(config)
    , context_(std::make_unique<zmq::context_t>(1))
    , socket_(std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub))
{
    // Set high water mark (drop old frames if subscriber slow)
    socket_->set(zmq::sockopt::sndhwm, config_.high_water_mark);
    socket_->set(zmq::sockopt::linger, 0);

    if (config_.bind) {
        socket_->bind(config_.endpoint);
        Logger::info("Frame publisher bound to: " + config_.endpoint);
    } else {
        socket_->connect(config_.endpoint);
        Logger::info("Frame publisher connected to: " + config_.endpoint);
    }
}

FramePublisher::~FramePublisher() {
    socket_->close();
}

bool FramePublisher::publish_image(const std::string& source_id, double frame_time,
                                   const Image& image, const nlohmann::json& annotation) {
    return send_parts(encode_image(source_id, frame_time, image, annotation, config_.suffix_topic));
}

bool FramePublisher::publish_log(const std::string& source_id, double frame_time,
                                 const nlohmann::json& annotation) {
    return send_parts(encode_log(source_id, frame_time, annotation, config_.suffix_topic));
}

bool FramePublisher::send_parts(const std::vector<std::string>& parts) {
    try {
        // A PUB socket at its high water mark drops the whole message, so
        // only the first part can report "would block".
        for (size_t i = 0; i < parts.size(); ++i) {
            const bool last = i + 1 == parts.size();
            const auto flags = last ? zmq::send_flags::dontwait
                                    : zmq::send_flags::sndmore | zmq::send_flags::dontwait;
            auto result = socket_->send(zmq::buffer(parts[i]), flags);
            if (!result) {
                dropped_count_++;
                return false;
            }
        }
        published_count_++;
        return true;

    } catch (const zmq::error_t& e) {
        Logger::error(std::string("ZMQ publish error: ") + e.what());
        dropped_count_++;
        return false;
    }
}

} // namespace framestream
