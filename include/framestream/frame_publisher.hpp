#pragma once

#include "framestream/image.hpp"

#include <zmq.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace framestream {

class FramePublisher {
public:
    struct Config {
        std::string endpoint = "tcp://127.0.0.1:5555";
        bool bind = true;            // false connects to a binding subscriber
        int high_water_mark = 2;     // Drop frames if subscriber is slow
        bool suffix_topic = false;   // Publish "<Topic>/<source_id>"
    };

    explicit FramePublisher(const Config& config);
    ~FramePublisher();

    // Sends one VideoFrame (raw image) or JpegFrame (image.encoding == Jpeg).
    bool publish_image(const std::string& source_id, double frame_time, const Image& image,
                       const nlohmann::json& annotation);

    bool publish_log(const std::string& source_id, double frame_time,
                     const nlohmann::json& annotation);

    // Statistics
    uint64_t get_published_count() const { return published_count_; }
    uint64_t get_dropped_count() const { return dropped_count_; }

private:
    bool send_parts(const std::vector<std::string>& parts);

    Config config_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> socket_;
    uint64_t published_count_{0};
    uint64_t dropped_count_{0};
};

} // namespace framestream
