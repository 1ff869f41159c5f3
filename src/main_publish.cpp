#include "framestream/frame_publisher.hpp"
#include "framestream/jpeg_codec.hpp"
#include "framestream/logger.hpp"
#include "framestream/stop_token.hpp"
#include "framestream/test_pattern.hpp"
#include "framestream/time_format.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

framestream::StopToken running_stop;

void signal_handler(int) {
    running_stop.request_stop();
}

struct PatternConfig {
    std::string source_id = "pattern";
    int width = 640;
    int height = 480;
    int channels = 3;
    double fps = 10.0;
    bool jpeg = false;
    int jpeg_quality = 85;
    int log_every = 0;  // publish a LogFrame every N images, 0 disables
};

void print_stats(const framestream::FramePublisher& publisher,
                 const std::atomic<uint64_t>& generated) {
    while (!running_stop.stop_requested()) {
        for (int i = 0; i < 50 && !running_stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (running_stop.stop_requested()) break;

        framestream::Logger::info("Stats: generated=" + std::to_string(generated.load()) +
                                  " published=" + std::to_string(publisher.get_published_count()) +
                                  " dropped=" + std::to_string(publisher.get_dropped_count()));
    }
}

void print_usage(const char* program) {
    std::cout << "Test-pattern frame publisher for framestream\n"
              << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --endpoint URL    ZMQ endpoint (default: tcp://127.0.0.1:5555)\n"
              << "  --connect         Connect instead of bind\n"
              << "  --source-id ID    Source identifier (default: pattern)\n"
              << "  --width N         Frame width (default: 640)\n"
              << "  --height N        Frame height (default: 480)\n"
              << "  --channels N      1 or 3 (default: 3)\n"
              << "  --fps N           Frames per second (default: 10)\n"
              << "  --jpeg            Publish JpegFrame instead of VideoFrame\n"
              << "  --quality N       JPEG quality 0-100 (default: 85)\n"
              << "  --log-every N     Also publish a LogFrame every N frames\n"
              << "  --suffix-topic    Append /<source-id> to the topic\n"
              << "  --hwm N           Send high water mark (default: 2)\n"
              << "  --help            Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using framestream::Logger;

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Parse arguments
    PatternConfig pattern;
    framestream::FramePublisher::Config publisher_config;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            const bool has_value = i + 1 < argc;
            if (arg == "--endpoint" && has_value) {
                publisher_config.endpoint = argv[++i];
            } else if (arg == "--connect") {
                publisher_config.bind = false;
            } else if (arg == "--source-id" && has_value) {
                pattern.source_id = argv[++i];
            } else if (arg == "--width" && has_value) {
                pattern.width = std::stoi(argv[++i]);
            } else if (arg == "--height" && has_value) {
                pattern.height = std::stoi(argv[++i]);
            } else if (arg == "--channels" && has_value) {
                pattern.channels = std::stoi(argv[++i]);
            } else if (arg == "--fps" && has_value) {
                pattern.fps = std::stod(argv[++i]);
            } else if (arg == "--jpeg") {
                pattern.jpeg = true;
            } else if (arg == "--quality" && has_value) {
                pattern.jpeg_quality = std::stoi(argv[++i]);
            } else if (arg == "--log-every" && has_value) {
                pattern.log_every = std::stoi(argv[++i]);
            } else if (arg == "--suffix-topic") {
                publisher_config.suffix_topic = true;
            } else if (arg == "--hwm" && has_value) {
                publisher_config.high_water_mark = std::stoi(argv[++i]);
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                Logger::error("Unknown or incomplete option: " + arg);
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        Logger::error(std::string("Invalid option value: ") + e.what());
        return 1;
    }

    if (pattern.width <= 0 || pattern.height <= 0 || pattern.fps <= 0.0 ||
        (pattern.channels != 1 && pattern.channels != 3)) {
        Logger::error("Frame size, channels and fps must describe a valid stream");
        return 1;
    }

    std::unique_ptr<framestream::FramePublisher> publisher;
    try {
        publisher = std::make_unique<framestream::FramePublisher>(publisher_config);
    } catch (const zmq::error_t& e) {
        Logger::error(std::string("Failed to open publisher: ") + e.what());
        return 1;
    }

    std::atomic<uint64_t> generated{0};
    std::thread stats_thread(print_stats, std::cref(*publisher), std::cref(generated));

    // Main loop: publish frames at the requested rate
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / pattern.fps));
    auto next_frame = std::chrono::steady_clock::now();
    uint32_t frame_number = 0;

    while (!running_stop.stop_requested()) {
        framestream::Image image = framestream::make_test_pattern(
            pattern.width, pattern.height, pattern.channels, frame_number);

        if (pattern.jpeg) {
            std::vector<uint8_t> compressed;
            std::string error;
            if (!framestream::encode_jpeg(image, pattern.jpeg_quality, compressed, error)) {
                Logger::error("JPEG encoding failed: " + error);
                break;
            }
            image.encoding = framestream::ImageEncoding::Jpeg;
            image.data = std::move(compressed);
        }

        const double now = framestream::wall_time_seconds();
        nlohmann::json annotation = {{"frame_number", frame_number}};
        publisher->publish_image(pattern.source_id, now, image, annotation);
        generated++;

        if (pattern.log_every > 0 && frame_number % static_cast<uint32_t>(pattern.log_every) == 0) {
            nlohmann::json record = {{"event", "heartbeat"}, {"frame_number", frame_number}};
            publisher->publish_log(pattern.source_id, now, record);
        }
        frame_number++;

        next_frame += period;
        std::this_thread::sleep_until(next_frame);
    }

    running_stop.request_stop();
    stats_thread.join();

    Logger::info("Shutdown complete");
    return 0;
}
