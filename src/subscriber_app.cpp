#include "framestream/subscriber_app.hpp"
#include "framestream/display_loop.hpp"
#include "framestream/frame_processor.hpp"
#include "framestream/logger.hpp"
#include "framestream/subscriber.hpp"
#include "framestream/time_format.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace framestream {

namespace {

StopToken g_stop;

void signal_handler(int) {
    g_stop.request_stop();
}

} // namespace

int run_subscriber_app(int argc, char* argv[], ProgramKind kind) {
    SubscriberConfig config;
    try {
        if (!parse_subscriber_args(argc, argv, kind, config)) {
            std::cout << subscriber_usage(argv[0], kind);
            return 0;
        }
        validate(config);
    } catch (const ConfigError& e) {
        Logger::error(e.what());
        std::cerr << subscriber_usage(argv[0], kind);
        return 1;
    }

    apply_timezone(config.timezone);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::unique_ptr<DisplayQueue> queue;
    std::unique_ptr<LoggingFrameSink> sink;
    std::unique_ptr<DisplayLoop> display;
    std::thread render_thread;
    if (config.display) {
        queue = std::make_unique<DisplayQueue>(config.queue_capacity);
        sink = std::make_unique<LoggingFrameSink>();
        display = std::make_unique<DisplayLoop>(*queue, *sink,
                                                std::chrono::milliseconds(config.refresh_ms));
        render_thread = std::thread([&display]() { display->run(g_stop); });
    }

    int exit_code = 0;
    FrameProcessor processor(config, queue.get(), wall_time_seconds());
    try {
        Subscriber subscriber(config, processor);
        subscriber.run(g_stop);
    } catch (const TransportError& e) {
        Logger::error(e.what());
        exit_code = 2;
    }

    // The network thread has exited; stop the renderer and abandon its queue.
    g_stop.request_stop();
    if (render_thread.joinable()) {
        render_thread.join();
    }

    const ProcessorCounters& counters = processor.counters();
    Logger::info("Shutdown complete: messages=" + std::to_string(counters.messages) +
                 " dropped=" + std::to_string(counters.dropped()) +
                 " images_written=" + std::to_string(counters.images_written) +
                 " records_written=" + std::to_string(counters.records_written) +
                 " write_failures=" + std::to_string(counters.write_failures));
    return exit_code;
}

} // namespace framestream
