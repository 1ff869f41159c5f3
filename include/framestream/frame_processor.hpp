#pragma once

#include "framestream/annotation_writer.hpp"
#include "framestream/config.hpp"
#include "framestream/display_loop.hpp"
#include "framestream/envelope.hpp"
#include "framestream/image_writer.hpp"
#include "framestream/inhibition_gate.hpp"
#include "framestream/log_window.hpp"
#include "framestream/stats_tracker.hpp"
#include "framestream/topic_router.hpp"
#include "framestream/wire_codec.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace framestream {

struct ProcessorCounters {
    uint64_t messages = 0;
    uint64_t short_messages = 0;
    uint64_t unknown_topics = 0;
    uint64_t bad_encodings = 0;
    uint64_t undecodable_images = 0;
    uint64_t internal_errors = 0;
    uint64_t images = 0;
    uint64_t records = 0;
    uint64_t inhibited = 0;
    uint64_t images_written = 0;
    uint64_t records_written = 0;
    uint64_t write_failures = 0;
    uint64_t queue_full = 0;

    uint64_t dropped() const {
        return short_messages + unknown_topics + bad_encodings + undecodable_images +
               internal_errors;
    }
};

// Everything the subscriber thread does with a message once it has been
// received: decode, route, count, inhibit, persist, enqueue for display.
// Socket-free so it can be driven directly with parts and timestamps.
class FrameProcessor {
public:
    // `display_queue` may be null when nothing renders frames.
    FrameProcessor(const SubscriberConfig& config, DisplayQueue* display_queue, double now);
    ~FrameProcessor();

    FrameProcessor(const FrameProcessor&) = delete;
    FrameProcessor& operator=(const FrameProcessor&) = delete;

    // Never throws; every failure is counted as dropped.
    void handle_message(const std::vector<std::string>& parts, double now);

    // Once per poll cycle, with or without traffic: rotates the log window
    // and emits periodic stats.
    void tick(double now);

    // Publishes any open log window.
    void shutdown();

    const ProcessorCounters& counters() const { return counters_; }
    const LogWindow* log_window() const { return log_window_.get(); }

private:
    void count_decode_failure(DecodeStatus status);
    void persist(const Envelope& envelope, RouteStatus kind, double now);
    void echo(const Envelope& envelope);
    void enqueue(Envelope& envelope);

    SubscriberConfig config_;
    DisplayQueue* display_queue_;
    StatsTracker stats_;
    InhibitionGate gate_;
    AnnotationWriter annotation_writer_;
    std::unique_ptr<ImageWriter> image_writer_;
    std::unique_ptr<LogWindow> log_window_;
    ProcessorCounters counters_;
};

} // namespace framestream
