#pragma once

#include "framestream/handoff_queue.hpp"
#include "framestream/image.hpp"
#include "framestream/stop_token.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace framestream {

struct DisplayItem {
    std::string source_id;
    Image image;
};

using DisplayQueue = HandoffQueue<DisplayItem>;

// Keeps only the most recently dequeued image of each source.
std::map<std::string, Image> coalesce_latest(std::vector<DisplayItem>&& items);

// Presentation surface for the render thread.
class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void show(const std::string& source_id, const Image& image) = 0;
};

// Headless sink: counts frames per source and logs a summary every `period`.
class LoggingFrameSink : public FrameSink {
public:
    explicit LoggingFrameSink(std::chrono::seconds period = std::chrono::seconds(5));

    void show(const std::string& source_id, const Image& image) override;

private:
    struct SourceState {
        uint64_t frames = 0;
        std::string shape;
    };

    std::chrono::steady_clock::duration period_;
    std::chrono::steady_clock::time_point last_report_;
    std::map<std::string, SourceState> sources_;
};

// Render thread body: drains the queue, coalesces, hands each source's latest
// frame to the sink, then paces itself. Never blocks the producer.
class DisplayLoop {
public:
    DisplayLoop(DisplayQueue& queue, FrameSink& sink, std::chrono::milliseconds refresh);

    void run(const StopToken& stop);

    // One drain-coalesce-show pass; returns how many frames were shown.
    size_t refresh_once();

    uint64_t shown_count() const { return shown_count_; }
    uint64_t coalesced_count() const { return coalesced_count_; }

private:
    DisplayQueue& queue_;
    FrameSink& sink_;
    std::chrono::milliseconds refresh_;
    std::vector<DisplayItem> batch_;
    uint64_t shown_count_{0};
    uint64_t coalesced_count_{0};
};

} // namespace framestream
