#include "framestream/display_loop.hpp"
#include "framestream/logger.hpp"

#include <sstream>
#include <thread>

namespace framestream {

std::map<std::string, Image> coalesce_latest(std::vector<DisplayItem>&& items) {
    std::map<std::string, Image> latest;
    for (auto& item : items) {
        latest[item.source_id] = std::move(item.image);
    }
    return latest;
}

LoggingFrameSink::LoggingFrameSink(std::chrono::seconds period)
    : period_(period)
    , last_report_(std::chrono::steady_clock::now())
{
}

void LoggingFrameSink::show(const std::string& source_id, const Image& image) {
    SourceState& state = sources_[source_id];
    state.frames++;
    state.shape = describe_shape(image.shape);

    const auto now = std::chrono::steady_clock::now();
    if (now - last_report_ < period_) {
        return;
    }
    last_report_ = now;

    std::ostringstream line;
    line << "Display:";
    for (auto& entry : sources_) {
        line << " " << entry.first << "=" << entry.second.frames << "@" << entry.second.shape;
        entry.second.frames = 0;
    }
    Logger::info(line.str());
}

DisplayLoop::DisplayLoop(DisplayQueue& queue, FrameSink& sink, std::chrono::milliseconds refresh)
    : queue_(queue)
    , sink_(sink)
    , refresh_(refresh)
{
}

size_t DisplayLoop::refresh_once() {
    batch_.clear();
    const size_t drained = queue_.drain(batch_);
    if (drained == 0) {
        return 0;
    }

    auto latest = coalesce_latest(std::move(batch_));
    batch_.clear();
    coalesced_count_ += drained - latest.size();

    for (const auto& entry : latest) {
        sink_.show(entry.first, entry.second);
    }
    shown_count_ += latest.size();
    return latest.size();
}

void DisplayLoop::run(const StopToken& stop) {
    while (!stop.stop_requested()) {
        refresh_once();
        std::this_thread::sleep_for(refresh_);
    }
}

} // namespace framestream
