#include "framestream/stats_tracker.hpp"

#include <iomanip>
#include <sstream>

namespace framestream {

StatsTracker::StatsTracker(double interval, double now)
    : interval_(interval)
    , window_start_(now)
{
}

void StatsTracker::on_received() {
    received_++;
}

void StatsTracker::on_delay(double frame_time, double now) {
    delay_ += now - frame_time;
}

void StatsTracker::on_dropped() {
    dropped_++;
}

bool StatsTracker::poll(double now, StatsReport& report) {
    if (interval_ <= 0.0) {
        return false;
    }
    const double elapsed = now - window_start_;
    if (elapsed < interval_) {
        return false;
    }

    report.received = received_;
    report.dropped = dropped_;
    report.elapsed = elapsed;
    report.in_fps = elapsed > 0.0 ? static_cast<double>(received_ - dropped_) / elapsed : 0.0;
    report.average_delay = received_ > 0 ? delay_ / static_cast<double>(received_) : 0.0;

    received_ = 0;
    dropped_ = 0;
    delay_ = 0.0;
    window_start_ = now;
    return true;
}

std::string format_report(const StatsReport& report) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3)
        << "Stats: received=" << report.received
        << " dropped=" << report.dropped
        << " elapsed=" << report.elapsed << "s"
        << " in_fps=" << report.in_fps
        << " avg_delay=" << report.average_delay << "s";
    return out.str();
}

} // namespace framestream
