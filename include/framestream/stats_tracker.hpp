#pragma once

#include <cstdint>
#include <string>

namespace framestream {

struct StatsReport {
    uint64_t received = 0;
    uint64_t dropped = 0;
    double elapsed = 0.0;
    double in_fps = 0.0;
    double average_delay = 0.0;
};

// Rolling delivery counters, reset every time a report is produced.
// All timestamps are wall-clock seconds since the epoch. Not thread safe;
// lives on the subscriber thread.
class StatsTracker {
public:
    // interval <= 0 disables reporting; counters still accumulate.
    StatsTracker(double interval, double now);

    void on_received();
    void on_delay(double frame_time, double now);
    void on_dropped();

    // Produces a report and resets the window once `interval` has elapsed.
    bool poll(double now, StatsReport& report);

    uint64_t received() const { return received_; }
    uint64_t dropped() const { return dropped_; }

private:
    double interval_;
    double window_start_;
    uint64_t received_{0};
    uint64_t dropped_{0};
    double delay_{0.0};
};

std::string format_report(const StatsReport& report);

} // namespace framestream
