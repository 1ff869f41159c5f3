#pragma once

#include <string>

namespace framestream {

// Wall-clock seconds since the epoch.
double wall_time_seconds();

// Latest instant a four digit year can name, 9999-12-31T23:59:59Z.
constexpr double kMaxFrameTime = 253402300799.0;

// True for finite times within +/- kMaxFrameTime, the range format_timestamp
// renders.
bool is_valid_frame_time(double seconds);

// "YYYY-MM-DD_HH:MM:SS.mmm+HHMM" in the process timezone, rounded to the
// nearest millisecond.
std::string format_timestamp(double seconds);

// Points the process timezone at `name` ("local" keeps the inherited TZ).
// Call once at startup, before any thread that formats timestamps exists.
void apply_timezone(const std::string& name);

} // namespace framestream
