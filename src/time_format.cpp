#include "framestream/time_format.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace framestream {

double wall_time_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

bool is_valid_frame_time(double seconds) {
    return std::isfinite(seconds) && std::fabs(seconds) <= kMaxFrameTime;
}

std::string format_timestamp(double seconds) {
    const long long total_ms = std::llround(seconds * 1000.0);
    long long whole = total_ms / 1000;
    long long millis = total_ms % 1000;
    if (millis < 0) {
        millis += 1000;
        whole -= 1;
    }

    const std::time_t t = static_cast<std::time_t>(whole);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    char date[32];
    char zone[8];
    std::strftime(date, sizeof(date), "%Y-%m-%d_%H:%M:%S", &tm_buf);
    std::strftime(zone, sizeof(zone), "%z", &tm_buf);

    char out[64];
    std::snprintf(out, sizeof(out), "%s.%03lld%s", date, millis, zone);
    return out;
}

void apply_timezone(const std::string& name) {
    if (name.empty() || name == "local") {
        return;
    }
    setenv("TZ", name == "utc" ? "UTC" : name.c_str(), 1);
    tzset();
}

} // namespace framestream
