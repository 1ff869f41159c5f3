#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace framestream {

// Line-oriented logger shared by the subscriber and render threads.
// Every call writes one complete line under a single mutex so output from
// concurrent threads never interleaves.
//
// info  -> stdout
// debug -> stdout, only when FRAMESTREAM_DEBUG is set in the environment
// warn  -> stderr
// error -> stderr
class Logger {
public:
    static void info(const std::string& line);
    static void debug(const std::string& line);
    static void warn(const std::string& line);
    static void error(const std::string& line);

    // Test hook: receives every warn() and error() line. nullptr clears it.
    static void set_error_sink(std::function<void(const std::string&)> sink);

private:
    static std::mutex mutex_;
    static std::function<void(const std::string&)> error_sink_;
};

} // namespace framestream
