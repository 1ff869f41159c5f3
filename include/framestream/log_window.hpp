#pragma once

#include <cstdint>
#include <fstream>
#include <string>

namespace framestream {

// Groups consecutive log lines into one file per time window.
//
// A window opens on the first append after the previous one closed, named
// after that record's frame time, and is written as
// "<dir>/transferring.<name>" until it is published by a rename to
// "<dir>/<name>". At most one window is open at a time.
class LogWindow {
public:
    struct Config {
        std::string directory;
        double interval = 60.0;       // seconds, >= 1
        std::string extension = ".jsonl";
        std::string header;           // written first in every file when non-empty
    };

    explicit LogWindow(const Config& config);
    ~LogWindow();

    LogWindow(const LogWindow&) = delete;
    LogWindow& operator=(const LogWindow&) = delete;

    // Appends one line, opening a window at `frame_time` if none is open.
    // False when the file cannot be opened or written.
    bool append(const std::string& line, double frame_time);

    // Publishes the open window once `now` is past its deadline. Returns
    // true when a window was closed.
    bool expire(double now);

    // Publishes the open window unconditionally.
    void close();

    bool is_open() const { return open_; }
    double start_time() const { return start_time_; }

    uint64_t published_count() const { return published_count_; }
    uint64_t failed_count() const { return failed_count_; }

private:
    bool open(double frame_time);
    void publish();

    Config config_;
    std::ofstream stream_;
    bool open_{false};
    double start_time_{0.0};
    std::string temp_path_;
    std::string final_path_;
    uint64_t published_count_{0};
    uint64_t failed_count_{0};
};

} // namespace framestream
