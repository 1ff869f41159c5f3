#include "framestream/log_window.hpp"
#include "framestream/logger.hpp"
#include "framestream/time_format.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace framestream {

LogWindow::LogWindow(const Config& config)
    : config_(config)
{
}

LogWindow::~LogWindow() {
    close();
}

bool LogWindow::open(double frame_time) {
    const std::string name = format_timestamp(frame_time) + config_.extension;
    temp_path_ = config_.directory + "/transferring." + name;
    final_path_ = config_.directory + "/" + name;

    stream_.open(temp_path_, std::ios::out | std::ios::trunc);
    if (!stream_) {
        Logger::warn("Failed to open log file " + temp_path_ + ": " + std::strerror(errno));
        stream_.clear();
        failed_count_++;
        return false;
    }

    open_ = true;
    start_time_ = frame_time;
    if (!config_.header.empty()) {
        stream_ << config_.header << '\n';
    }
    Logger::debug("Opened log window " + temp_path_);
    return true;
}

bool LogWindow::append(const std::string& line, double frame_time) {
    if (!open_ && !open(frame_time)) {
        return false;
    }
    stream_ << line << '\n';
    if (!stream_) {
        Logger::warn("Failed to write log record to " + temp_path_);
        stream_.clear();
        return false;
    }
    return true;
}

bool LogWindow::expire(double now) {
    if (!open_ || now <= start_time_ + config_.interval) {
        return false;
    }
    publish();
    return true;
}

void LogWindow::close() {
    if (open_) {
        publish();
    }
}

void LogWindow::publish() {
    stream_.flush();
    const bool write_ok = static_cast<bool>(stream_);
    stream_.close();
    stream_.clear();
    open_ = false;

    if (!write_ok) {
        Logger::warn("Discarding log window " + temp_path_ + " after a write failure");
        std::remove(temp_path_.c_str());
        failed_count_++;
        return;
    }

    if (std::rename(temp_path_.c_str(), final_path_.c_str()) != 0) {
        Logger::warn("Failed to rename " + temp_path_ + " to " + final_path_ + ": " +
                     std::strerror(errno));
        std::remove(temp_path_.c_str());
        failed_count_++;
        return;
    }

    published_count_++;
    Logger::debug("Published log window " + final_path_);
}

} // namespace framestream
