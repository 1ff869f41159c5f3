#include "framestream/logger.hpp"

#include <cstdlib>
#include <iostream>

namespace framestream {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::error_sink_;

void Logger::set_error_sink(std::function<void(const std::string&)> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_sink_ = std::move(sink);
}

void Logger::info(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << line << std::endl;
}

void Logger::debug(const std::string& line) {
    static const bool enabled = std::getenv("FRAMESTREAM_DEBUG") != nullptr;
    if (!enabled) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[debug] " << line << std::endl;
}

void Logger::warn(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (error_sink_) {
        error_sink_(line);
    }
    std::cerr << "[warn] " << line << std::endl;
}

void Logger::error(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (error_sink_) {
        error_sink_(line);
    }
    std::cerr << "[error] " << line << std::endl;
}

} // namespace framestream
