#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <utility>

namespace modewarden {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::string Logger::instance_;
Logger::Sink Logger::sink_;
std::mutex Logger::mutex_;

namespace {

const char *base_name(const char *path) {
    const char *slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

}  // namespace

void Logger::init(Level threshold) { set_level(threshold); }

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

Level Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void Logger::set_instance(const std::string &name) {
    std::lock_guard<std::mutex> lock(mutex_);
    instance_ = name;
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

std::string Logger::format(Level level, const char *file, int line, const std::string &message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream out;
    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
        << ms.count() << "] [" << level_to_string(level) << "]";
    if (!instance_.empty()) {
        out << " (" << instance_ << ")";
    }
    if (level == Level::LVL_DEBUG && file) {
        out << " " << base_name(file) << ":" << line;
    }
    out << " " << message;
    return out.str();
}

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    Sink sink;
    std::string formatted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < threshold_) {
            return;
        }
        formatted = format(level, file, line, message);
        if (!sink_) {
            std::cerr << formatted << "\n";
            if (level >= Level::LVL_ERROR) {
                std::cerr << std::flush;
            }
            return;
        }
        sink = sink_;
    }

    // Sink runs unlocked so it may log or swap itself out
    sink(level, formatted);
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);

    if (s == "debug") return Level::LVL_DEBUG;
    if (s == "info") return Level::LVL_INFO;
    if (s == "warn") return Level::LVL_WARN;
    if (s == "error") return Level::LVL_ERROR;
    if (s == "none") return Level::LVL_NONE;

    return Level::LVL_INFO;
}

const char *level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "DEBUG";
        case Level::LVL_INFO:
            return "INFO";
        case Level::LVL_WARN:
            return "WARN";
        case Level::LVL_ERROR:
            return "ERROR";
        default:
            return "NONE";
    }
}

}  // namespace logging
}  // namespace modewarden
