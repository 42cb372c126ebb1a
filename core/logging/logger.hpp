#pragma once

#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace modewarden {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

/**
 * Process-wide leveled logger.
 *
 * Lines go to stderr unless a sink is installed. Debug lines carry the
 * source file and line; every line carries the instance label when set.
 */
class Logger {
public:
    // Receives fully formatted lines (no trailing newline)
    using Sink = std::function<void(Level level, const std::string &line)>;

    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    static void set_instance(const std::string &name);

    // nullptr restores stderr
    static void set_sink(Sink sink);

private:
    static std::string format(Level level, const char *file, int line, const std::string &message);

    static Level threshold_;
    static std::string instance_;
    static Sink sink_;
    static std::mutex mutex_;
};

Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace modewarden

#define LOG_INTERNAL(level, msg)                                               \
    do {                                                                       \
        std::stringstream ss;                                                  \
        ss << msg;                                                             \
        modewarden::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(modewarden::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(modewarden::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(modewarden::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(modewarden::logging::Level::LVL_ERROR, msg)
