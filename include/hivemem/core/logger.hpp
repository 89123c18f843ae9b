/*
 * HiveMem C++ - Logger
 *
 * Timestamped stderr logging shared by the engine and its timer threads.
 * stdout carries the request/response protocol, so nothing logs there.
 */
#ifndef hivemem_CORE_LOGGER_HPP
#define hivemem_CORE_LOGGER_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace hivemem {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive), INFO otherwise
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(static_cast<int>(level)); }
    LogLevel level() const { return static_cast<LogLevel>(level_.load()); }
    bool enabled(LogLevel level) const { return static_cast<int>(level) >= level_.load(); }

    // ANSI colors; on by default only when stderr is a terminal
    void set_color(bool on) { color_.store(on); }

    void write(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void vwrite(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    std::atomic<int> level_;
    std::atomic<bool> color_;
    std::mutex write_mutex_;
};

#define HIVEMEM_LOG(lvl, ...)                                                                   \
    do {                                                                                        \
        if (hivemem::Logger::instance().enabled(lvl))                                           \
            hivemem::Logger::instance().write(lvl, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...) HIVEMEM_LOG(hivemem::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  HIVEMEM_LOG(hivemem::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  HIVEMEM_LOG(hivemem::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) HIVEMEM_LOG(hivemem::LogLevel::ERROR, __VA_ARGS__)

} // namespace hivemem

#endif // hivemem_CORE_LOGGER_HPP
