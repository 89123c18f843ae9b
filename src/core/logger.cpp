/*
 * HiveMem C++ - Logger Implementation
 */
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>
#include <sys/time.h>
#include <cstring>
#include <unistd.h>
#include <ctime>

namespace hivemem {

namespace {

const char* color_of(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
    }
    return "";
}

// "Status hivemem::MemoryManager::store(const string&, ...)" -> "MemoryManager::store"
std::string short_scope(const char* pretty) {
    std::string sig(pretty);
    size_t paren = sig.find('(');
    if (paren != std::string::npos) sig.erase(paren);
    size_t space = sig.rfind(' ');
    if (space != std::string::npos) sig.erase(0, space + 1);
    while (!sig.empty() && (sig[0] == '*' || sig[0] == '&')) sig.erase(0, 1);

    static const std::string ns = "hivemem::";
    if (sig.compare(0, ns.size(), ns) == 0) sig.erase(0, ns.size());
    static const std::string anon = "{anonymous}::";
    if (sig.compare(0, anon.size(), anon) == 0) sig.erase(0, anon.size());
    return sig;
}

const char* base_name(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , color_(isatty(STDERR_FILENO) != 0)
{
}

void Logger::write(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(level, file, line, func, fmt, args);
    va_end(args);
}

void Logger::vwrite(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    struct timeval tv;
    gettimeofday(&tv, nullptr);
    struct tm t;
    localtime_r(&tv.tv_sec, &t);
    char stamp[32];
    size_t n = strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &t);
    snprintf(stamp + n, sizeof(stamp) - n, ".%03ld", static_cast<long>(tv.tv_usec / 1000));

    bool color = color_.load();
    const char* on = color ? color_of(level) : "";
    const char* off = color ? "\033[0m" : "";

    std::lock_guard<std::mutex> lock(write_mutex_);
    fprintf(stderr, "[%s] %s[%s]%s ", stamp, on, log_level_name(level), off);
    if (this->level() == LogLevel::DEBUG) {
        fprintf(stderr, "(%s %s:%d) ", short_scope(func).c_str(), base_name(file), line);
    }
    vfprintf(stderr, fmt, args);
    fputc('\n', stderr);
    fflush(stderr);
}

} // namespace hivemem
