#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace photolink {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    // Mirrors every line to `path` (append). Returns false if it cannot be opened.
    bool set_file(const std::string& path);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    ~Logger();
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    std::FILE* file_ = nullptr;
    const char* level_str(LogLevel lvl);
};

} // namespace photolink
