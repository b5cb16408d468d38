#include "logging.hpp"
#include <chrono>
#include <ctime>

namespace photolink {

bool parse_log_level(const std::string &s, LogLevel &out) {
  if (s == "trace")
    out = LogLevel::TRACE;
  else if (s == "debug")
    out = LogLevel::DEBUG;
  else if (s == "info")
    out = LogLevel::INFO;
  else if (s == "warn")
    out = LogLevel::WARN;
  else if (s == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

Logger::~Logger() {
  if (file_)
    std::fclose(file_);
}

void Logger::set_level(LogLevel lvl) { level_ = lvl; }

bool Logger::set_file(const std::string &path) {
  std::FILE *f = std::fopen(path.c_str(), "a");
  if (!f)
    return false;
  std::lock_guard<std::mutex> lk(mtx_);
  if (file_)
    std::fclose(file_);
  file_ = f;
  return true;
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl < level_)
    return;
  char line[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(line, sizeof(line), fmt, ap);
  va_end(ap);

  using namespace std::chrono;
  auto t = system_clock::to_time_t(system_clock::now());
  std::tm tm{};
  localtime_r(&t, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

  std::lock_guard<std::mutex> lk(mtx_);
  std::fprintf(stderr, "%s [%s] %s\n", ts, level_str(lvl), line);
  if (file_) {
    std::fprintf(file_, "%s [%s] %s\n", ts, level_str(lvl), line);
    std::fflush(file_);
  }
}

} // namespace photolink
