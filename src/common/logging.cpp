
#include "logging.hpp"
#include <cctype>
#include <chrono>
#include <ctime>

namespace dasim {

bool parse_log_level(const std::string &s, LogLevel &lvl) {
  std::string v;
  for (char c : s)
    v.push_back((char)std::tolower((unsigned char)c));
  if (v == "trace")
    lvl = LogLevel::TRACE;
  else if (v == "debug")
    lvl = LogLevel::DEBUG;
  else if (v == "info")
    lvl = LogLevel::INFO;
  else if (v == "warn" || v == "warning")
    lvl = LogLevel::WARN;
  else if (v == "error")
    lvl = LogLevel::ERROR;
  else
    return false;
  return true;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }
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
  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::fprintf(stderr, "%s [%s] ", ts, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "\n");
}

} // namespace dasim
