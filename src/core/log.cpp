#include "core/log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>

namespace theta_core {

namespace {

std::mutex g_log_mutex;

void WriteLine(std::ostream& out, const char* level, std::string_view message) {
  // INFO/WARN/ERROR 共用一把锁，保证跨 worker 的时序可读。
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  out << std::put_time(&tm, "%F %T") << " [" << level << "] " << message
      << '\n';
}

}  // namespace

void LogInfo(std::string_view message) {
  WriteLine(std::cout, "INFO", message);
}

void LogWarn(std::string_view message) {
  WriteLine(std::cerr, "WARN", message);
}

void LogError(std::string_view message) {
  WriteLine(std::cerr, "ERROR", message);
}

}  // namespace theta_core
