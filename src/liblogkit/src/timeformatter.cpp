#include "logkit/timeformatter.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logkit {

namespace {

// Директивы strftime, допустимые после '%'.
constexpr const char* kDirectives = "aAbBcCdDeFgGhHIjmMnprRStTuUVwWxXyYzZ%";

std::tm toLocalTm(const std::chrono::system_clock::time_point& tp) {
  auto now_time = std::chrono::system_clock::to_time_t(tp);
  std::tm now_tm{};
#ifdef _WIN32
  localtime_s(&now_tm, &now_time);
#else
  localtime_r(&now_time, &now_tm);
#endif
  return now_tm;
}

}  // namespace

bool TimeFormatter::isValidFormat(const std::string& fmt) {
  if (fmt.empty()) return false;
  const std::string directives = kDirectives;
  for (std::size_t i = 0; i < fmt.size(); ++i) {
    if (fmt[i] != '%') continue;
    if (i + 1 == fmt.size() || directives.find(fmt[i + 1]) == std::string::npos) {
      return false;
    }
    ++i;
  }
  return true;
}

bool TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (!isValidFormat(fmt)) {
    std::cerr << "[LOGGER WARNING] Invalid time format rejected: '" << fmt
              << "'" << std::endl;
    return false;
  }
  std::lock_guard lock(formatMutex_);
  globalFormat_ = fmt;
  return true;
}

std::string TimeFormatter::getGlobalFormat() {
  std::lock_guard lock(formatMutex_);
  return globalFormat_;
}

void TimeFormatter::resetGlobalFormat() {
  std::lock_guard lock(formatMutex_);
  globalFormat_ = kDefaultFormat;
}

std::string TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()) %
                  1000;
  std::ostringstream oss;
  oss << formatWith(getGlobalFormat(), tp) << '.' << std::setw(3)
      << std::setfill('0') << (ms.count() < 0 ? ms.count() + 1000 : ms.count());
  return oss.str();
}

std::string TimeFormatter::formatDate(
    const std::chrono::system_clock::time_point& tp) {
  return formatWith("%Y-%m-%d", tp);
}

std::string TimeFormatter::formatWith(
    const std::string& pattern,
    const std::chrono::system_clock::time_point& tp) {
  const std::tm now_tm = toLocalTm(tp);
  std::ostringstream oss;
  oss << std::put_time(&now_tm, pattern.c_str());
  return oss.str();
}

}  // namespace logkit
