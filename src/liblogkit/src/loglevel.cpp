#include "logkit/loglevel.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_map>

#include "logkit/errors.hpp"

namespace logkit {

namespace {

const std::unordered_map<std::string, LogLevel> LOG_LEVELS = {
    {"debug", LogLevel::LOG_DEBUG},       {"info", LogLevel::LOG_INFO},
    {"warning", LogLevel::LOG_WARNING},   {"warn", LogLevel::LOG_WARNING},
    {"error", LogLevel::LOG_ERROR},       {"critical", LogLevel::LOG_CRITICAL},
    {"fatal", LogLevel::LOG_CRITICAL}};

std::string trimAndLower(const std::string& value) {
  auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  std::string result;
  if (first < last) {
    std::transform(first, last, std::back_inserter(result),
                   [](unsigned char c) { return std::tolower(c); });
  }
  return result;
}

bool isNumber(const std::string& value) {
  return !value.empty() && value.size() <= 4 &&
         std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c); });
}

}  // namespace

std::string levelToString(LogLevel level) {
  std::string level_;
  switch (level) {
    case LogLevel::LOG_DEBUG:
      level_ = "DEBUG";
      break;
    case LogLevel::LOG_INFO:
      level_ = "INFO";
      break;
    case LogLevel::LOG_WARNING:
      level_ = "WARNING";
      break;
    case LogLevel::LOG_ERROR:
      level_ = "ERROR";
      break;
    case LogLevel::LOG_CRITICAL:
      level_ = "CRITICAL";
      break;
    default:
      break;
  }
  return level_;
}

std::optional<LogLevel> fromNumericLevel(int value) {
  switch (value) {
    case 10:
      return LogLevel::LOG_DEBUG;
    case 20:
      return LogLevel::LOG_INFO;
    case 30:
      return LogLevel::LOG_WARNING;
    case 40:
      return LogLevel::LOG_ERROR;
    case 50:
      return LogLevel::LOG_CRITICAL;
    default:
      return std::nullopt;
  }
}

std::optional<LogLevel> tryParseLogLevel(const std::string& value) {
  const std::string key = trimAndLower(value);
  if (isNumber(key)) {
    return fromNumericLevel(std::stoi(key));
  }
  if (auto it = LOG_LEVELS.find(key); it != LOG_LEVELS.end()) {
    return it->second;
  }
  return std::nullopt;
}

LogLevel parseLogLevel(const std::string& value) {
  if (auto level = tryParseLogLevel(value)) {
    return *level;
  }
  throw InvalidLevelError(value);
}

LogLevel toLogLevel(const std::string& value, LogLevel fallback) {
  return tryParseLogLevel(value).value_or(fallback);
}

LogLevel toLogLevel(int value, LogLevel fallback) {
  return fromNumericLevel(value).value_or(fallback);
}

}  // namespace logkit
