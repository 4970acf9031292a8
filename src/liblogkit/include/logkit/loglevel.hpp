/**
 * @file loglevel.hpp
 * @date October 2026
 * @brief Уровни важности сообщений и преобразование их из строк и чисел.
 */

#pragma once

#include <optional>
#include <string>

namespace logkit {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/// Уровень, подставляемый вместо нераспознанного значения.
constexpr LogLevel kDefaultLogLevel = LogLevel::LOG_INFO;

std::string levelToString(LogLevel level);

/**
 * @brief Строгий разбор уровня.
 *
 * Принимает имена без учёта регистра ("debug", "INFO", "warn", "fatal")
 * и классические числовые значения 10, 20, 30, 40, 50 в виде строки.
 *
 * @throw InvalidLevelError Если значение не распознано
 */
LogLevel parseLogLevel(const std::string& value);

std::optional<LogLevel> tryParseLogLevel(const std::string& value);

/// Числовые уровни: 10 DEBUG, 20 INFO, 30 WARNING, 40 ERROR, 50 CRITICAL.
std::optional<LogLevel> fromNumericLevel(int value);

// Нестрогие варианты: при ошибке возвращают fallback.
LogLevel toLogLevel(const std::string& value,
                    LogLevel fallback = kDefaultLogLevel);
LogLevel toLogLevel(int value, LogLevel fallback = kDefaultLogLevel);

}  // namespace logkit
