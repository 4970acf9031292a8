/**
 * @file colorizer.hpp
 * @date October 2026
 * @brief Цветовая разметка строк консольного вывода по уровню.
 */

#pragma once

#include <cstdio>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "logkit/loglevel.hpp"

#define LOGKIT_ANSI_RESET "\033[0m"
#define LOGKIT_ANSI_RED "\033[31m"
#define LOGKIT_ANSI_GREEN "\033[32m"
#define LOGKIT_ANSI_YELLOW "\033[33m"
#define LOGKIT_ANSI_CYAN "\033[36m"
#define LOGKIT_ANSI_BOLD "\033[1m"

namespace logkit {

/**
 * @class ITerminalProbe
 * @brief Запрос к потоку вывода: поддерживает ли он цветовые ESC-последовательности
 */
class ITerminalProbe {
 public:
  virtual ~ITerminalProbe() = default;
  virtual bool supportsColor() const = 0;
};

/// Интерактивный терминал (isatty) с TERM, отличным от "dumb".
class IsattyTerminalProbe : public ITerminalProbe {
 public:
  explicit IsattyTerminalProbe(std::FILE* stream = stdout) : stream_(stream) {}
  bool supportsColor() const override;

 private:
  std::FILE* stream_;
};

/// Фиксированный ответ; для потоков, не связанных с файловым дескриптором.
class StaticTerminalProbe : public ITerminalProbe {
 public:
  explicit StaticTerminalProbe(bool supported) : supported_(supported) {}
  bool supportsColor() const override { return supported_; }

 private:
  bool supported_;
};

/**
 * @brief Подбирает пробу для потока
 *
 * std::cout и std::clog/std::cerr проверяются через isatty соответствующего
 * дескриптора, любой другой поток считается нецветным.
 */
std::shared_ptr<const ITerminalProbe> makeTerminalProbe(const std::ostream& stream);

/**
 * @class Colorizer
 * @brief Оборачивает строку кодом цвета уровня и кодом сброса
 *
 * @details
 * Таблица цветов: DEBUG — cyan, INFO — green, WARNING — yellow,
 * ERROR — red, CRITICAL — bold red.
 *
 * Решение о цвете принимается один раз в конструкторе. Явно заданный
 * forceColor имеет приоритет над пробой в обе стороны: true включает
 * цвет даже при выводе в файл или канал, false выключает его даже
 * в терминале. Если forceColor не задан, решает проба.
 */
class Colorizer {
 public:
  explicit Colorizer(std::shared_ptr<const ITerminalProbe> probe,
                     std::optional<bool> forceColor = std::nullopt);

  bool enabled() const { return enabled_; }

  std::string colorize(LogLevel level, const std::string& line) const;

  static const char* colorCode(LogLevel level);
  static const char* resetCode() { return LOGKIT_ANSI_RESET; }

 private:
  bool enabled_;
};

}  // namespace logkit
