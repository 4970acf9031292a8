#pragma once

#include <string>

#include "logkit/ihandler.hpp"

namespace logkit {

/**
 * @class LogFormatter
 * @brief Строка вида "<timestamp> [<LEVEL>] <logger>: <message>"
 *
 * Сообщение проходит через sanitizeMessage(); цвет сюда не входит,
 * его добавляет только консольный обработчик.
 */
class LogFormatter {
 public:
  static std::string format(const LogRecord& record);
};

}  // namespace logkit
