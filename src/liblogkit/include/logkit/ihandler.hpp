/**
 * @file ihandler.hpp
 * @date October 2026
 * @brief Запись журнала и интерфейс обработчика вывода.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <string>

#include "logkit/loglevel.hpp"

namespace logkit {

struct LogRecord {
  LogLevel level = LogLevel::LOG_INFO;
  std::string message;
  std::chrono::system_clock::time_point timestamp;
  std::string loggerName;
};

enum class HandlerKind { CONSOLE, FILE };

/**
 * @brief Получатель ошибок, возникших при выводе записи
 *
 * context — краткое описание операции, error — исходное исключение.
 */
using HandlerErrorCallback =
    std::function<void(const std::string& context, const std::exception& error)>;

/**
 * @class IHandler
 * @brief Обработчик вывода, подключаемый к Logger
 *
 * @details
 * handle() отбрасывает записи ниже собственного уровня обработчика и
 * вызывает emit(). Исключение из emit() не выходит за пределы handle():
 * оно передаётся в HandlerErrorCallback, по умолчанию — строкой
 * "[LOGGER ERROR] ..." в std::cerr.
 */
class IHandler {
 public:
  virtual ~IHandler() = default;

  virtual HandlerKind kind() const = 0;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  void handle(const LogRecord& record);

  virtual void flush() = 0;

  void setErrorCallback(HandlerErrorCallback callback);

 protected:
  virtual void emit(const LogRecord& record) = 0;
  bool shouldSkipLog(LogLevel level) const;
  void reportError(const std::string& context, const std::exception& error) const;

  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_DEBUG;

 private:
  mutable std::mutex callbackMutex_;
  HandlerErrorCallback errorCallback_;
};

std::string kindToString(HandlerKind kind);

}  // namespace logkit
