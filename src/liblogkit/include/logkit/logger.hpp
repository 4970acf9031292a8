#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "logkit/ihandler.hpp"

namespace logkit {

/**
 * @class Logger
 * @brief Именованный логгер: минимальный уровень и набор обработчиков
 *
 * @details
 * Набор содержит не более одного обработчика каждого вида (HandlerKind):
 * addHandler() заменяет уже подключённый обработчик того же вида.
 * Записи ниже уровня логгера отбрасываются до обращения к обработчикам.
 * Рассылка идёт по снимку набора, поэтому замена обработчиков во время
 * записи из другого потока безопасна.
 */
class Logger {
 public:
  explicit Logger(std::string name);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  const std::string& name() const { return name_; }

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  bool isEnabledFor(LogLevel level) const;

  void addHandler(const std::shared_ptr<IHandler>& handler);
  /// Атомарно заменяет весь набор; лишние обработчики одного вида отбрасываются.
  void replaceHandlers(const std::vector<std::shared_ptr<IHandler>>& handlers);
  void clearHandlers();

  std::vector<std::shared_ptr<IHandler>> handlers() const;
  std::size_t handlerCount(HandlerKind kind) const;

  void flush();

  void log(LogLevel level, const std::string& message);

  void debug(const std::string& message);
  void info(const std::string& message);
  void warning(const std::string& message);
  void error(const std::string& message);
  void critical(const std::string& message);

 private:
  const std::string name_;
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  mutable std::mutex handlersMutex_;
  std::vector<std::shared_ptr<IHandler>> handlers_;
};

}  // namespace logkit
