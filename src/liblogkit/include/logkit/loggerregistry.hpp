#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "logkit/dailyfilehandler.hpp"
#include "logkit/logger.hpp"

namespace logkit {

/**
 * @class LoggerRegistry
 * @brief Процессный реестр "имя -> Logger"
 *
 * Первый запрос имени создаёт логгер, последующие возвращают тот же
 * объект. Логгеры живут до завершения процесса; удаления нет.
 *
 * Кроме того, реестр следит, чтобы на один файл журнала приходился один
 * DailyFileHandler: разные имена логгеров могут дать одно и то же имя
 * файла после safeFilename(), и два независимых обработчика ротировали бы
 * файл друг у друга.
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  LoggerRegistry(const LoggerRegistry&) = delete;
  LoggerRegistry& operator=(const LoggerRegistry&) = delete;

  std::shared_ptr<Logger> getLogger(const std::string& name);
  /// nullptr, если логгер с таким именем ещё не создавался.
  std::shared_ptr<Logger> findLogger(const std::string& name) const;
  bool hasLogger(const std::string& name) const;
  std::vector<std::string> loggerNames() const;

  using FileHandlerFactory = std::function<std::shared_ptr<DailyFileHandler>()>;

  /**
   * @brief Обработчик файла path: уже используемый или созданный через create
   *
   * Реестр держит обработчики через weak_ptr; файл, который больше никем
   * не используется, при следующем запросе открывается заново.
   * @throw Любое исключение create; реестр при этом не меняется.
   */
  std::shared_ptr<DailyFileHandler> acquireFileHandler(const std::string& path,
                                                       const FileHandlerFactory& create);

 private:
  LoggerRegistry() = default;
  ~LoggerRegistry() = default;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::mutex fileHandlersMutex_;
  std::unordered_map<std::string, std::weak_ptr<DailyFileHandler>> fileHandlers_;
};

inline std::shared_ptr<Logger> getLogger(const std::string& name) {
  return LoggerRegistry::instance().getLogger(name);
}

}  // namespace logkit
