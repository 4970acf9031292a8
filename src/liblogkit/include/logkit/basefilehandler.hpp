#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "logkit/ihandler.hpp"

namespace logkit {

/**
 * @class BaseFileHandler
 * @brief Общая часть файловых обработчиков: путь, поток, дозапись строк
 *
 * Файл всегда содержит простой текст без цветовых кодов.
 */
class BaseFileHandler : public IHandler {
 public:
  HandlerKind kind() const override { return HandlerKind::FILE; }
  void flush() override;

  std::string getLogPath() const;

 protected:
  explicit BaseFileHandler(std::string path);
  ~BaseFileHandler() override;

  // Методы ниже вызываются под mutex_.
  /// @throw LoggingError Если файл не удаётся открыть на дозапись
  void openFile();
  void closeFile();
  void writeLine(const std::string& line);

  mutable std::mutex mutex_;
  std::ofstream logFile_;
  const std::string logPath_;
};

}  // namespace logkit
