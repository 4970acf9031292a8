/**
 * @file logging_setup.cpp
 * @date October 2026
 * @brief Реализация configureLogging() и вспомогательных функций
 */

#include "logkit/logging_setup.hpp"

#include <iostream>
#include <system_error>
#include <vector>

#include "logkit/consolehandler.hpp"
#include "logkit/errors.hpp"
#include "logkit/loggerregistry.hpp"
#include "logkit/sanitizer.hpp"
#include "logkit/timeformatter.hpp"

namespace fs = std::filesystem;

namespace logkit {

namespace {

// Один ключ на файл, как бы ни был записан путь к каталогу.
std::string fileHandlerKey(const fs::path& file) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(file, ec);
  if (ec) {
    resolved = file.lexically_normal();
  }
  return resolved.string();
}

LoggerHandle configureWithRejectedLevel(const LoggerConfig& config,
                                        const LoggingOptions& options,
                                        const std::optional<std::string>& rejected) {
  LoggerHandle logger = configureLogging(config, options);
  if (rejected) {
    logger->warning("Unknown log level '" + *rejected + "', defaulting to " +
                    levelToString(config.level));
  }
  return logger;
}

}  // namespace

fs::path ensureLogDirectory(const std::string& path) {
  std::error_code ec;
  const fs::path directory = fs::absolute(path.empty() ? fs::path(".") : fs::path(path), ec);
  if (ec) {
    throw DirectoryError(path, ec.message());
  }

  const fs::file_status status = fs::status(directory, ec);
  if (fs::exists(status)) {
    if (!fs::is_directory(status)) {
      throw DirectoryError(path, "path exists and is not a directory");
    }
    return directory;
  }

  fs::create_directories(directory, ec);
  if (ec) {
    throw DirectoryError(path, ec.message());
  }
  return directory;
}

fs::path logFilePath(const fs::path& directory, const std::string& name) {
  return directory / (safeFilename(name) + ".log");
}

LoggerHandle configureLogging(const LoggerConfig& config,
                              const LoggingOptions& options) {
  // 1. Каталог и проверка параметров — до любых изменений логгера.
  const fs::path directory = ensureLogDirectory(config.path);

  const RotationConfig rotation = RotationConfig::daily(config.backupCount);
  rotation.validate();

  // Формат времени общий для процесса: меняется только после успешной подмены.
  const bool applyTimeFormat =
      config.timeFormat && TimeFormatter::isValidFormat(*config.timeFormat);
  if (config.timeFormat && !applyTimeFormat) {
    std::cerr << "[LOGGER WARNING] Invalid time format '" << *config.timeFormat
              << "', keeping '" << TimeFormatter::getGlobalFormat() << "'"
              << std::endl;
  }

  // 2. Новый набор обработчиков.
  std::vector<std::shared_ptr<IHandler>> handlers;

  std::ostream& stream = options.consoleStream ? *options.consoleStream : std::cout;
  handlers.push_back(std::make_shared<ConsoleHandler>(stream, options.terminalProbe,
                                                      config.forceColor));

  if (config.save) {
    const std::string file = fileHandlerKey(logFilePath(directory, config.name));
    auto fileHandler = LoggerRegistry::instance().acquireFileHandler(file, [&]() {
      return std::make_shared<DailyFileHandler>(file, rotation, options.clock);
    });
    fileHandler->setRotationConfig(rotation);
    handlers.push_back(fileHandler);
  }

  // 3. Подмена: старый набор снимается целиком, новый ставится целиком.
  LoggerHandle logger = LoggerRegistry::instance().getLogger(config.name);
  logger->setLogLevel(config.level);
  logger->replaceHandlers(handlers);

  if (applyTimeFormat) {
    TimeFormatter::setGlobalFormat(*config.timeFormat);
  }
  return logger;
}

LoggerHandle configureLogging(const std::string& name, const std::string& path,
                              LogLevel level, bool save,
                              const LoggingOptions& options) {
  LoggerConfig config;
  config.name = name;
  config.path = path;
  config.level = level;
  config.save = save;
  return configureLogging(config, options);
}

LoggerHandle configureLogging(const std::string& name, const std::string& path,
                              const std::string& level, bool save,
                              const LoggingOptions& options) {
  LoggerConfig config;
  config.name = name;
  config.path = path;
  config.save = save;

  std::optional<std::string> rejected;
  if (auto parsed = tryParseLogLevel(level)) {
    config.level = *parsed;
  } else {
    config.level = kDefaultLogLevel;
    rejected = level;
  }
  return configureWithRejectedLevel(config, options, rejected);
}

LoggerHandle configureLogging(const std::string& name, const std::string& path,
                              int level, bool save,
                              const LoggingOptions& options) {
  LoggerConfig config;
  config.name = name;
  config.path = path;
  config.save = save;

  std::optional<std::string> rejected;
  if (auto parsed = fromNumericLevel(level)) {
    config.level = *parsed;
  } else {
    config.level = kDefaultLogLevel;
    rejected = std::to_string(level);
  }
  return configureWithRejectedLevel(config, options, rejected);
}

}  // namespace logkit
