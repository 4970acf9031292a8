/**
 * @file logging_setup.hpp
 * @date October 2026
 * @brief Точка входа настройки журналирования: консоль + файл с ротацией
 *
 * @details
 * configureLogging() собирает готовый к работе именованный логгер:
 *  - создаёт каталог журналов, если его нет;
 *  - устанавливает минимальный уровень логгера;
 *  - снимает ранее подключённые обработчики этого имени;
 *  - подключает консольный обработчик (цвет + очистка сообщений);
 *  - при save == true подключает DailyFileHandler с файлом
 *    <path>/<safeFilename(name)>.log, ротацией в полночь и backupCount
 *    архивами.
 *
 * Повторный вызов с тем же именем безопасен: в логгере остаётся ровно один
 * консольный и не более одного файлового обработчика.
 *
 * @warning Предназначен для вызова при старте процесса, не на горячем пути.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "logkit/colorizer.hpp"
#include "logkit/dailyfilehandler.hpp"
#include "logkit/irotatablehandler.hpp"
#include "logkit/logger.hpp"
#include "logkit/loglevel.hpp"

/**
 * @defgroup Setup Настройка журналирования
 */

namespace logkit {

constexpr const char* kDefaultLoggerName = "logger";
constexpr const char* kDefaultLogDirectory = "logs";

using LoggerHandle = std::shared_ptr<Logger>;

/**
 * @struct LoggerConfig
 * @brief Параметры одного вызова configureLogging()
 * @ingroup Setup
 */
struct LoggerConfig {
  std::string name = kDefaultLoggerName;   ///< Имя логгера (любая строка)
  std::string path = kDefaultLogDirectory; ///< Каталог журналов
  LogLevel level = LogLevel::LOG_DEBUG;    ///< Минимальный уровень
  bool save = false;                       ///< Писать ли в файл
  /// Явное включение/выключение цвета; без значения решает проба терминала.
  std::optional<bool> forceColor;
  int backupCount = kDefaultBackupCount;   ///< Число хранимых архивов
  /// Шаблон метки времени (strftime); без значения формат не меняется.
  std::optional<std::string> timeFormat;
};

/**
 * @struct LoggingOptions
 * @brief Точки подмены внешних зависимостей
 * @ingroup Setup
 *
 * @details
 * Все поля необязательны. По умолчанию консоль — std::cout, проба
 * подбирается по потоку (makeTerminalProbe), время — system_clock.
 */
struct LoggingOptions {
  std::ostream* consoleStream = nullptr;
  std::shared_ptr<const ITerminalProbe> terminalProbe;
  DailyFileHandler::Clock clock;
};

/**
 * @brief Настраивает логгер по LoggerConfig
 * @ingroup Setup
 *
 * @param[in] config  Параметры логгера
 * @param[in] options Подменяемые зависимости
 * @return LoggerHandle Логгер из LoggerRegistry
 *
 * @throw DirectoryError Каталог нельзя создать или путь занят файлом
 * @throw std::invalid_argument backupCount < 1
 * @throw LoggingError Файл журнала не удаётся открыть
 *
 * @details
 * Все обработчики создаются до изменения логгера: при любой ошибке
 * ранее действовавшая конфигурация остаётся нетронутой.
 *
 * @code
 auto log = logkit::configureLogging({"app", "logs", logkit::LogLevel::LOG_INFO, true});
 log->info("service started");
 @endcode
 */
LoggerHandle configureLogging(const LoggerConfig& config,
                              const LoggingOptions& options = {});

/// Позиционная форма; forceColor и backupCount берутся по умолчанию.
LoggerHandle configureLogging(const std::string& name, const std::string& path,
                              LogLevel level, bool save,
                              const LoggingOptions& options = {});

/**
 * @brief Уровень задан строкой ("info", "WARNING", "30", ...)
 * @ingroup Setup
 *
 * Нераспознанное значение заменяется на INFO; после подключения консоли
 * в логгер пишется одно предупреждение с отвергнутым значением.
 */
LoggerHandle configureLogging(const std::string& name, const std::string& path,
                              const std::string& level, bool save,
                              const LoggingOptions& options = {});

/// Уровень задан числом 10/20/30/40/50; иное значение заменяется на INFO.
LoggerHandle configureLogging(const std::string& name, const std::string& path,
                              int level, bool save,
                              const LoggingOptions& options = {});

/**
 * @brief Создаёт каталог (с родителями) и возвращает его абсолютный путь
 * @throw DirectoryError Путь занят не-каталогом или создание не удалось
 */
std::filesystem::path ensureLogDirectory(const std::string& path);

/// <directory>/<safeFilename(name)>.log
std::filesystem::path logFilePath(const std::filesystem::path& directory,
                                  const std::string& name);

}  // namespace logkit
