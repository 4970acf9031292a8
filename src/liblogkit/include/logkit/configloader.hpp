/**
 * @file configloader.hpp
 * @date October 2026
 * @brief Загрузка параметров журналирования из JSON-файла
 *
 * @details
 * Формат файла:
 * @code
 {
   "logging": {
     "name": "app",
     "path": "logs",
     "level": "info",
     "save": true,
     "force_color": false,
     "backup_count": 7,
     "time_format": "%Y-%m-%d %H:%M:%S"
   }
 }
 @endcode
 * Отсутствующие поля получают значения по умолчанию из LoggerConfig.
 *
 * @see LoggingConfigValidator, configureLogging
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "logkit/configvalidator.hpp"
#include "logkit/logging_setup.hpp"

namespace logkit {

/**
 * @class LoggingConfigLoader
 * @brief Читает, проверяет и преобразует JSON в LoggerConfig
 *
 * @note Не потокобезопасен: хранит путь последнего загруженного файла.
 */
class LoggingConfigLoader {
 public:
  LoggingConfigLoader() = default;
  ~LoggingConfigLoader() = default;

  /**
   * @brief Загружает конфигурацию из файла и запоминает путь
   * @param[in] filename Путь к JSON-файлу
   * @throw std::runtime_error Ошибка открытия, разбора или валидации
   */
  LoggerConfig loadFromFile(const std::string &filename);

  /**
   * @brief Повторно читает последний загруженный файл
   * @throw std::runtime_error Если файл ещё не загружался
   */
  LoggerConfig reload();

  LoggerConfig loadFromString(const std::string &text) const;

  /**
   * @brief Преобразует уже разобранный JSON
   *
   * Нераспознанный уровень заменяется на INFO с предупреждением
   * "[LOGGER WARNING]" в std::cerr: логгер к этому моменту ещё не настроен.
   */
  LoggerConfig fromJson(const nlohmann::json &root) const;

  std::string getLastLoadedFile() const;
  bool hasLoadedFile() const;

 private:
  nlohmann::json readFileContents(const std::string &filename) const;

  LoggingConfigValidator validator_;
  std::string lastLoadedFile;
};

}  // namespace logkit
