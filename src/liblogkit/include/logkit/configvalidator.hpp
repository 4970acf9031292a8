/**
 * @file configvalidator.hpp
 * @date October 2026
 * @brief Проверка структуры JSON-конфигурации журналирования
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace logkit {

/**
 * @class LoggingConfigValidator
 * @brief Проверяет секцию "logging" до построения LoggerConfig
 *
 * @details
 * Требования:
 *  - корень — объект с секцией "logging" типа object;
 *  - name, path, level, time_format — строки;
 *  - level может быть и числом (10..50);
 *  - save, force_color — bool;
 *  - backup_count — целое больше нуля.
 * Отсутствующие поля допустимы. Значение level не проверяется на
 * допустимость: нераспознанный уровень заменяется значением по умолчанию.
 *
 * @throw std::runtime_error С префиксом "LoggingConfigValidator:"
 */
class LoggingConfigValidator {
 public:
  bool validateRoot(const nlohmann::json& config) const;
  bool validateLogging(const nlohmann::json& logging) const;
};

}  // namespace logkit
