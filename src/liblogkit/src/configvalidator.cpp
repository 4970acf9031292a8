/**
 * @file configvalidator.cpp
 * @date October 2026
 * @brief Реализация валидатора JSON-конфигурации журналирования
 */
#include "logkit/configvalidator.hpp"

#include <limits>
#include <string>
#include <vector>

using namespace std;

namespace logkit {

bool LoggingConfigValidator::validateRoot(const nlohmann::json &config) const {
  if (!config.is_object()) {
    throw runtime_error("LoggingConfigValidator: Root must be an object");
  }
  if (!config.contains("logging") || !config["logging"].is_object()) {
    throw runtime_error(
        "LoggingConfigValidator: Missing required section: logging");
  }
  return validateLogging(config["logging"]);
}

bool LoggingConfigValidator::validateLogging(
    const nlohmann::json &logging) const {
  const vector<string> string_fields = {"name", "path", "time_format"};
  for (const auto &field : string_fields) {
    if (logging.contains(field) && !logging[field].is_string()) {
      throw runtime_error("LoggingConfigValidator: Field must be a string: " +
                          field);
    }
  }

  const vector<string> bool_fields = {"save", "force_color"};
  for (const auto &field : bool_fields) {
    if (logging.contains(field) && !logging[field].is_boolean()) {
      throw runtime_error("LoggingConfigValidator: Field must be a boolean: " +
                          field);
    }
  }

  if (logging.contains("level") && !logging["level"].is_string() &&
      !logging["level"].is_number_integer()) {
    throw runtime_error(
        "LoggingConfigValidator: Field must be a string or integer: level");
  }

  if (logging.contains("backup_count")) {
    // Значение должно помещаться в int: LoggerConfig::backupCount.
    const auto &count = logging["backup_count"];
    const bool inRange =
        count.is_number_unsigned()
            ? count.get<unsigned long long>() >= 1 &&
                  count.get<unsigned long long>() <=
                      static_cast<unsigned long long>(numeric_limits<int>::max())
            : count.is_number_integer() && count.get<long long>() >= 1 &&
                  count.get<long long>() <= numeric_limits<int>::max();
    if (!inRange) {
      throw runtime_error(
          "LoggingConfigValidator: backup_count must be a positive integer "
          "not greater than " + to_string(numeric_limits<int>::max()));
    }
  }
  return true;
}

}  // namespace logkit
