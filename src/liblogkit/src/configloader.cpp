/**
 * @file configloader.cpp
 * @date October 2026
 * @brief Реализация загрузчика параметров журналирования из JSON
 */

#include "logkit/configloader.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace logkit {

LoggerConfig LoggingConfigLoader::loadFromFile(const std::string &filename) {
  nlohmann::json root = readFileContents(filename);
  LoggerConfig config = fromJson(root);
  lastLoadedFile = filename;
  return config;
}

LoggerConfig LoggingConfigLoader::reload() {
  if (lastLoadedFile.empty()) {
    throw std::runtime_error("LoggingConfigLoader: no file specified for reload");
  }
  return fromJson(readFileContents(lastLoadedFile));
}

LoggerConfig LoggingConfigLoader::loadFromString(const std::string &text) const {
  try {
    return fromJson(nlohmann::json::parse(text));
  } catch (const nlohmann::json::parse_error &e) {
    std::stringstream ss;
    ss << "LoggingConfigLoader: JSON parse error: " << e.what() << " at byte "
       << e.byte;
    throw std::runtime_error(ss.str());
  }
}

LoggerConfig LoggingConfigLoader::fromJson(const nlohmann::json &root) const {
  validator_.validateRoot(root);
  const nlohmann::json &logging = root.at("logging");

  LoggerConfig config;
  config.name = logging.value("name", config.name);
  config.path = logging.value("path", config.path);
  config.save = logging.value("save", config.save);
  config.backupCount = logging.value("backup_count", config.backupCount);

  if (logging.contains("force_color")) {
    config.forceColor = logging["force_color"].get<bool>();
  }
  if (logging.contains("time_format")) {
    config.timeFormat = logging["time_format"].get<std::string>();
  }

  if (logging.contains("level")) {
    const auto &level = logging["level"];
    std::optional<LogLevel> parsed;
    if (level.is_string()) {
      parsed = tryParseLogLevel(level.get<std::string>());
    } else if (const long long numeric = level.get<long long>();
               numeric >= 0 && numeric <= 50) {
      parsed = fromNumericLevel(static_cast<int>(numeric));
    }
    if (parsed) {
      config.level = *parsed;
    } else {
      std::cerr << "[LOGGER WARNING] Unknown log level " << level.dump()
                << " in configuration, defaulting to "
                << levelToString(kDefaultLogLevel) << std::endl;
      config.level = kDefaultLogLevel;
    }
  }
  return config;
}

std::string LoggingConfigLoader::getLastLoadedFile() const {
  return lastLoadedFile;
}

bool LoggingConfigLoader::hasLoadedFile() const { return !lastLoadedFile.empty(); }

nlohmann::json LoggingConfigLoader::readFileContents(
    const std::string &filename) const {
  std::ifstream file(filename);

  if (!file.is_open()) {
    throw std::runtime_error("LoggingConfigLoader: Failed to open file " + filename);
  }

  try {
    nlohmann::json config;
    file >> config;
    return config;
  } catch (const nlohmann::json::parse_error &e) {
    std::stringstream ss;
    ss << "LoggingConfigLoader: JSON parse error: " << e.what() << " at byte "
       << e.byte;
    throw std::runtime_error(ss.str());
  }
}

}  // namespace logkit
