/**
 * @file errors.hpp
 * @date October 2026
 * @brief Иерархия исключений библиотеки logkit.
 *
 * @details
 *  - LoggingError      — общий базовый класс
 *  - DirectoryError    — каталог логов нельзя создать или использовать
 *  - InvalidLevelError — нераспознанный уровень логирования
 *  - RotationError     — сбой переименования/удаления/открытия при ротации
 */

#pragma once

#include <stdexcept>
#include <string>

namespace logkit {

class LoggingError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class DirectoryError : public LoggingError {
 public:
  DirectoryError(const std::string& path, const std::string& reason)
      : LoggingError("DirectoryError: cannot use log directory '" + path +
                     "': " + reason),
        path_(path) {}

  const std::string& path() const noexcept { return path_; }

 private:
  std::string path_;
};

class InvalidLevelError : public LoggingError {
 public:
  explicit InvalidLevelError(const std::string& value)
      : LoggingError("InvalidLevelError: unknown log level '" + value + "'"),
        value_(value) {}

  const std::string& value() const noexcept { return value_; }

 private:
  std::string value_;
};

class RotationError : public LoggingError {
 public:
  RotationError(const std::string& file, const std::string& reason)
      : LoggingError("RotationError: " + file + ": " + reason), file_(file) {}

  const std::string& file() const noexcept { return file_; }

 private:
  std::string file_;
};

}  // namespace logkit
