#pragma once

#include <string>

namespace logkit {

/// Сколько архивов хранится по умолчанию.
constexpr int kDefaultBackupCount = 7;

/**
 * @brief Параметры ротации по времени
 *
 * Файл ротируется при пересечении локальной полуночи; intervalDays > 1
 * растягивает период на несколько суток. После ротации хранится не более
 * backupCount архивов, более старые удаляются.
 */
struct RotationConfig {
  bool enabled = false;
  int intervalDays = 1;
  int backupCount = kDefaultBackupCount;

  RotationConfig() = default;

  static RotationConfig daily(int backupCount = kDefaultBackupCount);

  /// @throw std::invalid_argument При backupCount < 1 или intervalDays < 1
  void validate() const;
};

class IRotatableHandler {
 public:
  virtual void setRotationConfig(const RotationConfig& config) = 0;
  virtual RotationConfig getRotationConfig() const = 0;
  virtual ~IRotatableHandler() = default;
};

}  // namespace logkit
