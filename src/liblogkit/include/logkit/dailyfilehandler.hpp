/**
 * @file dailyfilehandler.hpp
 * @date October 2026
 * @brief Файловый обработчик с ротацией в полночь и ограниченным числом архивов.
 *
 * @details
 * Активный файл: <path>. Архивы: <path>.YYYY-MM-DD, где дата — первый
 * день периода, записи которого попали в архив.
 *
 * Алгоритм ротации (при первой записи после nextRollover()):
 *  1. Закрыть активный файл
 *  2. Переименовать его в архив; если архив с тем же именем уже есть,
 *     содержимое дописывается в его конец
 *  3. Открыть новый активный файл
 *  4. Удалить самые старые архивы сверх backupCount; порядок определяется
 *     датой в суффиксе имени, а не временем модификации файла
 *
 * Начало первого периода берётся из времени модификации существующего
 * файла, поэтому файл, оставшийся со вчерашнего дня, ротируется при
 * первой же записи после перезапуска процесса.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "logkit/basefilehandler.hpp"
#include "logkit/irotatablehandler.hpp"

namespace logkit {

class DailyFileHandler : public BaseFileHandler, public IRotatableHandler {
 public:
  using TimePoint = std::chrono::system_clock::time_point;
  /// Источник текущего времени; пустая функция означает system_clock::now.
  using Clock = std::function<TimePoint()>;

  /**
   * @throw std::invalid_argument Некорректная конфигурация ротации
   * @throw LoggingError Файл не удаётся открыть
   */
  explicit DailyFileHandler(const std::string& path,
                            const RotationConfig& config = RotationConfig::daily(),
                            Clock clock = {});

  void setRotationConfig(const RotationConfig& config) override;
  RotationConfig getRotationConfig() const override;

  /**
   * @brief Немедленная ротация независимо от времени
   * @throw RotationError При ошибке переименования, удаления или открытия
   */
  void rotate();

  TimePoint nextRollover() const;

  /// Архивы текущего файла, от самого старого к самому новому.
  std::vector<std::string> archivedFiles() const;

  static std::string archiveNameFor(const std::string& path, TimePoint periodStart);

 protected:
  void emit(const LogRecord& record) override;

 private:
  TimePoint now() const;
  void rotateLocked(TimePoint current);
  void appendToArchive(const std::string& archive);
  void removeExpiredArchives();
  std::vector<std::filesystem::path> listArchives() const;
  TimePoint computeNextRollover(TimePoint periodStart) const;

  RotationConfig rotationConfig_;
  Clock clock_;
  TimePoint periodStart_;
  TimePoint nextRollover_;
};

}  // namespace logkit
