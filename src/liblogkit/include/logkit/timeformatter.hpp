/**
 * @file timeformatter.hpp
 * @date October 2026
 * @brief Форматирование меток времени записей журнала.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace logkit {

/**
 * @class TimeFormatter
 * @brief Глобальный (на процесс) формат метки времени.
 *
 * @details
 * Шаблон задаётся в синтаксисе strftime и применяется к локальному
 * времени; к результату всегда добавляются миллисекунды (".mmm").
 * Формат по умолчанию "%Y-%m-%d %H:%M:%S" даёт строки, которые
 * сортируются лексикографически в порядке времени.
 */
class TimeFormatter {
 public:
  static constexpr const char* kDefaultFormat = "%Y-%m-%d %H:%M:%S";

  /**
   * @brief Устанавливает новый шаблон
   * @return false Если шаблон пуст или содержит неизвестную директиву
   */
  static bool setGlobalFormat(const std::string& fmt);
  static std::string getGlobalFormat();
  static void resetGlobalFormat();

  static bool isValidFormat(const std::string& fmt);

  static std::string format(const std::chrono::system_clock::time_point& tp);

  /// Только дата, "%Y-%m-%d", без миллисекунд.
  static std::string formatDate(const std::chrono::system_clock::time_point& tp);

 private:
  static std::string formatWith(const std::string& pattern,
                                const std::chrono::system_clock::time_point& tp);

  inline static std::mutex formatMutex_;
  inline static std::string globalFormat_ = kDefaultFormat;
};

}  // namespace logkit
