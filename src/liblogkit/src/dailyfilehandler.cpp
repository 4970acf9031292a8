#include "logkit/dailyfilehandler.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "logkit/errors.hpp"
#include "logkit/logformatter.hpp"
#include "logkit/timeformatter.hpp"

namespace fs = std::filesystem;

namespace logkit {

namespace {

using TimePoint = DailyFileHandler::TimePoint;

// Локальная полночь дня tp, сдвинутая на addDays суток.
TimePoint localMidnight(TimePoint tp, int addDays) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  tm.tm_mday += addDays;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

bool modificationTime(const std::string& path, TimePoint& out) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) return false;
  out = std::chrono::system_clock::from_time_t(st.st_mtime);
  return true;
}

}  // namespace

RotationConfig RotationConfig::daily(int backupCount) {
  RotationConfig config;
  config.enabled = true;
  config.intervalDays = 1;
  config.backupCount = backupCount;
  return config;
}

void RotationConfig::validate() const {
  if (backupCount < 1) {
    throw std::invalid_argument("RotationConfig: backup count must be positive, got " +
                                std::to_string(backupCount));
  }
  if (intervalDays < 1) {
    throw std::invalid_argument("RotationConfig: interval must be at least one day, got " +
                                std::to_string(intervalDays));
  }
}

DailyFileHandler::DailyFileHandler(const std::string& path,
                                   const RotationConfig& config, Clock clock)
    : BaseFileHandler(path), rotationConfig_(config), clock_(std::move(clock)) {
  rotationConfig_.validate();

  TimePoint start = now();
  TimePoint modified;
  if (modificationTime(logPath_, modified)) {
    start = modified;
  }
  periodStart_ = localMidnight(start, 0);
  nextRollover_ = computeNextRollover(periodStart_);

  std::lock_guard lock(mutex_);
  openFile();
}

void DailyFileHandler::setRotationConfig(const RotationConfig& config) {
  config.validate();
  std::lock_guard<std::mutex> lock(mutex_);
  rotationConfig_ = config;
  nextRollover_ = computeNextRollover(periodStart_);
}

RotationConfig DailyFileHandler::getRotationConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rotationConfig_;
}

void DailyFileHandler::rotate() {
  std::lock_guard lock(mutex_);
  rotateLocked(now());
}

DailyFileHandler::TimePoint DailyFileHandler::nextRollover() const {
  std::lock_guard lock(mutex_);
  return nextRollover_;
}

std::vector<std::string> DailyFileHandler::archivedFiles() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> result;
  for (const auto& archive : listArchives()) {
    result.push_back(archive.string());
  }
  return result;
}

std::string DailyFileHandler::archiveNameFor(const std::string& path,
                                             TimePoint periodStart) {
  return path + "." + TimeFormatter::formatDate(periodStart);
}

void DailyFileHandler::emit(const LogRecord& record) {
  const std::string line = LogFormatter::format(record);

  std::lock_guard lock(mutex_);
  if (rotationConfig_.enabled) {
    const TimePoint current = now();
    if (current >= nextRollover_) {
      try {
        rotateLocked(current);
      } catch (const RotationError&) {
        // Запись не теряется: строка уходит в активный файл, ошибка — наверх.
        writeLine(line);
        throw;
      }
    }
  }
  writeLine(line);
}

DailyFileHandler::TimePoint DailyFileHandler::now() const {
  return clock_ ? clock_() : std::chrono::system_clock::now();
}

void DailyFileHandler::rotateLocked(TimePoint current) {
  closeFile();

  const std::string archive = archiveNameFor(logPath_, periodStart_);
  std::error_code ec;

  if (fs::exists(logPath_, ec)) {
    const fs::file_status archiveStatus = fs::symlink_status(archive, ec);
    if (!fs::exists(archiveStatus)) {
      fs::rename(logPath_, archive, ec);
      if (ec) {
        throw RotationError(logPath_, "cannot rename to " + archive + ": " +
                                          ec.message());
      }
    } else if (fs::is_regular_file(archiveStatus)) {
      // Архив за этот день уже есть: дописываем в него, ничего не удаляя.
      appendToArchive(archive);
    } else {
      throw RotationError(logPath_, "archive path is not a regular file: " + archive);
    }
  }

  try {
    openFile();
  } catch (const LoggingError& e) {
    throw RotationError(logPath_, e.what());
  }

  periodStart_ = localMidnight(current, 0);
  nextRollover_ = computeNextRollover(periodStart_);

  removeExpiredArchives();
}

void DailyFileHandler::appendToArchive(const std::string& archive) {
  {
    std::ifstream in(logPath_, std::ios::binary);
    std::ofstream out(archive, std::ios::binary | std::ios::app);
    if (!in.is_open() || !out.is_open()) {
      throw RotationError(logPath_, "cannot append to archive " + archive);
    }
    if (in.peek() != std::ifstream::traits_type::eof()) {
      out << in.rdbuf();
    }
    out.flush();
    if (!out) {
      throw RotationError(logPath_, "write to archive failed: " + archive);
    }
  }

  std::error_code ec;
  fs::remove(logPath_, ec);
  if (ec) {
    throw RotationError(logPath_, "cannot remove rotated file: " + ec.message());
  }
}

void DailyFileHandler::removeExpiredArchives() {
  std::vector<fs::path> archives = listArchives();
  const auto limit = static_cast<std::size_t>(rotationConfig_.backupCount);
  if (archives.size() <= limit) return;

  const std::size_t excess = archives.size() - limit;
  for (std::size_t i = 0; i < excess; ++i) {
    std::error_code ec;
    fs::remove(archives[i], ec);
    if (ec) {
      throw RotationError(logPath_, "cannot delete expired archive " +
                                        archives[i].string() + ": " +
                                        ec.message());
    }
  }
}

std::vector<fs::path> DailyFileHandler::listArchives() const {
  static const std::regex kDateSuffix(R"(^\d{4}-\d{2}-\d{2}$)");

  const fs::path active(logPath_);
  fs::path directory = active.parent_path();
  if (directory.empty()) directory = ".";
  const std::string prefix = active.filename().string() + ".";

  std::vector<fs::path> archives;
  std::error_code ec;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    if (std::regex_match(name.substr(prefix.size()), kDateSuffix)) {
      archives.push_back(it->path());
    }
  }
  if (ec) {
    throw RotationError(logPath_, "cannot list " + directory.string() + ": " +
                                      ec.message());
  }

  std::sort(archives.begin(), archives.end(),
            [](const fs::path& a, const fs::path& b) {
              return a.filename().string() < b.filename().string();
            });
  return archives;
}

DailyFileHandler::TimePoint DailyFileHandler::computeNextRollover(
    TimePoint periodStart) const {
  return localMidnight(periodStart, rotationConfig_.intervalDays);
}

}  // namespace logkit
