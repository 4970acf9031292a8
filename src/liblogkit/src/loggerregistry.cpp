#include "logkit/loggerregistry.hpp"

#include <algorithm>

namespace logkit {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

std::shared_ptr<Logger> LoggerRegistry::getLogger(const std::string& name) {
  std::lock_guard lock(mutex_);
  auto& slot = loggers_[name];
  if (!slot) {
    slot = std::make_shared<Logger>(name);
  }
  return slot;
}

std::shared_ptr<Logger> LoggerRegistry::findLogger(const std::string& name) const {
  std::lock_guard lock(mutex_);
  if (auto it = loggers_.find(name); it != loggers_.end()) {
    return it->second;
  }
  return nullptr;
}

bool LoggerRegistry::hasLogger(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return loggers_.count(name) != 0;
}

std::vector<std::string> LoggerRegistry::loggerNames() const {
  std::vector<std::string> names;
  {
    std::lock_guard lock(mutex_);
    names.reserve(loggers_.size());
    for (const auto& [name, logger] : loggers_) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::shared_ptr<DailyFileHandler> LoggerRegistry::acquireFileHandler(
    const std::string& path, const FileHandlerFactory& create) {
  std::lock_guard lock(fileHandlersMutex_);
  if (auto it = fileHandlers_.find(path); it != fileHandlers_.end()) {
    if (auto existing = it->second.lock()) {
      return existing;
    }
  }
  std::shared_ptr<DailyFileHandler> handler = create();
  fileHandlers_[path] = handler;
  return handler;
}

}  // namespace logkit
