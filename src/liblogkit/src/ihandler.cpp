#include "logkit/ihandler.hpp"

#include <iostream>
#include <utility>

void logkit::IHandler::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

logkit::LogLevel logkit::IHandler::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void logkit::IHandler::handle(const LogRecord& record) {
  if (shouldSkipLog(record.level)) return;

  try {
    emit(record);
  } catch (const std::exception& e) {
    reportError(kindToString(kind()) + " handler failed to write record", e);
  }
}

void logkit::IHandler::setErrorCallback(HandlerErrorCallback callback) {
  std::lock_guard lock(callbackMutex_);
  errorCallback_ = std::move(callback);
}

bool logkit::IHandler::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

void logkit::IHandler::reportError(const std::string& context,
                                   const std::exception& error) const {
  HandlerErrorCallback callback;
  {
    std::lock_guard lock(callbackMutex_);
    callback = errorCallback_;
  }
  if (callback) {
    callback(context, error);
    return;
  }
  std::cerr << "[LOGGER ERROR] " << context << ": " << error.what() << std::endl;
}

std::string logkit::kindToString(HandlerKind kind) {
  switch (kind) {
    case HandlerKind::CONSOLE:
      return "console";
    case HandlerKind::FILE:
      return "file";
    default:
      return "unknown";
  }
}
