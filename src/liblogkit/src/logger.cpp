#include "logkit/logger.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace logkit {

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

LogLevel Logger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

bool Logger::isEnabledFor(LogLevel level) const {
  return static_cast<int>(level) >= static_cast<int>(getLogLevel());
}

void Logger::addHandler(const std::shared_ptr<IHandler>& handler) {
  if (!handler) return;

  std::shared_ptr<IHandler> replaced;
  {
    std::lock_guard lock(handlersMutex_);
    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [&handler](const std::shared_ptr<IHandler>& h) {
                             return h->kind() == handler->kind();
                           });
    if (it != handlers_.end()) {
      replaced = std::move(*it);
      *it = handler;
    } else {
      handlers_.push_back(handler);
    }
  }
  if (replaced) replaced->flush();
}

void Logger::replaceHandlers(
    const std::vector<std::shared_ptr<IHandler>>& handlers) {
  std::vector<std::shared_ptr<IHandler>> next;
  for (const auto& handler : handlers) {
    if (!handler) continue;
    const bool duplicate =
        std::any_of(next.begin(), next.end(),
                    [&handler](const std::shared_ptr<IHandler>& h) {
                      return h->kind() == handler->kind();
                    });
    if (!duplicate) next.push_back(handler);
  }

  std::vector<std::shared_ptr<IHandler>> previous;
  {
    std::lock_guard lock(handlersMutex_);
    previous.swap(handlers_);
    handlers_ = std::move(next);
  }
  for (auto& handler : previous) {
    handler->flush();
  }
}

void Logger::clearHandlers() { replaceHandlers({}); }

std::vector<std::shared_ptr<IHandler>> Logger::handlers() const {
  std::lock_guard lock(handlersMutex_);
  return handlers_;
}

std::size_t Logger::handlerCount(HandlerKind kind) const {
  std::lock_guard lock(handlersMutex_);
  return static_cast<std::size_t>(
      std::count_if(handlers_.begin(), handlers_.end(),
                    [kind](const std::shared_ptr<IHandler>& h) {
                      return h->kind() == kind;
                    }));
}

void Logger::flush() {
  for (auto& handler : handlers()) {
    handler->flush();
  }
}

void Logger::log(LogLevel level, const std::string& message) {
  if (!isEnabledFor(level)) return;

  LogRecord record;
  record.level = level;
  record.message = message;
  record.timestamp = std::chrono::system_clock::now();
  record.loggerName = name_;

  for (auto& handler : handlers()) {
    handler->handle(record);
  }
}

void Logger::debug(const std::string& message) {
  log(LogLevel::LOG_DEBUG, message);
}

void Logger::info(const std::string& message) {
  log(LogLevel::LOG_INFO, message);
}

void Logger::warning(const std::string& message) {
  log(LogLevel::LOG_WARNING, message);
}

void Logger::error(const std::string& message) {
  log(LogLevel::LOG_ERROR, message);
}

void Logger::critical(const std::string& message) {
  log(LogLevel::LOG_CRITICAL, message);
}

}  // namespace logkit
