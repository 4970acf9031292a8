#include "logkit/basefilehandler.hpp"

#include <utility>

#include "logkit/errors.hpp"

namespace logkit {

BaseFileHandler::BaseFileHandler(std::string path) : logPath_(std::move(path)) {}

BaseFileHandler::~BaseFileHandler() {
  std::lock_guard lock(mutex_);
  closeFile();
}

void BaseFileHandler::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logFile_.is_open()) logFile_.flush();
}

std::string BaseFileHandler::getLogPath() const { return logPath_; }

void BaseFileHandler::openFile() {
  closeFile();
  logFile_.clear();
  logFile_.open(logPath_, std::ios::app);
  if (!logFile_.is_open()) {
    throw LoggingError("Cannot open log file: " + logPath_);
  }
}

void BaseFileHandler::closeFile() {
  if (logFile_.is_open()) {
    logFile_.flush();
    logFile_.close();
  }
}

void BaseFileHandler::writeLine(const std::string& line) {
  if (!logFile_.is_open()) {
    openFile();
  }
  logFile_ << line << '\n';
  logFile_.flush();
  if (!logFile_) {
    throw LoggingError("Write to log file failed: " + logPath_);
  }
}

}  // namespace logkit
